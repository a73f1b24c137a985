#ifndef PARAMETER_ESTIMATOR_HPP
#define PARAMETER_ESTIMATOR_HPP

#include "angle_observations.hpp"
#include "nelder_mead.hpp"
#include "pendulum_model.hpp"

#include <array>
#include <vector>

namespace pendulum_sysid {

/**
 * @brief Settings for estimate().
 */
struct EstimatorOptions {
    NelderMeadOptions search;

    // Follow the simplex search with a Ceres least-squares polish.
    bool refine_with_least_squares = false;
    int refinement_max_iterations = 100;

    bool verbose = false;
};

/**
 * @brief Result of a fit. Immutable once returned.
 */
struct FittedParameters {
    double radius = 0.0;
    double mass = 0.0;
    double damping = 0.0;
    double sum_squared_error = 0.0;         ///< Objective at the returned point.
    double initial_sum_squared_error = 0.0; ///< Objective at the initial guess (may be +inf).

    int iterations = 0;
    int function_evaluations = 0;
    bool converged = false; ///< Simplex met its tolerances before the budget ran out.
    bool refined = false;   ///< The least-squares polish improved the point.

    std::array<double, 3> as_array() const { return { radius, mass, damping }; }
    PendulumParameters as_parameters(double gravity) const;

    // The model only sees these two combinations.
    double natural_frequency_squared(double gravity) const { return gravity / radius; }
    double damping_rate() const { return damping / mass; }
};

/**
 * @brief Sum over k of (simulated_angle_k - observed_angle_k)^2; the angular
 * velocity row of the trajectory does not enter.
 *
 * @param parameters [radius, mass, damping]
 * @throws InvalidParameterError for unusable parameters.
 * @throws std::invalid_argument if observed_angles.size() != step_count.
 */
double
angle_sum_squared_error(const std::array<double, 3> &parameters,
                        double gravity,
                        double sample_time,
                        int step_count,
                        const StateVector &initial_state,
                        const std::vector<double> &observed_angles);

/**
 * @brief Fits radius, mass and damping to an observed angle series with a
 * Nelder-Mead search started at initial_guess.
 *
 * Candidates the model rejects (zero radius or mass) and non-finite objective
 * values count as +infinity. A search that runs out of budget still returns
 * its best point with converged == false.
 *
 * @throws InvalidParameterError for non-finite gravity or an invalid sample time.
 * @throws std::invalid_argument if observed_angles.size() != step_count or step_count < 1.
 * @throws NonFiniteObjectiveError if no candidate produced a finite objective.
 */
FittedParameters
estimate(const std::array<double, 3> &initial_guess,
         double gravity,
         double sample_time,
         int step_count,
         const StateVector &initial_state,
         const std::vector<double> &observed_angles,
         const EstimatorOptions &options = EstimatorOptions());

/**
 * @brief Fits to a measured series: sample time is the mean spacing, the initial
 * state is [theta_0, finite-difference rate], every sample enters the objective.
 *
 * gravity is taken from initial_guess.gravity.
 */
FittedParameters
estimate(const PendulumParameters &initial_guess,
         const AngleObservations &observations,
         const EstimatorOptions &options = EstimatorOptions());

} // namespace pendulum_sysid

#endif // PARAMETER_ESTIMATOR_HPP
