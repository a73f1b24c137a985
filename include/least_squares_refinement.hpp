#ifndef LEAST_SQUARES_REFINEMENT_HPP
#define LEAST_SQUARES_REFINEMENT_HPP

#include "pendulum_model.hpp"
#include <array>
#include <string>
#include <vector>

namespace pendulum_sysid {

struct RefinementSummary {
    bool usable = false;        ///< ceres::Solver::Summary::IsSolutionUsable()
    int iterations = 0;
    double initial_cost = 0.0;  ///< Ceres cost, 0.5 * sum of squared residuals.
    double final_cost = 0.0;
    std::string brief_report;
};

/**
 * @brief Polishes [radius, mass, damping] in place with a Ceres Levenberg-Marquardt solve
 * over the per-sample angle residuals (central numeric differences).
 *
 * The parameters are only updated when Ceres reports a usable solution.
 * Because mass and damping only enter through their ratio the Jacobian has rank 2;
 * the trust region keeps the step bounded along the flat direction.
 *
 * @throws std::invalid_argument if observed_angles.size() != step_count.
 */
RefinementSummary
refine_least_squares(std::array<double, 3> &parameters,
                     double gravity,
                     double sample_time,
                     int step_count,
                     const StateVector &initial_state,
                     const std::vector<double> &observed_angles,
                     int max_iterations = 100,
                     bool progress_to_stdout = false);

} // namespace pendulum_sysid

#endif // LEAST_SQUARES_REFINEMENT_HPP
