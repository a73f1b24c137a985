#include "parameter_estimator.hpp"
#include "discrete_simulator.hpp"
#include "estimation_errors.hpp"
#include "least_squares_refinement.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

namespace pendulum_sysid {

namespace {

void
validate_fit_inputs(double gravity, double sample_time, int step_count, const std::vector<double> &observed_angles) {
    if (!std::isfinite(gravity)) { throw InvalidParameterError("Gravity must be finite."); }
    validate_sample_time(sample_time);
    if (step_count < 1) {
        throw std::invalid_argument("Step count must be at least 1, got " + std::to_string(step_count) + ".");
    }
    if (observed_angles.size() != static_cast<size_t>(step_count)) {
        throw std::invalid_argument("Observed angle count (" + std::to_string(observed_angles.size()) +
                                    ") must match step count (" + std::to_string(step_count) + ").");
    }
}

// Objective as seen by the search: rejected candidates are +inf instead of an exception.
double
search_objective(const std::array<double, 3> &parameters,
                 double gravity,
                 double sample_time,
                 int step_count,
                 const StateVector &initial_state,
                 const std::vector<double> &observed_angles) {
    try {
        return angle_sum_squared_error(parameters, gravity, sample_time, step_count, initial_state, observed_angles);
    } catch (const InvalidParameterError &) {
        return std::numeric_limits<double>::infinity();
    }
}

} // namespace

PendulumParameters
FittedParameters::as_parameters(double gravity) const {
    PendulumParameters params;
    params.gravity = gravity;
    params.radius = radius;
    params.mass = mass;
    params.damping = damping;
    return params;
}

double
angle_sum_squared_error(const std::array<double, 3> &parameters,
                        double gravity,
                        double sample_time,
                        int step_count,
                        const StateVector &initial_state,
                        const std::vector<double> &observed_angles) {
    if (observed_angles.size() != static_cast<size_t>(step_count)) {
        throw std::invalid_argument("Observed angle count (" + std::to_string(observed_angles.size()) +
                                    ") must match step count (" + std::to_string(step_count) + ").");
    }
    Trajectory trajectory =
      simulate(gravity, parameters[0], parameters[1], parameters[2], sample_time, step_count, initial_state);

    double sse = 0.0;
    for (int k = 0; k < step_count; ++k) {
        double residual = trajectory.states(0, k) - observed_angles[k];
        sse += residual * residual;
    }
    return sse;
}

FittedParameters
estimate(const std::array<double, 3> &initial_guess,
         double gravity,
         double sample_time,
         int step_count,
         const StateVector &initial_state,
         const std::vector<double> &observed_angles,
         const EstimatorOptions &options) {
    validate_fit_inputs(gravity, sample_time, step_count, observed_angles);

    ScalarObjective objective = [&](const Eigen::VectorXd &x) {
        return search_objective(
          { x(0), x(1), x(2) }, gravity, sample_time, step_count, initial_state, observed_angles);
    };

    FittedParameters fitted;
    fitted.initial_sum_squared_error =
      search_objective(initial_guess, gravity, sample_time, step_count, initial_state, observed_angles);

    if (options.verbose) {
        std::cout << "[ParameterEstimator] Initial guess: radius=" << initial_guess[0] << ", mass=" << initial_guess[1]
                  << ", damping=" << initial_guess[2] << std::endl;
        std::cout << "[ParameterEstimator] Initial squared error: " << fitted.initial_sum_squared_error << std::endl;
    }

    Eigen::VectorXd x0(3);
    x0 << initial_guess[0], initial_guess[1], initial_guess[2];
    NelderMeadResult search = minimize_nelder_mead(objective, x0, options.search);

    fitted.radius = search.x(0);
    fitted.mass = search.x(1);
    fitted.damping = search.x(2);
    fitted.sum_squared_error = search.f;
    fitted.iterations = search.iterations;
    fitted.function_evaluations = search.function_evaluations;
    fitted.converged = search.converged;

    if (options.verbose) { std::cout << "[ParameterEstimator] " << search.message << std::endl; }

    if (options.refine_with_least_squares) {
        std::array<double, 3> polished = fitted.as_array();
        RefinementSummary summary = refine_least_squares(polished,
                                                         gravity,
                                                         sample_time,
                                                         step_count,
                                                         initial_state,
                                                         observed_angles,
                                                         options.refinement_max_iterations,
                                                         options.verbose);
        if (summary.usable) {
            double polished_sse =
              search_objective(polished, gravity, sample_time, step_count, initial_state, observed_angles);
            if (polished_sse < fitted.sum_squared_error) {
                fitted.radius = polished[0];
                fitted.mass = polished[1];
                fitted.damping = polished[2];
                fitted.sum_squared_error = polished_sse;
                fitted.refined = true;
            }
        }
        if (options.verbose) {
            std::cout << "[ParameterEstimator] Least-squares refinement: " << summary.brief_report
                      << (fitted.refined ? " (accepted)" : " (kept simplex result)") << std::endl;
        }
    }

    if (options.verbose) {
        std::cout << "[ParameterEstimator] Optimal parameters: radius=" << fitted.radius << ", mass=" << fitted.mass
                  << ", damping=" << fitted.damping << std::endl;
        std::cout << "[ParameterEstimator] Optimal squared error: " << fitted.sum_squared_error << std::endl;
    }
    return fitted;
}

FittedParameters
estimate(const PendulumParameters &initial_guess, const AngleObservations &observations, const EstimatorOptions &options) {
    observations.validate();
    double ts = sample_interval(observations.times);
    StateVector x0;
    x0 << observations.angles[0], (observations.angles[1] - observations.angles[0]) / ts;
    return estimate({ initial_guess.radius, initial_guess.mass, initial_guess.damping },
                    initial_guess.gravity,
                    ts,
                    static_cast<int>(observations.size()),
                    x0,
                    observations.angles,
                    options);
}

} // namespace pendulum_sysid
