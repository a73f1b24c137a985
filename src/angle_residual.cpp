#include "angle_residual.hpp"
#include "discrete_simulator.hpp"
#include "estimation_errors.hpp"
#include <stdexcept>
#include <string>

namespace pendulum_sysid {

AngleResidualFunctor::AngleResidualFunctor(double gravity,
                                           double sample_time,
                                           int step_count,
                                           const StateVector &initial_state,
                                           const std::vector<double> &observed_angles)
  : gravity_(gravity)
  , sample_time_(sample_time)
  , step_count_(step_count)
  , initial_state_(initial_state)
  , observed_angles_(observed_angles) {
    if (step_count_ < 1) { throw std::invalid_argument("Step count must be at least 1."); }
    if (observed_angles_.size() != static_cast<size_t>(step_count_)) {
        throw std::invalid_argument("Observed angle count (" + std::to_string(observed_angles_.size()) +
                                    ") must match step count (" + std::to_string(step_count_) + ").");
    }
}

bool
AngleResidualFunctor::operator()(double const *const *parameters, double *residuals) const {
    const double *p = parameters[0];
    Trajectory trajectory;
    try {
        trajectory = simulate(gravity_, p[0], p[1], p[2], sample_time_, step_count_, initial_state_);
    } catch (const InvalidParameterError &) {
        return false; // Ceres retries with a shorter step.
    }

    for (int k = 0; k < step_count_; ++k) { residuals[k] = trajectory.states(0, k) - observed_angles_[k]; }
    return true;
}

} // namespace pendulum_sysid
