#include "discrete_simulator.hpp"
#include <stdexcept>
#include <string>

namespace pendulum_sysid {

std::vector<double>
Trajectory::angles() const {
    std::vector<double> out(static_cast<size_t>(states.cols()));
    for (Eigen::Index k = 0; k < states.cols(); ++k) { out[k] = states(0, k); }
    return out;
}

std::vector<double>
Trajectory::angular_velocities() const {
    std::vector<double> out(static_cast<size_t>(states.cols()));
    for (Eigen::Index k = 0; k < states.cols(); ++k) { out[k] = states(1, k); }
    return out;
}

std::vector<double>
Trajectory::times() const {
    std::vector<double> out(static_cast<size_t>(states.cols()));
    for (Eigen::Index k = 0; k < states.cols(); ++k) { out[k] = static_cast<double>(k) * sample_time; }
    return out;
}

Trajectory
simulate_discrete(const DiscreteStateSpaceModel &model, int step_count, const StateVector &initial_state) {
    if (step_count < 1) {
        throw std::invalid_argument("Step count must be at least 1, got " + std::to_string(step_count) + ".");
    }

    Trajectory trajectory;
    trajectory.sample_time = model.sample_time;
    trajectory.states.resize(2, step_count);
    trajectory.states.col(0) = initial_state;

    for (int k = 0; k + 1 < step_count; ++k) {
        trajectory.states.col(k + 1) = model.A_d * trajectory.states.col(k); // B_d * u vanishes, u = 0
    }
    return trajectory;
}

Trajectory
simulate(const PendulumParameters &params, double sample_time, int step_count, const StateVector &initial_state) {
    if (step_count < 1) {
        throw std::invalid_argument("Step count must be at least 1, got " + std::to_string(step_count) + ".");
    }
    return simulate_discrete(make_discrete_model(params, sample_time), step_count, initial_state);
}

Trajectory
simulate(double gravity,
         double radius,
         double mass,
         double damping,
         double sample_time,
         int step_count,
         const StateVector &initial_state) {
    PendulumParameters params;
    params.gravity = gravity;
    params.radius = radius;
    params.mass = mass;
    params.damping = damping;
    return simulate(params, sample_time, step_count, initial_state);
}

} // namespace pendulum_sysid
