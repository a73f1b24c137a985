#ifndef DISCRETE_SIMULATOR_HPP
#define DISCRETE_SIMULATOR_HPP

#include "pendulum_model.hpp"
#include <Eigen/Dense>
#include <vector>

namespace pendulum_sysid {

/**
 * @brief Sampled state trajectory. Column k of `states` is the state at time k * sample_time.
 */
struct Trajectory {
    double sample_time = 0.0;
    Eigen::Matrix2Xd states;

    Eigen::Index size() const { return states.cols(); }
    StateVector state(Eigen::Index k) const { return states.col(k); }

    std::vector<double> angles() const;
    std::vector<double> angular_velocities() const;
    std::vector<double> times() const;
};

/**
 * @brief Propagates x_{k+1} = A_d x_k (the input is identically zero).
 *
 * @param step_count Number of states produced, including the initial state. Must be >= 1.
 * @throws std::invalid_argument if step_count < 1.
 */
Trajectory
simulate_discrete(const DiscreteStateSpaceModel &model, int step_count, const StateVector &initial_state);

/**
 * @brief Discretizes the pendulum at `sample_time` and simulates `step_count` states from `initial_state`.
 *
 * @throws InvalidParameterError for unusable radius/mass/sample time.
 * @throws std::invalid_argument if step_count < 1.
 */
Trajectory
simulate(const PendulumParameters &params, double sample_time, int step_count, const StateVector &initial_state);

Trajectory
simulate(double gravity,
         double radius,
         double mass,
         double damping,
         double sample_time,
         int step_count,
         const StateVector &initial_state);

} // namespace pendulum_sysid

#endif // DISCRETE_SIMULATOR_HPP
