#ifndef CONTINUOUS_REFERENCE_HPP
#define CONTINUOUS_REFERENCE_HPP

#include "discrete_simulator.hpp"
#include "pendulum_model.hpp"
#include <boost/numeric/odeint.hpp>
#include <vector>

namespace pendulum_sysid {

namespace odeint = boost::numeric::odeint;

using ContinuousStateType = std::vector<double>;

// odeint system functor for x' = A_c x (B_c u = 0).
struct LinearPendulumRhs {
    StateMatrix A_c;

    explicit LinearPendulumRhs(const StateMatrix &a_c)
      : A_c(a_c) {}

    void operator()(const ContinuousStateType &x, ContinuousStateType &dxdt, double /* t */) const {
        dxdt.resize(2);
        dxdt[0] = A_c(0, 0) * x[0] + A_c(0, 1) * x[1];
        dxdt[1] = A_c(1, 0) * x[0] + A_c(1, 1) * x[1];
    }
};

/**
 * @brief Integrates the continuous pendulum model with an adaptive Dormand-Prince stepper
 * and samples it at t_k = k * sample_time, k = 0 .. step_count - 1.
 *
 * Used as an independent check of the matrix-exponential discretization.
 *
 * @throws InvalidParameterError for unusable parameters or sample time.
 * @throws std::invalid_argument if step_count < 1.
 * @throws std::runtime_error if the integrator fails.
 */
Trajectory
simulate_continuous_reference(const PendulumParameters &params,
                              double sample_time,
                              int step_count,
                              const StateVector &initial_state,
                              double abs_tolerance = 1e-12,
                              double rel_tolerance = 1e-12);

} // namespace pendulum_sysid

#endif // CONTINUOUS_REFERENCE_HPP
