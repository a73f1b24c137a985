#include "continuous_reference.hpp"
#include <exception>
#include <stdexcept>
#include <string>

namespace pendulum_sysid {

namespace {

// Stores each observed state as the next trajectory column. odeint copies observers,
// so the column counter lives with the caller.
struct SampleObserver {
    Trajectory &trajectory;
    Eigen::Index &next_column;

    SampleObserver(Trajectory &traj, Eigen::Index &column)
      : trajectory(traj)
      , next_column(column) {}

    void operator()(const ContinuousStateType &x, double /* t */) {
        if (next_column < trajectory.states.cols()) {
            trajectory.states(0, next_column) = x[0];
            trajectory.states(1, next_column) = x[1];
        }
        ++next_column;
    }
};

} // namespace

Trajectory
simulate_continuous_reference(const PendulumParameters &params,
                              double sample_time,
                              int step_count,
                              const StateVector &initial_state,
                              double abs_tolerance,
                              double rel_tolerance) {
    if (step_count < 1) {
        throw std::invalid_argument("Step count must be at least 1, got " + std::to_string(step_count) + ".");
    }
    validate_sample_time(sample_time);
    StateSpaceModel model = make_continuous_model(params);

    Trajectory trajectory;
    trajectory.sample_time = sample_time;
    trajectory.states.resize(2, step_count);

    std::vector<double> sample_times(static_cast<size_t>(step_count));
    for (int k = 0; k < step_count; ++k) { sample_times[k] = static_cast<double>(k) * sample_time; }

    if (step_count == 1) {
        trajectory.states.col(0) = initial_state;
        return trajectory;
    }

    ContinuousStateType state = { initial_state(0), initial_state(1) };
    LinearPendulumRhs rhs(model.A_c);
    Eigen::Index samples_written = 0;
    SampleObserver observer(trajectory, samples_written);

    using error_stepper_type = odeint::runge_kutta_dopri5<ContinuousStateType>;
    auto stepper = odeint::make_controlled(abs_tolerance, rel_tolerance, error_stepper_type());

    try {
        odeint::integrate_times(
          stepper, rhs, state, sample_times.begin(), sample_times.end(), sample_time / 10.0, observer);
    } catch (const std::exception &e) {
        throw std::runtime_error(std::string("[ContinuousReference] ODE integration failed: ") + e.what());
    }

    if (samples_written != trajectory.states.cols()) {
        throw std::runtime_error("[ContinuousReference] Integrator produced " + std::to_string(samples_written) +
                                 " samples, expected " + std::to_string(step_count) + ".");
    }
    return trajectory;
}

} // namespace pendulum_sysid
