#ifndef PENDULUM_MODEL_HPP
#define PENDULUM_MODEL_HPP

#include <Eigen/Dense>

namespace pendulum_sysid {

// State is [angle (rad), angular velocity (rad/s)].
using StateVector = Eigen::Vector2d;
using StateMatrix = Eigen::Matrix2d;

/**
 * @brief Physical parameters of the damped pendulum.
 *
 * gravity is fixed by the caller; radius, mass and damping are the quantities
 * being fitted. The model only depends on gravity/radius and damping/mass.
 */
struct PendulumParameters {
    double gravity = 0.0; ///< m/s^2
    double radius = 0.0;  ///< m
    double mass = 0.0;    ///< kg
    double damping = 0.0; ///< damping coefficient
};

/**
 * @brief Throws InvalidParameterError if the parameters cannot produce a model.
 *
 * radius and mass must be finite with magnitude >= kMinimumDivisorMagnitude;
 * gravity and damping must be finite. Negative damping is accepted.
 */
void
validate_parameters(const PendulumParameters &params);

// Throws InvalidParameterError unless sample_time is finite and > 0.
void
validate_sample_time(double sample_time);

constexpr double kMinimumDivisorMagnitude = 1e-12;

/**
 * @brief Continuous-time state space model x' = A_c x + B_c u, y = C_c x + D_c u.
 */
struct StateSpaceModel {
    StateMatrix A_c;
    Eigen::Vector2d B_c;
    StateMatrix C_c;
    Eigen::Vector2d D_c;
};

/**
 * @brief Exact zero-order-hold discretization of a StateSpaceModel.
 */
struct DiscreteStateSpaceModel {
    StateMatrix A_d;
    Eigen::Vector2d B_d;
    StateMatrix C_d;
    Eigen::Vector2d D_d;
    double sample_time = 0.0;
};

/**
 * @brief Builds A_c = [[0, 1], [-g/r, -b/m]], a zero input matrix and identity output matrix.
 * @throws InvalidParameterError via validate_parameters.
 */
StateSpaceModel
make_continuous_model(const PendulumParameters &params);

/**
 * @brief Discretizes a continuous model with sample time Ts.
 *
 * A_d = exp(A_c Ts). B_d = integral_0^Ts exp(A_c t) B_c dt, taken from the
 * upper-right block of exp([[A_c, B_c], [0, 0]] Ts).
 *
 * @throws InvalidParameterError if Ts is invalid or the exponential is not finite.
 */
DiscreteStateSpaceModel
discretize(const StateSpaceModel &model, double sample_time);

// Convenience: make_continuous_model followed by discretize.
DiscreteStateSpaceModel
make_discrete_model(const PendulumParameters &params, double sample_time);

} // namespace pendulum_sysid

#endif // PENDULUM_MODEL_HPP
