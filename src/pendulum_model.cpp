#include "pendulum_model.hpp"
#include "estimation_errors.hpp"

#include <cmath>
#include <sstream>
#include <string>
#include <unsupported/Eigen/MatrixFunctions>

namespace pendulum_sysid {

namespace {

void
require_finite(double value, const char *name) {
    if (!std::isfinite(value)) {
        std::ostringstream oss;
        oss << "Parameter '" << name << "' must be finite, got " << value << ".";
        throw InvalidParameterError(oss.str());
    }
}

void
require_usable_divisor(double value, const char *name) {
    require_finite(value, name);
    if (std::abs(value) < kMinimumDivisorMagnitude) {
        std::ostringstream oss;
        oss << "Parameter '" << name << "' is zero or too small to divide by (" << value << ").";
        throw InvalidParameterError(oss.str());
    }
}

} // namespace

void
validate_parameters(const PendulumParameters &params) {
    require_finite(params.gravity, "gravity");
    require_usable_divisor(params.radius, "radius");
    require_usable_divisor(params.mass, "mass");
    require_finite(params.damping, "damping");
}

void
validate_sample_time(double sample_time) {
    require_finite(sample_time, "sample_time");
    if (sample_time <= 0.0) {
        throw InvalidParameterError("Sample time must be positive, got " + std::to_string(sample_time) + ".");
    }
}

StateSpaceModel
make_continuous_model(const PendulumParameters &params) {
    validate_parameters(params);

    StateSpaceModel model;
    model.A_c << 0.0, 1.0, -params.gravity / params.radius, -params.damping / params.mass;
    model.B_c.setZero();
    model.C_c.setIdentity();
    model.D_c.setZero();
    return model;
}

DiscreteStateSpaceModel
discretize(const StateSpaceModel &model, double sample_time) {
    validate_sample_time(sample_time);

    // Augmented exponential gives A_d and the integrated input matrix in one pass.
    Eigen::Matrix3d augmented = Eigen::Matrix3d::Zero();
    augmented.topLeftCorner<2, 2>() = model.A_c * sample_time;
    augmented.topRightCorner<2, 1>() = model.B_c * sample_time;
    Eigen::Matrix3d augmented_exp = augmented.exp();

    if (!augmented_exp.allFinite()) {
        throw InvalidParameterError("Matrix exponential of the continuous model is not finite.");
    }

    DiscreteStateSpaceModel discrete;
    discrete.A_d = augmented_exp.topLeftCorner<2, 2>();
    discrete.B_d = augmented_exp.topRightCorner<2, 1>();
    discrete.C_d = model.C_c;
    discrete.D_d = model.D_c;
    discrete.sample_time = sample_time;
    return discrete;
}

DiscreteStateSpaceModel
make_discrete_model(const PendulumParameters &params, double sample_time) {
    return discretize(make_continuous_model(params), sample_time);
}

} // namespace pendulum_sysid
