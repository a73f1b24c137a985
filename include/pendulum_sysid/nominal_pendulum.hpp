#ifndef NOMINAL_PENDULUM_HPP
#define NOMINAL_PENDULUM_HPP

#include "pendulum_model.hpp"

namespace pendulum_sysid {
namespace nominal {

// Bench pendulum filmed at 30 FPS: 16 inch arm, 73 g bob.
constexpr double kGravity = 9.80665;     // m/s^2
constexpr double kRadius = 0.4064;       // m
constexpr double kMass = 0.073;          // kg
constexpr double kDamping = 0.02;        // initial guess
constexpr double kSampleTime = 1.0 / 30; // s

inline PendulumParameters
bench_pendulum() {
    PendulumParameters params;
    params.gravity = kGravity;
    params.radius = kRadius;
    params.mass = kMass;
    params.damping = kDamping;
    return params;
}

} // namespace nominal
} // namespace pendulum_sysid

#endif // NOMINAL_PENDULUM_HPP
