#ifndef TEST_UTILS_HPP
#define TEST_UTILS_HPP

#include <Eigen/Dense>

#include "angle_observations.hpp"
#include "discrete_simulator.hpp"
#include "pendulum_model.hpp"
#include "pendulum_sysid/nominal_pendulum.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <random>
#include <vector>

namespace pendulum_sysid {
namespace test_utils {

inline StateVector
make_state(double angle, double rate) {
    StateVector x;
    x << angle, rate;
    return x;
}

/**
 * @brief Angle series produced by the discrete simulator itself, optionally with Gaussian noise.
 * A fixed seed keeps noisy tests reproducible.
 */
inline AngleObservations
generate_synthetic_observations(const PendulumParameters &truth,
                                double sample_time,
                                int step_count,
                                const StateVector &initial_state,
                                double noise_stddev = 0.0,
                                unsigned int seed = 42) {
    Trajectory trajectory = simulate(truth, sample_time, step_count, initial_state);
    AngleObservations obs;
    obs.times = trajectory.times();
    obs.angles = trajectory.angles();

    if (noise_stddev > 0.0) {
        std::mt19937 gen(seed);
        std::normal_distribution<> noise(0.0, noise_stddev);
        for (auto &angle : obs.angles) { angle += noise(gen); }
    }
    return obs;
}

// Indices of the local maxima of |angle|, including sample 0 when it is a maximum.
inline std::vector<size_t>
find_amplitude_peaks(const std::vector<double> &angles) {
    std::vector<size_t> peaks;
    if (angles.size() < 2) { return peaks; }
    if (std::abs(angles[0]) >= std::abs(angles[1])) { peaks.push_back(0); }
    for (size_t i = 1; i + 1 < angles.size(); ++i) {
        double here = std::abs(angles[i]);
        if (here > std::abs(angles[i - 1]) && here >= std::abs(angles[i + 1])) { peaks.push_back(i); }
    }
    return peaks;
}

inline double
relative_error(double estimate, double truth) {
    return std::abs(estimate - truth) / std::abs(truth);
}

template<typename DerivedA, typename DerivedB>
void
EXPECT_MATRIX_NEAR(const Eigen::MatrixBase<DerivedA> &actual_expr,
                   const Eigen::MatrixBase<DerivedB> &expected_expr,
                   double tolerance) {
    // Products only allow coefficient access once evaluated.
    const typename DerivedA::PlainObject actual = actual_expr;
    const typename DerivedB::PlainObject expected = expected_expr;
    ASSERT_EQ(actual.rows(), expected.rows());
    ASSERT_EQ(actual.cols(), expected.cols());
    for (Eigen::Index i = 0; i < actual.rows(); ++i) {
        for (Eigen::Index j = 0; j < actual.cols(); ++j) {
            EXPECT_NEAR(actual(i, j), expected(i, j), tolerance) << "Mismatch at (" << i << ", " << j << ")";
        }
    }
}

// |cos| of the angle between two vectors; eigenvectors are only defined up to sign.
template<typename DerivedA, typename DerivedB>
double
abs_cosine(const Eigen::MatrixBase<DerivedA> &a, const Eigen::MatrixBase<DerivedB> &b) {
    return std::abs(a.dot(b)) / (a.norm() * b.norm());
}

} // namespace test_utils
} // namespace pendulum_sysid

#endif // TEST_UTILS_HPP
