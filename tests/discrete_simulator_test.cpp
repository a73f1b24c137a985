#include "discrete_simulator.hpp"
#include "estimation_errors.hpp"
#include "pendulum_sysid/nominal_pendulum.hpp"
#include "test_utils.hpp"

#include <cmath>
#include <gtest/gtest.h>
#include <vector>

using namespace pendulum_sysid;
using pendulum_sysid::test_utils::find_amplitude_peaks;
using pendulum_sysid::test_utils::make_state;

TEST(DiscreteSimulatorTest, SingleStepReturnsInitialState) {
    const StateVector x0 = make_state(0.1, -0.3);
    const double radii[] = { 0.1, 0.4064, 2.0 };
    const double masses[] = { 0.01, 0.073, 5.0 };
    const double dampings[] = { 0.0, 0.02, 0.5 };
    const double sample_times[] = { 1e-3, 1.0 / 30, 0.5 };

    for (double r : radii) {
        for (double m : masses) {
            for (double b : dampings) {
                for (double ts : sample_times) {
                    Trajectory traj = simulate(nominal::kGravity, r, m, b, ts, 1, x0);
                    ASSERT_EQ(traj.size(), 1);
                    EXPECT_EQ(traj.states(0, 0), x0(0));
                    EXPECT_EQ(traj.states(1, 0), x0(1));
                }
            }
        }
    }
}

TEST(DiscreteSimulatorTest, RepeatedCallsAreIdentical) {
    const StateVector x0 = make_state(0.1, 0.0);
    Trajectory a = simulate(nominal::bench_pendulum(), nominal::kSampleTime, 120, x0);
    Trajectory b = simulate(nominal::bench_pendulum(), nominal::kSampleTime, 120, x0);
    ASSERT_EQ(a.size(), b.size());
    EXPECT_TRUE(a.states == b.states);
}

TEST(DiscreteSimulatorTest, UndampedOscillatorConservesEnergy) {
    PendulumParameters params = nominal::bench_pendulum();
    params.damping = 0.0;
    const double w2 = params.gravity / params.radius;
    const StateVector x0 = make_state(0.1, 0.25);

    Trajectory traj = simulate(params, nominal::kSampleTime, 600, x0);
    const double energy0 = x0(0) * x0(0) * w2 + x0(1) * x0(1);
    for (Eigen::Index k = 0; k < traj.size(); ++k) {
        double theta = traj.states(0, k);
        double rate = traj.states(1, k);
        EXPECT_NEAR(theta * theta * w2 + rate * rate, energy0, 1e-9 * energy0) << "at step " << k;
    }
}

TEST(DiscreteSimulatorTest, DampedOscillationPeaksDecrease) {
    // Bench pendulum filmed for one second at 30 FPS.
    Trajectory traj = simulate(nominal::kGravity,
                               nominal::kRadius,
                               nominal::kMass,
                               nominal::kDamping,
                               nominal::kSampleTime,
                               30,
                               make_state(0.1, 0.0));
    ASSERT_EQ(traj.size(), 30);

    std::vector<double> angles = traj.angles();
    std::vector<size_t> peaks = find_amplitude_peaks(angles);
    ASSERT_GE(peaks.size(), 2u);
    for (size_t i = 1; i < peaks.size(); ++i) {
        EXPECT_LT(std::abs(angles[peaks[i]]), std::abs(angles[peaks[i - 1]]))
          << "peak " << i << " at sample " << peaks[i];
    }
}

TEST(DiscreteSimulatorTest, DampedOscillationPeaksDecreaseOverManyPeriods) {
    Trajectory traj = simulate(nominal::bench_pendulum(), nominal::kSampleTime, 600, make_state(0.1, 0.0));
    std::vector<double> angles = traj.angles();
    std::vector<size_t> peaks = find_amplitude_peaks(angles);
    ASSERT_GE(peaks.size(), 10u);
    for (size_t i = 1; i < peaks.size(); ++i) { EXPECT_LT(std::abs(angles[peaks[i]]), std::abs(angles[peaks[i - 1]])); }
}

TEST(DiscreteSimulatorTest, TrajectoryAccessorsAreConsistent) {
    Trajectory traj = simulate(nominal::bench_pendulum(), 0.05, 10, make_state(0.2, 0.1));
    std::vector<double> times = traj.times();
    std::vector<double> angles = traj.angles();
    std::vector<double> rates = traj.angular_velocities();
    ASSERT_EQ(times.size(), 10u);
    ASSERT_EQ(angles.size(), 10u);
    ASSERT_EQ(rates.size(), 10u);
    EXPECT_DOUBLE_EQ(times[0], 0.0);
    EXPECT_DOUBLE_EQ(times[9], 9 * 0.05);
    for (Eigen::Index k = 0; k < traj.size(); ++k) {
        EXPECT_EQ(traj.state(k)(0), angles[k]);
        EXPECT_EQ(traj.state(k)(1), rates[k]);
    }
}

TEST(DiscreteSimulatorTest, StepMatchesMatrixPower) {
    DiscreteStateSpaceModel model = make_discrete_model(nominal::bench_pendulum(), nominal::kSampleTime);
    const StateVector x0 = make_state(0.1, 0.0);
    Trajectory traj = simulate_discrete(model, 5, x0);

    StateMatrix power = StateMatrix::Identity();
    for (Eigen::Index k = 0; k < traj.size(); ++k) {
        StateVector expected = power * x0;
        EXPECT_NEAR(traj.states(0, k), expected(0), 1e-14);
        EXPECT_NEAR(traj.states(1, k), expected(1), 1e-14);
        power = model.A_d * power;
    }
}

TEST(DiscreteSimulatorTest, InvalidInputsThrow) {
    const StateVector x0 = make_state(0.1, 0.0);
    EXPECT_THROW(simulate(nominal::kGravity, 0.0, 0.073, 0.02, 1.0 / 30, 10, x0), InvalidParameterError);
    EXPECT_THROW(simulate(nominal::kGravity, 0.4, 0.0, 0.02, 1.0 / 30, 10, x0), InvalidParameterError);
    EXPECT_THROW(simulate(nominal::bench_pendulum(), 1.0 / 30, 0, x0), std::invalid_argument);
}
