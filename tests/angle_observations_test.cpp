#include "angle_observations.hpp"
#include "estimation_errors.hpp"

#include <cmath>
#include <gtest/gtest.h>
#include <numeric>
#include <vector>

using namespace pendulum_sysid;

TEST(AngleObservationsTest, AnglesFromPixelPositionsWithoutMeanRemoval) {
    // Pivot at (100, 50); image y grows downward so a hanging bob has dy > 0.
    std::vector<double> pos_x = { 100.0, 110.0, 90.0 };
    std::vector<double> pos_y = { 150.0, 150.0, 150.0 };

    std::vector<double> theta = angles_from_pixel_positions(pos_x, pos_y, 100.0, 50.0, false);
    ASSERT_EQ(theta.size(), 3u);
    EXPECT_DOUBLE_EQ(theta[0], 0.0);
    EXPECT_DOUBLE_EQ(theta[1], std::atan2(10.0, 100.0));
    EXPECT_DOUBLE_EQ(theta[2], std::atan2(-10.0, 100.0));
}

TEST(AngleObservationsTest, MeanRemovalCentersTheSeries) {
    std::vector<double> pos_x = { 105.0, 115.0, 95.0, 108.0 };
    std::vector<double> pos_y = { 150.0, 149.0, 149.5, 150.0 };

    std::vector<double> raw = angles_from_pixel_positions(pos_x, pos_y, 100.0, 50.0, false);
    std::vector<double> centered = angles_from_pixel_positions(pos_x, pos_y, 100.0, 50.0);

    double mean = std::accumulate(centered.begin(), centered.end(), 0.0) / centered.size();
    EXPECT_NEAR(mean, 0.0, 1e-15);
    for (size_t i = 1; i < raw.size(); ++i) { EXPECT_NEAR(centered[i] - centered[0], raw[i] - raw[0], 1e-15); }
}

TEST(AngleObservationsTest, MismatchedOrEmptyPositionsThrow) {
    EXPECT_THROW(angles_from_pixel_positions({ 1.0, 2.0 }, { 1.0 }, 0.0, 0.0), std::invalid_argument);
    EXPECT_THROW(angles_from_pixel_positions({}, {}, 0.0, 0.0), std::invalid_argument);
}

TEST(AngleObservationsTest, FiniteDifferenceRates) {
    std::vector<double> angles = { 0.0, 0.1, 0.3, 0.2 };
    std::vector<double> rates = finite_difference_rates(angles, 0.1);
    ASSERT_EQ(rates.size(), 3u);
    EXPECT_NEAR(rates[0], 1.0, 1e-12);
    EXPECT_NEAR(rates[1], 2.0, 1e-12);
    EXPECT_NEAR(rates[2], -1.0, 1e-12);

    EXPECT_TRUE(finite_difference_rates({ 0.5 }, 0.1).empty());
    EXPECT_THROW(finite_difference_rates(angles, 0.0), InvalidParameterError);
}

TEST(AngleObservationsTest, SampleIntervalIsMeanSpacing) {
    std::vector<double> times;
    for (int i = 0; i < 31; ++i) { times.push_back(i / 30.0); }
    EXPECT_NEAR(sample_interval(times), 1.0 / 30.0, 1e-15);

    // Jitter only warns.
    std::vector<double> jittery = { 0.0, 0.03, 0.07, 0.1 };
    EXPECT_NEAR(sample_interval(jittery), 0.1 / 3.0, 1e-15);
}

TEST(AngleObservationsTest, SampleIntervalRejectsBadTimeStamps) {
    EXPECT_THROW(sample_interval({ 0.0 }), std::invalid_argument);
    EXPECT_THROW(sample_interval({ 0.0, 0.1, 0.1 }), std::invalid_argument);
    EXPECT_THROW(sample_interval({ 0.0, 0.2, 0.1 }), std::invalid_argument);
}

TEST(AngleObservationsTest, InitialStateUsesFirstDifference) {
    AngleObservations obs;
    obs.times = { 0.0, 0.5, 1.0 };
    obs.angles = { 0.2, 0.1, -0.1 };
    StateVector x0 = initial_state_from_observations(obs);
    EXPECT_DOUBLE_EQ(x0(0), 0.2);
    EXPECT_NEAR(x0(1), -0.2, 1e-15);
}

TEST(AngleObservationsTest, ValidateChecksShapes) {
    AngleObservations obs;
    obs.times = { 0.0, 0.1 };
    obs.angles = { 0.0 };
    EXPECT_THROW(obs.validate(), std::invalid_argument);

    obs.angles = { 0.0, 0.1 };
    EXPECT_NO_THROW(obs.validate());
}
