#ifndef ANGLE_OBSERVATIONS_HPP
#define ANGLE_OBSERVATIONS_HPP

#include "pendulum_model.hpp"
#include <vector>

namespace pendulum_sysid {

/**
 * @brief Angle time series measured from video.
 *
 * angles[i] is the pendulum angle (rad) at times[i] (s). Sampling is expected
 * to be uniform or nearly so.
 */
struct AngleObservations {
    std::vector<double> times;
    std::vector<double> angles;

    size_t size() const { return times.size(); }

    // Throws std::invalid_argument on size mismatch, fewer than 2 samples, or non-increasing times.
    void validate() const;
};

/**
 * @brief Converts tracked bob positions (pixels) into pendulum angles.
 *
 * theta_i = atan2(x_i - pivot_x, y_i - pivot_y), measured from the image y axis.
 * With remove_mean the series is shifted to zero mean, which removes the bias
 * of a marker that is not centered on the bob.
 *
 * @throws std::invalid_argument if pos_x and pos_y differ in length or are empty.
 */
std::vector<double>
angles_from_pixel_positions(const std::vector<double> &pos_x,
                            const std::vector<double> &pos_y,
                            double pivot_x,
                            double pivot_y,
                            bool remove_mean = true);

/**
 * @brief Forward differences (a[i+1] - a[i]) / sample_time; the result has one element fewer.
 */
std::vector<double>
finite_difference_rates(const std::vector<double> &angles, double sample_time);

/**
 * @brief Mean spacing of the time stamps.
 *
 * Warns on std::cerr when an interval deviates from the mean by more than
 * kSamplingJitterTolerance (relative).
 *
 * @throws std::invalid_argument for fewer than 2 samples or non-increasing times.
 */
double
sample_interval(const std::vector<double> &times);

constexpr double kSamplingJitterTolerance = 0.05;

// [theta_0, (theta_1 - theta_0) / Ts], the state the simulation starts from.
StateVector
initial_state_from_observations(const AngleObservations &observations);

} // namespace pendulum_sysid

#endif // ANGLE_OBSERVATIONS_HPP
