#include "angle_observations.hpp"
#include "estimation_errors.hpp"

#include <cmath>
#include <iostream>
#include <numeric>
#include <stdexcept>
#include <string>

namespace pendulum_sysid {

void
AngleObservations::validate() const {
    if (times.size() != angles.size()) {
        throw std::invalid_argument("AngleObservations: times (" + std::to_string(times.size()) + ") and angles (" +
                                    std::to_string(angles.size()) + ") must have the same length.");
    }
    if (times.size() < 2) { throw std::invalid_argument("AngleObservations needs at least two samples."); }
    for (size_t i = 0; i + 1 < times.size(); ++i) {
        if (!(times[i + 1] > times[i])) {
            throw std::invalid_argument("AngleObservations: time stamps must be strictly increasing (index " +
                                        std::to_string(i + 1) + ").");
        }
    }
}

std::vector<double>
angles_from_pixel_positions(const std::vector<double> &pos_x,
                            const std::vector<double> &pos_y,
                            double pivot_x,
                            double pivot_y,
                            bool remove_mean) {
    if (pos_x.size() != pos_y.size()) {
        throw std::invalid_argument("Pixel position series must have the same length.");
    }
    if (pos_x.empty()) { throw std::invalid_argument("Pixel position series cannot be empty."); }

    std::vector<double> theta(pos_x.size());
    for (size_t i = 0; i < pos_x.size(); ++i) { theta[i] = std::atan2(pos_x[i] - pivot_x, pos_y[i] - pivot_y); }

    if (remove_mean) {
        double mean = std::accumulate(theta.begin(), theta.end(), 0.0) / static_cast<double>(theta.size());
        for (auto &value : theta) { value -= mean; }
    }
    return theta;
}

std::vector<double>
finite_difference_rates(const std::vector<double> &angles, double sample_time) {
    validate_sample_time(sample_time);
    std::vector<double> rates;
    if (angles.size() < 2) { return rates; }
    rates.reserve(angles.size() - 1);
    for (size_t i = 0; i + 1 < angles.size(); ++i) { rates.push_back((angles[i + 1] - angles[i]) / sample_time); }
    return rates;
}

double
sample_interval(const std::vector<double> &times) {
    if (times.size() < 2) {
        throw std::invalid_argument("At least two time stamps are needed to determine the sample interval.");
    }
    for (size_t i = 0; i + 1 < times.size(); ++i) {
        if (!(times[i + 1] > times[i])) {
            throw std::invalid_argument("Time stamps must be strictly increasing (index " + std::to_string(i + 1) +
                                        ").");
        }
    }

    double mean_interval = (times.back() - times.front()) / static_cast<double>(times.size() - 1);

    double worst_deviation = 0.0;
    for (size_t i = 0; i + 1 < times.size(); ++i) {
        double deviation = std::abs((times[i + 1] - times[i]) - mean_interval) / mean_interval;
        if (deviation > worst_deviation) { worst_deviation = deviation; }
    }
    if (worst_deviation > kSamplingJitterTolerance) {
        std::cerr << "[AngleObservations] Warning: non-uniform sampling, worst interval deviates "
                  << worst_deviation * 100.0 << "% from the mean interval " << mean_interval << " s." << std::endl;
    }
    return mean_interval;
}

StateVector
initial_state_from_observations(const AngleObservations &observations) {
    observations.validate();
    double ts = sample_interval(observations.times);
    StateVector x0;
    x0 << observations.angles[0], (observations.angles[1] - observations.angles[0]) / ts;
    return x0;
}

} // namespace pendulum_sysid
