#ifndef ANGLE_RESIDUAL_HPP
#define ANGLE_RESIDUAL_HPP

#include "pendulum_model.hpp"
#include <vector>

namespace pendulum_sysid {

/**
 * @brief Ceres cost functor: residual k is simulated_angle_k - observed_angle_k.
 *
 * The single parameter block holds [radius, mass, damping]. Intended for
 * ceres::DynamicNumericDiffCostFunction with one block of size 3 and
 * step_count residuals.
 */
struct AngleResidualFunctor {
    AngleResidualFunctor(double gravity,
                         double sample_time,
                         int step_count,
                         const StateVector &initial_state,
                         const std::vector<double> &observed_angles);

    // Returns false (failed evaluation) for parameters the model rejects.
    bool operator()(double const *const *parameters, double *residuals) const;

    int num_residuals() const { return step_count_; }

  private:
    double gravity_;
    double sample_time_;
    int step_count_;
    StateVector initial_state_;
    std::vector<double> observed_angles_; // Stored by value, the functor outlives the caller's data.
};

} // namespace pendulum_sysid

#endif // ANGLE_RESIDUAL_HPP
