#ifndef SENSITIVITY_ANALYSIS_HPP
#define SENSITIVITY_ANALYSIS_HPP

#include "pendulum_model.hpp"
#include <Eigen/Core>
#include <Eigen/SVD>
#include <vector>

namespace pendulum_sysid {

/**
 * @brief Local identifiability of [radius, mass, damping] from the angle series.
 */
struct ParameterSensitivity {
    Eigen::MatrixXd jacobian;        ///< step_count x 3, d(angle_k) / d(radius, mass, damping).
    Eigen::VectorXd singular_values; ///< Descending.
    int numerical_rank = 0;

    // Unit vectors spanning the numerical null space, one per unidentifiable combination.
    std::vector<Eigen::Vector3d> null_space_directions;

    bool fully_identifiable() const { return numerical_rank == 3; }
};

/**
 * @brief Counts singular values above tolerance * largest singular value.
 */
inline int
compute_numerical_rank(const Eigen::MatrixXd &matrix, double tolerance) {
    if (matrix.rows() == 0 || matrix.cols() == 0) { return 0; }
    Eigen::JacobiSVD<Eigen::MatrixXd> svd(matrix);
    Eigen::VectorXd singular_values = svd.singularValues();
    if (singular_values.size() == 0) { return 0; }
    double max_singular_value = singular_values(0);
    if (max_singular_value <= 0) { return 0; }
    double threshold = max_singular_value * tolerance;
    int rank = 0;
    for (int k = 0; k < singular_values.size(); ++k) {
        if (singular_values(k) > threshold) {
            rank++;
        } else {
            break;
        }
    }
    return rank;
}

/**
 * @brief Differentiates the simulated angle series with respect to the three
 * free parameters (Ceres central numeric differences) and analyzes its rank.
 *
 * For this model the result is rank 2 with one null direction parallel to
 * (0, mass, damping): scaling mass and damping together leaves damping/mass,
 * and hence every trajectory, unchanged.
 *
 * @throws InvalidParameterError for unusable parameters or sample time.
 * @throws std::invalid_argument if step_count < 1.
 * @throws std::runtime_error if the cost function cannot be evaluated at params.
 */
ParameterSensitivity
analyze_parameter_sensitivity(const PendulumParameters &params,
                              double sample_time,
                              int step_count,
                              const StateVector &initial_state,
                              double rank_tolerance = 1e-6);

} // namespace pendulum_sysid

#endif // SENSITIVITY_ANALYSIS_HPP
