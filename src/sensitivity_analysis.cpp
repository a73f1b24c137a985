#include "sensitivity_analysis.hpp"
#include "angle_residual.hpp"
#include "discrete_simulator.hpp"

#include <ceres/ceres.h>
#include <stdexcept>

namespace pendulum_sysid {

ParameterSensitivity
analyze_parameter_sensitivity(const PendulumParameters &params,
                              double sample_time,
                              int step_count,
                              const StateVector &initial_state,
                              double rank_tolerance) {
    // The residual against the nominal trajectory has the same Jacobian as the trajectory itself.
    std::vector<double> nominal_angles = simulate(params, sample_time, step_count, initial_state).angles();

    ceres::DynamicNumericDiffCostFunction<AngleResidualFunctor> cost_function(
      new AngleResidualFunctor(params.gravity, sample_time, step_count, initial_state, nominal_angles));
    cost_function.AddParameterBlock(3);
    cost_function.SetNumResiduals(step_count);

    const double parameter_block[3] = { params.radius, params.mass, params.damping };
    const double *parameter_blocks[1] = { parameter_block };

    std::vector<double> residuals(static_cast<size_t>(step_count));
    Eigen::Matrix<double, Eigen::Dynamic, 3, Eigen::RowMajor> jacobian(step_count, 3);
    double *jacobian_blocks[1] = { jacobian.data() };

    if (!cost_function.Evaluate(parameter_blocks, residuals.data(), jacobian_blocks)) {
        throw std::runtime_error("[SensitivityAnalysis] Numeric differentiation failed at the given parameters.");
    }

    ParameterSensitivity result;
    result.jacobian = jacobian;

    Eigen::JacobiSVD<Eigen::MatrixXd> svd(result.jacobian, Eigen::ComputeThinU | Eigen::ComputeFullV);
    result.singular_values = svd.singularValues();
    result.numerical_rank = compute_numerical_rank(result.jacobian, rank_tolerance);

    const Eigen::MatrixXd &V = svd.matrixV();
    for (Eigen::Index k = result.numerical_rank; k < V.cols(); ++k) {
        Eigen::Vector3d direction = V.col(k).normalized();
        result.null_space_directions.push_back(direction);
    }
    return result;
}

} // namespace pendulum_sysid
