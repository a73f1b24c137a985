#include "least_squares_refinement.hpp"
#include "angle_residual.hpp"

#include <ceres/ceres.h>
#include <iostream>

namespace pendulum_sysid {

RefinementSummary
refine_least_squares(std::array<double, 3> &parameters,
                     double gravity,
                     double sample_time,
                     int step_count,
                     const StateVector &initial_state,
                     const std::vector<double> &observed_angles,
                     int max_iterations,
                     bool progress_to_stdout) {
    // Throws on shape errors before Ceres takes ownership.
    auto *functor = new AngleResidualFunctor(gravity, sample_time, step_count, initial_state, observed_angles);

    auto *cost_function = new ceres::DynamicNumericDiffCostFunction<AngleResidualFunctor>(functor);
    cost_function->AddParameterBlock(3);
    cost_function->SetNumResiduals(step_count);

    std::array<double, 3> working = parameters;

    ceres::Problem problem;
    problem.AddResidualBlock(cost_function, nullptr, working.data());

    ceres::Solver::Options options;
    options.linear_solver_type = ceres::DENSE_QR;
    options.max_num_iterations = max_iterations;
    options.minimizer_progress_to_stdout = progress_to_stdout;
    options.logging_type = progress_to_stdout ? ceres::PER_MINIMIZER_ITERATION : ceres::SILENT;

    ceres::Solver::Summary summary;
    ceres::Solve(options, &problem, &summary);

    if (progress_to_stdout) { std::cout << summary.BriefReport() << "\n"; }

    RefinementSummary out;
    out.usable = summary.IsSolutionUsable();
    out.iterations = static_cast<int>(summary.iterations.size());
    out.initial_cost = summary.initial_cost;
    out.final_cost = summary.final_cost;
    out.brief_report = summary.BriefReport();

    if (out.usable) { parameters = working; }
    return out;
}

} // namespace pendulum_sysid
