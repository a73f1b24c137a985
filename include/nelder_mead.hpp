#ifndef NELDER_MEAD_HPP
#define NELDER_MEAD_HPP

#include <Eigen/Dense>
#include <functional>
#include <string>

namespace pendulum_sysid {

using ScalarObjective = std::function<double(const Eigen::VectorXd &)>;

/**
 * @brief Settings for the Nelder-Mead simplex search.
 *
 * Defaults follow MATLAB's fminsearch: TolX = TolFun = 1e-4 and a budget of
 * 200 * n iterations and function evaluations.
 */
struct NelderMeadOptions {
    double x_tolerance = 1e-4; ///< Max infinity-norm distance of vertices from the best vertex.
    double f_tolerance = 1e-4; ///< Max |f(vertex) - f(best)|.
    int max_iterations = 0;    ///< 0 selects 200 * n.
    int max_function_evaluations = 0; ///< 0 selects 200 * n.

    double relative_initial_step = 0.05;   ///< Simplex vertex j perturbs x0[j] by this fraction.
    double zero_coordinate_step = 0.00025; ///< Used instead when x0[j] == 0.

    double reflection = 1.0;
    double expansion = 2.0;
    double contraction = 0.5;
    double shrink = 0.5;

    bool progress_to_stdout = false;
};

struct NelderMeadResult {
    Eigen::VectorXd x;
    double f = 0.0;
    int iterations = 0;
    int function_evaluations = 0;
    bool converged = false; ///< False when the budget ran out; x is still the best point found.
    std::string message;
};

/**
 * @brief Minimizes `objective` from `x0` with the Nelder-Mead simplex method.
 *
 * Non-finite objective values rank as +infinity, so the simplex moves away from
 * them. Exhausting the budget is not an error.
 *
 * @throws NonFiniteObjectiveError if no evaluated point had a finite objective value.
 * @throws std::invalid_argument for an empty x0 or inconsistent options.
 */
NelderMeadResult
minimize_nelder_mead(const ScalarObjective &objective,
                     const Eigen::VectorXd &x0,
                     const NelderMeadOptions &options = NelderMeadOptions());

} // namespace pendulum_sysid

#endif // NELDER_MEAD_HPP
