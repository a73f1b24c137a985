#include "nelder_mead.hpp"
#include "estimation_errors.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <vector>

namespace pendulum_sysid {

namespace {

class CountingObjective {
  public:
    explicit CountingObjective(const ScalarObjective &objective)
      : objective_(objective) {}

    double operator()(const Eigen::VectorXd &x) {
        ++evaluations_;
        double value = objective_(x);
        if (!std::isfinite(value)) { return std::numeric_limits<double>::infinity(); }
        seen_finite_ = true;
        return value;
    }

    int evaluations() const { return evaluations_; }
    bool seen_finite() const { return seen_finite_; }

  private:
    const ScalarObjective &objective_;
    int evaluations_ = 0;
    bool seen_finite_ = false;
};

void
validate_options(const NelderMeadOptions &options) {
    if (options.x_tolerance < 0.0 || options.f_tolerance < 0.0) {
        throw std::invalid_argument("Nelder-Mead tolerances must be non-negative.");
    }
    if (options.max_iterations < 0 || options.max_function_evaluations < 0) {
        throw std::invalid_argument("Nelder-Mead budgets must be non-negative (0 selects the default).");
    }
    if (!(options.reflection > 0.0) || !(options.expansion > 1.0) || !(options.expansion > options.reflection) ||
        !(options.contraction > 0.0 && options.contraction < 1.0) || !(options.shrink > 0.0 && options.shrink < 1.0)) {
        throw std::invalid_argument("Nelder-Mead coefficients violate 0 < rho < chi, 0 < gamma < 1, 0 < sigma < 1.");
    }
}

} // namespace

NelderMeadResult
minimize_nelder_mead(const ScalarObjective &objective, const Eigen::VectorXd &x0, const NelderMeadOptions &options) {
    if (x0.size() == 0) { throw std::invalid_argument("Nelder-Mead needs at least one free variable."); }
    validate_options(options);

    const Eigen::Index n = x0.size();
    const int max_iterations = options.max_iterations > 0 ? options.max_iterations : 200 * static_cast<int>(n);
    const int max_evaluations =
      options.max_function_evaluations > 0 ? options.max_function_evaluations : 200 * static_cast<int>(n);

    const double rho = options.reflection;
    const double chi = options.expansion;
    const double psi = options.contraction;
    const double sigma = options.shrink;

    CountingObjective f(objective);

    // Vertices as columns, kept sorted so that column 0 is the best.
    Eigen::MatrixXd simplex(n, n + 1);
    std::vector<double> values(static_cast<size_t>(n + 1));

    simplex.col(0) = x0;
    values[0] = f(x0);
    for (Eigen::Index j = 0; j < n; ++j) {
        Eigen::VectorXd vertex = x0;
        if (vertex(j) != 0.0) {
            vertex(j) *= (1.0 + options.relative_initial_step);
        } else {
            vertex(j) = options.zero_coordinate_step;
        }
        simplex.col(j + 1) = vertex;
        values[j + 1] = f(vertex);
    }

    auto sort_simplex = [&]() {
        std::vector<Eigen::Index> order(static_cast<size_t>(n + 1));
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&](Eigen::Index a, Eigen::Index b) {
            return values[a] < values[b];
        });
        Eigen::MatrixXd sorted(n, n + 1);
        std::vector<double> sorted_values(values.size());
        for (Eigen::Index i = 0; i <= n; ++i) {
            sorted.col(i) = simplex.col(order[i]);
            sorted_values[i] = values[order[i]];
        }
        simplex.swap(sorted);
        values.swap(sorted_values);
    };
    sort_simplex();

    if (options.progress_to_stdout) {
        std::cout << "[NelderMead] " << std::setw(10) << "Iteration" << std::setw(12) << "Func-count" << std::setw(16)
                  << "min f(x)"
                  << "   Procedure" << std::endl;
        std::cout << "[NelderMead] " << std::setw(10) << 0 << std::setw(12) << f.evaluations() << std::setw(16)
                  << values[0] << "   initial simplex" << std::endl;
    }

    NelderMeadResult result;
    int iteration = 0;

    while (f.evaluations() < max_evaluations && iteration < max_iterations) {
        double f_spread = 0.0;
        double x_spread = 0.0;
        for (Eigen::Index i = 1; i <= n; ++i) {
            f_spread = std::max(f_spread, std::abs(values[i] - values[0]));
            x_spread = std::max(x_spread, (simplex.col(i) - simplex.col(0)).lpNorm<Eigen::Infinity>());
        }
        // NaN spread (all vertices infinite) never satisfies the test.
        if (f_spread <= options.f_tolerance && x_spread <= options.x_tolerance) {
            result.converged = true;
            break;
        }

        Eigen::VectorXd centroid = simplex.leftCols(n).rowwise().mean();
        const Eigen::VectorXd worst = simplex.col(n);
        const char *procedure = "";

        Eigen::VectorXd reflected = (1.0 + rho) * centroid - rho * worst;
        double f_reflected = f(reflected);
        bool do_shrink = false;

        if (f_reflected < values[0]) {
            Eigen::VectorXd expanded = (1.0 + rho * chi) * centroid - rho * chi * worst;
            double f_expanded = f(expanded);
            if (f_expanded < f_reflected) {
                simplex.col(n) = expanded;
                values[n] = f_expanded;
                procedure = "expand";
            } else {
                simplex.col(n) = reflected;
                values[n] = f_reflected;
                procedure = "reflect";
            }
        } else if (f_reflected < values[n - 1]) {
            simplex.col(n) = reflected;
            values[n] = f_reflected;
            procedure = "reflect";
        } else if (f_reflected < values[n]) {
            Eigen::VectorXd contracted = (1.0 + psi * rho) * centroid - psi * rho * worst;
            double f_contracted = f(contracted);
            if (f_contracted <= f_reflected) {
                simplex.col(n) = contracted;
                values[n] = f_contracted;
                procedure = "contract outside";
            } else {
                do_shrink = true;
            }
        } else {
            Eigen::VectorXd contracted = (1.0 - psi) * centroid + psi * worst;
            double f_contracted = f(contracted);
            if (f_contracted < values[n]) {
                simplex.col(n) = contracted;
                values[n] = f_contracted;
                procedure = "contract inside";
            } else {
                do_shrink = true;
            }
        }

        if (do_shrink) {
            for (Eigen::Index i = 1; i <= n; ++i) {
                simplex.col(i) = simplex.col(0) + sigma * (simplex.col(i) - simplex.col(0));
                values[i] = f(simplex.col(i));
            }
            procedure = "shrink";
        }

        sort_simplex();
        ++iteration;

        if (options.progress_to_stdout) {
            std::cout << "[NelderMead] " << std::setw(10) << iteration << std::setw(12) << f.evaluations()
                      << std::setw(16) << values[0] << "   " << procedure << std::endl;
        }
    }

    if (!f.seen_finite() || !std::isfinite(values[0])) {
        throw NonFiniteObjectiveError("Nelder-Mead evaluated " + std::to_string(f.evaluations()) +
                                      " points and none produced a finite objective value.");
    }

    result.x = simplex.col(0);
    result.f = values[0];
    result.iterations = iteration;
    result.function_evaluations = f.evaluations();
    if (result.converged) {
        result.message = "Converged: simplex spread within x and f tolerances.";
    } else if (iteration >= max_iterations) {
        result.message = "Stopped: maximum number of iterations (" + std::to_string(max_iterations) + ") reached.";
    } else {
        result.message =
          "Stopped: maximum number of function evaluations (" + std::to_string(max_evaluations) + ") reached.";
    }

    if (options.progress_to_stdout) { std::cout << "[NelderMead] " << result.message << std::endl; }
    return result;
}

} // namespace pendulum_sysid
