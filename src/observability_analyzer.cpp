#include "observability_analyzer.hpp"
#include "estimation_errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace pendulum_sysid {

namespace {

double
axis_length(double eigenvalue) {
    if (!(eigenvalue > 0.0)) { return std::numeric_limits<double>::infinity(); }
    return 1.0 / std::sqrt(eigenvalue);
}

// Returns eigenvalues ascending with matching eigenvector columns, as MATLAB's eig does for symmetric input.
Eigen::SelfAdjointEigenSolver<Eigen::Matrix2d>
decompose_symmetric(const Eigen::Matrix2d &gramian) {
    if (!gramian.allFinite()) { throw ObservabilityDecompositionError("Gramian has non-finite entries."); }
    double scale = std::max(gramian.cwiseAbs().maxCoeff(), 1.0);
    if (std::abs(gramian(0, 1) - gramian(1, 0)) > kGramianSymmetryTolerance * scale) {
        throw ObservabilityDecompositionError("Gramian is not symmetric; no real orthogonal eigenbasis.");
    }
    Eigen::SelfAdjointEigenSolver<Eigen::Matrix2d> solver(gramian);
    if (solver.info() != Eigen::Success) {
        throw ObservabilityDecompositionError("Symmetric eigendecomposition of the Gramian failed.");
    }
    return solver;
}

} // namespace

double
ObservabilityEllipse::semi_major_axis() const {
    return std::max(most_observable_axis, least_observable_axis);
}

double
ObservabilityEllipse::semi_minor_axis() const {
    return std::min(most_observable_axis, least_observable_axis);
}

bool
ObservabilityEllipse::is_fully_observable() const {
    return std::isfinite(most_observable_axis) && std::isfinite(least_observable_axis);
}

Eigen::MatrixXd
observability_matrix(const Eigen::MatrixXd &A_d, const Eigen::MatrixXd &C_d) {
    if (A_d.rows() != A_d.cols()) { throw std::invalid_argument("System matrix must be square."); }
    if (C_d.cols() != A_d.rows()) {
        throw std::invalid_argument("Output matrix has " + std::to_string(C_d.cols()) + " columns, expected " +
                                    std::to_string(A_d.rows()) + ".");
    }
    const Eigen::Index n = A_d.rows();
    const Eigen::Index p = C_d.rows();

    Eigen::MatrixXd O(n * p, n);
    Eigen::MatrixXd block = C_d; // C_d A_d^i
    for (Eigen::Index i = 0; i < n; ++i) {
        O.middleRows(i * p, p) = block;
        block = block * A_d;
    }
    return O;
}

Eigen::MatrixXd
observability_gramian(const Eigen::MatrixXd &observability) {
    return observability.transpose() * observability;
}

ObservabilityEllipse
describe_ellipse(const Eigen::Matrix2d &gramian) {
    auto solver = decompose_symmetric(gramian);

    // Ascending from the solver; index 1 is the largest.
    const Eigen::Vector2d &values = solver.eigenvalues();
    const Eigen::Matrix2d &vectors = solver.eigenvectors();

    ObservabilityEllipse ellipse;
    ellipse.gramian = gramian;
    ellipse.eigenvalues << values(1), values(0);
    ellipse.most_observable_direction = vectors.col(1);
    ellipse.least_observable_direction = vectors.col(0);
    ellipse.most_observable_axis = axis_length(ellipse.eigenvalues(0));
    ellipse.least_observable_axis = axis_length(ellipse.eigenvalues(1));
    return ellipse;
}

ObservabilityEllipse
analyze_observability(const PendulumParameters &params, double sample_time, bool apply_transform) {
    DiscreteStateSpaceModel model = make_discrete_model(params, sample_time);

    Eigen::Matrix2d G = observability_gramian(observability_matrix(model.A_d, model.C_d));

    if (!apply_transform) { return describe_ellipse(G); }

    auto solver = decompose_symmetric(G);
    Eigen::Matrix2d T = solver.eigenvalues().cwiseMax(0.0).cwiseSqrt().asDiagonal() *
                        solver.eigenvectors().transpose();

    Eigen::FullPivLU<Eigen::Matrix2d> lu(T);
    if (!lu.isInvertible()) {
        throw ObservabilityDecompositionError("Observability transform is singular; the system is unobservable.");
    }
    Eigen::Matrix2d T_inv = lu.inverse();

    Eigen::Matrix2d C_z = model.C_d * T_inv;
    Eigen::Matrix2d A_z = T * model.A_d * T_inv;
    Eigen::Matrix2d G_z = observability_gramian(observability_matrix(A_z, C_z));
    G_z = 0.5 * (G_z + G_z.transpose()).eval(); // Remove round-off asymmetry.

    ObservabilityEllipse ellipse = describe_ellipse(G_z);
    ellipse.transform = T;
    return ellipse;
}

ObservabilityEllipse
analyze_observability(double gravity,
                      double radius,
                      double mass,
                      double damping,
                      double sample_time,
                      bool apply_transform) {
    PendulumParameters params;
    params.gravity = gravity;
    params.radius = radius;
    params.mass = mass;
    params.damping = damping;
    return analyze_observability(params, sample_time, apply_transform);
}

Eigen::Matrix2Xd
ellipse_boundary(const ObservabilityEllipse &ellipse, int point_count) {
    if (point_count < 2) { throw std::invalid_argument("Ellipse boundary needs at least 2 points."); }
    if (!ellipse.is_fully_observable()) {
        throw std::domain_error("Ellipse has an infinite axis; the state is unobservable along it.");
    }

    const double two_pi = 2.0 * 3.14159265358979323846;
    Eigen::Matrix2Xd points(2, point_count);
    for (int i = 0; i < point_count; ++i) {
        double phi = two_pi * static_cast<double>(i) / static_cast<double>(point_count - 1);
        points.col(i) = ellipse.most_observable_axis * std::cos(phi) * ellipse.most_observable_direction +
                        ellipse.least_observable_axis * std::sin(phi) * ellipse.least_observable_direction;
    }
    return points;
}

} // namespace pendulum_sysid
