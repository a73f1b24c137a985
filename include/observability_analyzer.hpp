#ifndef OBSERVABILITY_ANALYZER_HPP
#define OBSERVABILITY_ANALYZER_HPP

#include "pendulum_model.hpp"
#include <Eigen/Dense>
#include <optional>

namespace pendulum_sysid {

/**
 * @brief Geometry of the observability ellipse x^T G x = 1 of a 2x2 Gramian G.
 *
 * The axis along the most observable direction (largest eigenvalue) has length
 * 1/sqrt(lambda_max); the axis along the least observable direction has length
 * 1/sqrt(lambda_min). A non-positive eigenvalue gives an infinite axis, meaning
 * the state is unobservable along that direction.
 */
struct ObservabilityEllipse {
    Eigen::Vector2d eigenvalues;         ///< Sorted descending.
    double most_observable_axis = 0.0;   ///< 1/sqrt(eigenvalues(0))
    double least_observable_axis = 0.0;  ///< 1/sqrt(eigenvalues(1)), +inf if eigenvalues(1) <= 0
    Eigen::Vector2d most_observable_direction;
    Eigen::Vector2d least_observable_direction;
    Eigen::Matrix2d gramian; ///< The Gramian that was decomposed (transformed basis if transform is set).

    // T = sqrt(E) V^T, present when the analysis was asked for the transformed basis.
    std::optional<Eigen::Matrix2d> transform;

    double semi_major_axis() const;
    double semi_minor_axis() const;
    bool is_fully_observable() const;
};

/**
 * @brief Stacks C_d A_d^i for i = 0 .. n-1, n = A_d.rows().
 * @throws std::invalid_argument if A_d is not square or C_d has the wrong column count.
 */
Eigen::MatrixXd
observability_matrix(const Eigen::MatrixXd &A_d, const Eigen::MatrixXd &C_d);

// O^T O.
Eigen::MatrixXd
observability_gramian(const Eigen::MatrixXd &observability);

/**
 * @brief Eigendecomposes a symmetric 2x2 Gramian into ellipse axes and directions.
 *
 * Never throws for singular or indefinite input; those give infinite axes.
 *
 * @throws ObservabilityDecompositionError if the matrix is not symmetric
 * (within kGramianSymmetryTolerance, relative) or the eigensolver fails.
 */
ObservabilityEllipse
describe_ellipse(const Eigen::Matrix2d &gramian);

constexpr double kGramianSymmetryTolerance = 1e-9;

/**
 * @brief Observability ellipse of the discretized pendulum.
 *
 * With apply_transform, G = V E V^T is used to form T = sqrt(E) V^T, the
 * system is rewritten as (C_d T^-1, T A_d T^-1), and the ellipse describes the
 * Gramian of that rebuilt observability matrix. T is returned with it.
 *
 * @throws InvalidParameterError for unusable parameters or sample time.
 * @throws ObservabilityDecompositionError if a decomposition fails or T is singular.
 */
ObservabilityEllipse
analyze_observability(const PendulumParameters &params, double sample_time, bool apply_transform = false);

ObservabilityEllipse
analyze_observability(double gravity,
                      double radius,
                      double mass,
                      double damping,
                      double sample_time,
                      bool apply_transform = false);

/**
 * @brief Points on the ellipse: V [a cos(phi); b sin(phi)] for point_count phi evenly
 * spaced over [0, 2 pi], a/b the most/least observable axes and V their directions.
 *
 * @throws std::domain_error if an axis is not finite.
 * @throws std::invalid_argument if point_count < 2.
 */
Eigen::Matrix2Xd
ellipse_boundary(const ObservabilityEllipse &ellipse, int point_count = 100);

} // namespace pendulum_sysid

#endif // OBSERVABILITY_ANALYZER_HPP
