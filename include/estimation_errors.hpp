#ifndef ESTIMATION_ERRORS_HPP
#define ESTIMATION_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace pendulum_sysid {

/**
 * @brief Thrown when a physical parameter cannot be used to build the model
 * (zero or non-finite radius/mass, non-finite gravity, damping or sample time).
 */
class InvalidParameterError : public std::invalid_argument {
  public:
    explicit InvalidParameterError(const std::string &what)
      : std::invalid_argument(what) {}
};

/**
 * @brief Thrown by the minimizer when no candidate ever produced a finite objective value.
 */
class NonFiniteObjectiveError : public std::runtime_error {
  public:
    explicit NonFiniteObjectiveError(const std::string &what)
      : std::runtime_error(what) {}
};

// Gramian not symmetric or eigensolver failure.
class ObservabilityDecompositionError : public std::runtime_error {
  public:
    explicit ObservabilityDecompositionError(const std::string &what)
      : std::runtime_error(what) {}
};

} // namespace pendulum_sysid

#endif // ESTIMATION_ERRORS_HPP
