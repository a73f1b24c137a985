#ifndef PENDULUM_SYSID_HPP
#define PENDULUM_SYSID_HPP

// Include all library headers here
#include "angle_observations.hpp"
#include "continuous_reference.hpp"
#include "discrete_simulator.hpp"
#include "estimation_errors.hpp"
#include "least_squares_refinement.hpp"
#include "nelder_mead.hpp"
#include "observability_analyzer.hpp"
#include "parameter_estimator.hpp"
#include "pendulum_model.hpp"
#include "pendulum_sysid/nominal_pendulum.hpp"
#include "sensitivity_analysis.hpp"

// This is the main header file for the pendulum_sysid library
// Include this single header to access all functionality

#endif // PENDULUM_SYSID_HPP
