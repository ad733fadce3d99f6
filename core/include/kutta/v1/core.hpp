#pragma once

// =============================================================================
// Kutta v1 - Runge-Kutta Initial Value Problem Integrator
// =============================================================================
// Main header for the v1 API:
// - Butcher tableaus and the built-in catalog
// - Explicit and implicit stage evaluation
// - Embedded error estimation and step size control
// - Fixed-step and adaptive solvers producing lazy trajectories
// =============================================================================

#include "kutta/v1/numeric_types.hpp"
#include "kutta/v1/type_traits.hpp"
#include "kutta/v1/concepts.hpp"
#include "kutta/v1/errors.hpp"
#include "kutta/v1/tableau.hpp"
#include "kutta/v1/tableau_catalog.hpp"
#include "kutta/v1/linear_solver.hpp"
#include "kutta/v1/options.hpp"
#include "kutta/v1/implicit_solver.hpp"
#include "kutta/v1/stage_evaluator.hpp"
#include "kutta/v1/error_estimator.hpp"
#include "kutta/v1/step_controller.hpp"
#include "kutta/v1/step_log.hpp"
#include "kutta/v1/trajectory.hpp"
#include "kutta/v1/ivp_solver.hpp"
#include "kutta/v1/problems.hpp"
#include "kutta/v1/run_config.hpp"
#include "kutta/v1/parser/yaml_parser.hpp"
