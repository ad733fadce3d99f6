#pragma once

// =============================================================================
// Kutta v1 - Run Configuration
// =============================================================================
// One complete integration request as described by a YAML file: problem,
// time window, method and integrator options. run() resolves it against the
// problem and tableau catalogs and integrates it.
// =============================================================================

#include "kutta/v1/ivp_solver.hpp"
#include "kutta/v1/options.hpp"
#include "kutta/v1/problems.hpp"
#include "kutta/v1/step_log.hpp"
#include "kutta/v1/tableau.hpp"

#include <optional>
#include <string>

namespace kutta::v1 {

struct RunConfig {
    // Problem
    std::string problem_name = "exponential";
    ProblemParameters problem_parameters;
    std::optional<Vector> initial_state;  // Overrides the problem default
    std::optional<Real> t_start;
    std::optional<Real> t_end;

    // Method
    std::string tableau_name = "dormand-prince";
    std::optional<Tableau> custom_tableau;  // Takes precedence over tableau_name
    bool adaptive = true;
    Real step_size = 0.0;                   // Fixed step; 0 selects (t_end - t0) / 100
    bool analytic_jacobian = true;          // Use the problem Jacobian in Newton mode

    IntegratorOptions options;

    // Output
    std::string output_path;
    int output_every = 1;  // Write every n-th sample (first and last always kept)

    /// Problem with initial state and time window overrides applied.
    /// @throws ConfigurationError for unknown problems or a state of the wrong size
    [[nodiscard]] Problem resolve_problem() const;

    /// @throws ConfigurationError for unknown catalog names
    [[nodiscard]] Tableau resolve_tableau() const;
};

struct RunOutput {
    Problem problem;
    std::string tableau_name;
    SolveResult<Vector> result;
};

/// Integrate a run configuration; `on_step` receives every step attempt
/// @throws ConfigurationError when the configuration cannot be resolved
[[nodiscard]] RunOutput run(const RunConfig& config, const StepLogCallback& on_step = {});

}  // namespace kutta::v1
