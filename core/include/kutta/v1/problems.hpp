#pragma once

// =============================================================================
// Kutta v1 - Sample Problems
// =============================================================================
// Small reference systems used by the command line tool and the tests.
// Each one bundles its field, analytical Jacobian, default initial condition
// and time window, and the exact solution where one exists.
// =============================================================================

#include "kutta/v1/concepts.hpp"

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace kutta::v1 {

struct Problem {
    std::string name;
    std::string description;
    VectorField<Vector> field;
    JacobianFunction<Vector> jacobian;
    Vector initial_state;
    Real t0 = 0.0;
    Real t_end = 1.0;
    std::function<Vector(Real)> exact;  // Empty when no closed form exists
    std::vector<std::string> component_names;

    [[nodiscard]] bool has_exact_solution() const { return static_cast<bool>(exact); }
};

using ProblemParameters = std::map<std::string, Real, std::less<>>;

namespace problems {

/// y' = lambda * y
[[nodiscard]] Problem exponential(Real lambda = 1.0, Real y0 = 1.0);

/// x'' = -omega^2 x as a first order system (x, v)
[[nodiscard]] Problem harmonic_oscillator(Real omega = 1.0);

/// x'' = mu (1 - x^2) x' - x; stiff for large mu
[[nodiscard]] Problem van_der_pol(Real mu = 1.0);

[[nodiscard]] Problem lorenz(Real sigma = 10.0, Real rho = 28.0, Real beta = 8.0 / 3.0);

/// Robertson's stiff chemical kinetics
[[nodiscard]] Problem robertson();

/// Build a problem by name with optional parameter overrides.
/// @throws ConfigurationError (UnknownProblem) for unknown names
[[nodiscard]] Problem make(std::string_view name, const ProblemParameters& parameters = {});

/// Names accepted by make()
[[nodiscard]] std::vector<std::string> names();

}  // namespace problems

}  // namespace kutta::v1
