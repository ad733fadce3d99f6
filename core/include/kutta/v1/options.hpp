#pragma once

// =============================================================================
// Kutta v1 - Integrator Options
// =============================================================================
// Immutable knob set passed by value to every solver constructor. Step sizes
// are magnitudes; the solver applies the sign of the integration direction.
// =============================================================================

#include "kutta/v1/errors.hpp"
#include "kutta/v1/numeric_types.hpp"

#include <cmath>
#include <limits>

namespace kutta::v1 {

/// Iteration scheme for coupled implicit stages
enum class ImplicitMode {
    FixedPoint,  // Repeated substitution
    Newton       // Simplified Newton, Jacobian frozen per step
};

[[nodiscard]] constexpr const char* to_string(ImplicitMode mode) noexcept {
    switch (mode) {
        case ImplicitMode::FixedPoint: return "FixedPoint";
        case ImplicitMode::Newton: return "Newton";
        default: return "Unknown";
    }
}

struct IntegratorOptions {
    // Error control
    Real absolute_tolerance = RealTraits<Real>::default_abstol;
    Real relative_tolerance = RealTraits<Real>::default_reltol;

    // Step size bounds (magnitudes); initial_step_size <= 0 selects automatically
    Real initial_step_size = 0.0;
    Real min_step_size = 1e-12;
    Real max_step_size = std::numeric_limits<Real>::infinity();

    // Step controller
    Real safety_factor = 0.9;
    Real min_growth_factor = 0.2;      // Lower clamp on an accepted step
    Real max_growth_factor = 5.0;      // Upper clamp on an accepted step
    Real max_shrink_factor = 0.1;      // Lower clamp on a rejected step
    Real nonconvergence_shrink_factor = 0.5;
    int max_consecutive_nonconvergence = 10;

    // Implicit stage solver
    ImplicitMode implicit_mode = ImplicitMode::FixedPoint;
    int implicit_iteration_cap = 50;
    Real implicit_convergence_tolerance = 1e-10;  // Absolute part of the weighted norm
    Real implicit_relative_tolerance = 1e-10;
    Real jacobian_perturbation = 1.4901161193847656e-08;  // sqrt(eps)
    bool warm_start_implicit = false;  // Last accepted stages seed the next implicit solve

    [[nodiscard]] static IntegratorOptions defaults() {
        return IntegratorOptions{};
    }

    [[nodiscard]] static IntegratorOptions conservative() {
        IntegratorOptions opts;
        opts.absolute_tolerance = 1e-9;
        opts.relative_tolerance = 1e-6;
        opts.safety_factor = 0.8;
        opts.max_growth_factor = 2.0;
        return opts;
    }

    [[nodiscard]] static IntegratorOptions aggressive() {
        IntegratorOptions opts;
        opts.safety_factor = 0.95;
        opts.max_growth_factor = 10.0;
        opts.implicit_iteration_cap = 20;
        return opts;
    }

    /// Newton iteration for stiff problems
    [[nodiscard]] static IntegratorOptions stiff() {
        IntegratorOptions opts;
        opts.implicit_mode = ImplicitMode::Newton;
        opts.implicit_iteration_cap = 20;
        opts.implicit_convergence_tolerance = 1e-8;
        opts.implicit_relative_tolerance = 1e-8;
        return opts;
    }

    /// @throws ConfigurationError when the options are inconsistent
    void validate() const;
};

}  // namespace kutta::v1
