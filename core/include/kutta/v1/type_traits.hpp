#pragma once

// =============================================================================
// Kutta v1 - State Traits for Component-wise Access
// =============================================================================
// The stepping engine is generic over the state type. Arithmetic (a + b,
// c * a) comes from the type itself; everything that needs per-component
// access (error norms, finite-difference Jacobians, Newton updates) goes
// through state_traits<State>.
//
// Specializations are provided for:
// - scalar Real (one-dimensional problems)
// - Eigen column vectors of any (fixed or dynamic) size
// =============================================================================

#include "kutta/v1/numeric_types.hpp"

#include <cmath>

namespace kutta::v1 {

// =============================================================================
// Primary Template
// =============================================================================

/// Primary template - specializations provide component-wise access
template<typename State>
struct state_traits {};

// =============================================================================
// Scalar State
// =============================================================================

template<>
struct state_traits<Real> {
    [[nodiscard]] static Index size(const Real&) noexcept { return 1; }
    [[nodiscard]] static Real component(const Real& s, Index) noexcept { return s; }
    static void set_component(Real& s, Index, Real value) noexcept { s = value; }
    [[nodiscard]] static Real zero_like(const Real&) noexcept { return 0.0; }

    /// acc += a * x
    static void axpy(Real& acc, Real a, const Real& x) noexcept { acc += a * x; }

    [[nodiscard]] static Vector to_vector(const Real& s) {
        Vector v(1);
        v[0] = s;
        return v;
    }

    [[nodiscard]] static Real from_vector(const Vector& v, const Real&) { return v[0]; }
};

// =============================================================================
// Eigen Column Vectors
// =============================================================================

template<int Rows, int Options, int MaxRows>
struct state_traits<Eigen::Matrix<Real, Rows, 1, Options, MaxRows, 1>> {
    using State = Eigen::Matrix<Real, Rows, 1, Options, MaxRows, 1>;

    [[nodiscard]] static Index size(const State& s) noexcept { return s.size(); }
    [[nodiscard]] static Real component(const State& s, Index i) { return s[i]; }
    static void set_component(State& s, Index i, Real value) { s[i] = value; }
    [[nodiscard]] static State zero_like(const State& s) { return State::Zero(s.size()); }

    static void axpy(State& acc, Real a, const State& x) { acc.noalias() += a * x; }

    [[nodiscard]] static Vector to_vector(const State& s) { return Vector(s); }

    [[nodiscard]] static State from_vector(const Vector& v, const State&) { return State(v); }
};

// =============================================================================
// Component-wise Helpers
// =============================================================================

/// Number of scalar components of a state
template<typename State>
[[nodiscard]] Index state_size(const State& s) {
    return state_traits<State>::size(s);
}

/// Check that every component is finite
template<typename State>
[[nodiscard]] bool all_finite(const State& s) {
    const Index n = state_traits<State>::size(s);
    for (Index i = 0; i < n; ++i) {
        if (!std::isfinite(state_traits<State>::component(s, i))) return false;
    }
    return true;
}

}  // namespace kutta::v1
