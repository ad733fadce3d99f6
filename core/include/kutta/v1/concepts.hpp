#pragma once

// =============================================================================
// Kutta v1 - C++20 Concepts for States, Fields and Linear Solvers
// =============================================================================
// This header defines concepts that constrain template parameters for:
// - State vectors consumed by the stepping engine
// - Vector fields f(t, y) and their Jacobians
// - Linear solver policies used by the Newton stage solver
// =============================================================================

#include "kutta/v1/numeric_types.hpp"
#include "kutta/v1/type_traits.hpp"

#include <concepts>
#include <functional>

namespace kutta::v1 {

// =============================================================================
// State Concepts
// =============================================================================

/// A state supports addition, scalar multiplication and component access
template<typename S>
concept StateVector = std::copyable<S> && requires(const S& a, const S& b, S& m, Real c, Index i) {
    { S(a + b) } -> std::same_as<S>;
    { S(c * a) } -> std::same_as<S>;
    { state_traits<S>::size(a) } -> std::convertible_to<Index>;
    { state_traits<S>::component(a, i) } -> std::convertible_to<Real>;
    { state_traits<S>::zero_like(a) } -> std::convertible_to<S>;
    { state_traits<S>::to_vector(a) } -> std::convertible_to<Vector>;
    { state_traits<S>::from_vector(Vector{}, a) } -> std::convertible_to<S>;
    state_traits<S>::set_component(m, i, c);
    state_traits<S>::axpy(m, c, a);
};

// =============================================================================
// Field Concepts
// =============================================================================

/// Type-erased vector field dy/dt = f(t, y)
template<StateVector State>
using VectorField = std::function<State(Real t, const State& y)>;

/// Type-erased Jacobian df/dy evaluated at (t, y)
template<StateVector State>
using JacobianFunction = std::function<Matrix(Real t, const State& y)>;

}  // namespace kutta::v1
