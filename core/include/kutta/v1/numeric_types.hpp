#pragma once

// =============================================================================
// Kutta v1 - Numeric Types Foundation
// =============================================================================
// This header provides the foundational numeric types for the stepping engine:
// - Real / Index scalar types
// - Eigen aliases for dense vectors and matrices
// - RealTraits for precision-dependent defaults
// =============================================================================

#include <Eigen/Core>

#include <concepts>
#include <cstddef>
#include <limits>

namespace kutta::v1 {

// =============================================================================
// Scalar Types
// =============================================================================

using Real = double;
using Index = Eigen::Index;

/// Concept for valid Real types
template<typename T>
concept RealType = std::floating_point<T>;

/// Traits for Real type characteristics
template<RealType T>
struct RealTraits {
    static constexpr T epsilon = std::numeric_limits<T>::epsilon();
    static constexpr T min_normal = std::numeric_limits<T>::min();
    static constexpr T max_value = std::numeric_limits<T>::max();
    static constexpr T infinity = std::numeric_limits<T>::infinity();

    /// Recommended absolute tolerance for error control
    static constexpr T default_abstol = (sizeof(T) == 4) ? T{1e-4} : T{1e-6};

    /// Recommended relative tolerance for error control
    static constexpr T default_reltol = (sizeof(T) == 4) ? T{1e-3} : T{1e-3};
};

// =============================================================================
// Eigen Aliases
// =============================================================================

using Vector = Eigen::VectorXd;
using Matrix = Eigen::MatrixXd;

}  // namespace kutta::v1
