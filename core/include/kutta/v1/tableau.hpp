#pragma once

// =============================================================================
// Kutta v1 - Butcher Tableau
// =============================================================================
// Immutable coefficient set of a Runge-Kutta method:
//
//     c | A
//     --+----
//       | b^T
//       | b*^T   (optional embedded weights)
//
// The stage structure (explicit vs implicit) is classified once at
// construction and stored as a tagged variant; the stage evaluator dispatches
// on it without rescanning the matrix.
// =============================================================================

#include "kutta/v1/errors.hpp"
#include "kutta/v1/numeric_types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace kutta::v1 {

// =============================================================================
// Stage Structure
// =============================================================================

/// a_ij == 0 for all j >= i: stages computable in ascending order
struct ExplicitStructure {};

/// Some a_ij != 0 with j >= i: stages coupled through a nonlinear system
struct ImplicitStructure {
    bool diagonally_implicit = false;  // a_ij == 0 for j > i (DIRK)
};

using StageStructure = std::variant<ExplicitStructure, ImplicitStructure>;

// =============================================================================
// Tableau
// =============================================================================

class Tableau {
public:
    using Row = std::vector<Real>;

    /// Build a tableau from raw coefficients.
    /// @param nodes            c_i, one per stage
    /// @param matrix           a_ij rows, s x s
    /// @param weights          b_i, one per stage
    /// @param order            declared order p of the primary method
    /// @param embedded_weights optional b*_i for error estimation
    /// @param embedded_order   declared order of the embedded method
    /// @param name             display name
    /// @throws ConfigurationError on any dimension mismatch, non-finite
    ///         coefficient or invalid order
    Tableau(std::vector<Real> nodes,
            std::vector<Row> matrix,
            std::vector<Real> weights,
            int order,
            std::optional<std::vector<Real>> embedded_weights = std::nullopt,
            int embedded_order = 0,
            std::string name = {});

    /// Same as the constructor, but also requires a strictly lower
    /// triangular matrix (NotStrictlyLowerTriangular otherwise).
    [[nodiscard]] static Tableau make_explicit(std::vector<Real> nodes,
                                               std::vector<Row> matrix,
                                               std::vector<Real> weights,
                                               int order,
                                               std::optional<std::vector<Real>> embedded_weights = std::nullopt,
                                               int embedded_order = 0,
                                               std::string name = {});

    [[nodiscard]] std::size_t stages() const noexcept { return nodes_.size(); }
    [[nodiscard]] Real node(std::size_t i) const { return nodes_.at(i); }
    [[nodiscard]] std::span<const Real> nodes() const noexcept { return nodes_; }

    /// Row i of the coefficient matrix
    [[nodiscard]] std::span<const Real> row(std::size_t i) const;
    [[nodiscard]] Real coefficient(std::size_t i, std::size_t j) const {
        return matrix_[i * stages() + j];
    }

    /// Dense copy of A, for the Newton stage solver
    [[nodiscard]] Matrix coefficient_matrix() const;

    [[nodiscard]] std::span<const Real> weights() const noexcept { return weights_; }

    [[nodiscard]] bool has_embedded_method() const noexcept { return !embedded_weights_.empty(); }

    /// b*_i; empty when no embedded method is present
    [[nodiscard]] std::span<const Real> embedded_weights() const noexcept { return embedded_weights_; }

    /// d_i = b*_i - b_i; empty when no embedded method is present
    [[nodiscard]] std::span<const Real> error_weights() const noexcept { return error_weights_; }

    [[nodiscard]] int order() const noexcept { return order_; }
    [[nodiscard]] int embedded_order() const noexcept { return embedded_order_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    [[nodiscard]] const StageStructure& structure() const noexcept { return structure_; }
    [[nodiscard]] bool is_explicit() const noexcept {
        return std::holds_alternative<ExplicitStructure>(structure_);
    }
    [[nodiscard]] bool is_implicit() const noexcept { return !is_explicit(); }

    /// True when every a_ij (including the diagonal) is zero
    [[nodiscard]] bool is_uncoupled() const noexcept;

private:
    std::vector<Real> nodes_;
    std::vector<Real> matrix_;  // row-major s x s
    std::vector<Real> weights_;
    std::vector<Real> embedded_weights_;
    std::vector<Real> error_weights_;
    int order_ = 1;
    int embedded_order_ = 0;
    std::string name_;
    StageStructure structure_;
};

/// Human-readable structure label ("explicit", "diagonally implicit", "implicit")
[[nodiscard]] const char* structure_label(const Tableau& tableau) noexcept;

}  // namespace kutta::v1
