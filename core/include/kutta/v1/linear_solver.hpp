#pragma once

// =============================================================================
// Kutta v1 - Dense Linear Solver Policies
// =============================================================================
// The Newton stage solver factors one (s*n) x (s*n) iteration matrix per step
// and reuses it for every iteration. Policies:
// - DenseLUPolicy: full-pivoting LU (default)
// - DenseQRPolicy: column-pivoting Householder QR (rank revealing)
// =============================================================================

#include "kutta/v1/numeric_types.hpp"

#include <Eigen/Dense>

#include <concepts>
#include <optional>
#include <string>
#include <utility>

namespace kutta::v1 {

// =============================================================================
// Linear Solver Result Type (portable alternative to std::expected)
// =============================================================================

struct LinearSolveResult {
    std::optional<Vector> solution;
    std::string error;

    [[nodiscard]] bool has_value() const { return solution.has_value(); }
    [[nodiscard]] explicit operator bool() const { return has_value(); }
    [[nodiscard]] const Vector& value() const { return *solution; }
    [[nodiscard]] Vector& value() { return *solution; }
    [[nodiscard]] const Vector& operator*() const { return *solution; }

    static LinearSolveResult success(Vector v) {
        return {std::move(v), {}};
    }

    static LinearSolveResult failure(std::string err) {
        return {std::nullopt, std::move(err)};
    }
};

// =============================================================================
// Linear Solver Policy Concept
// =============================================================================

template<typename T>
concept LinearSolverPolicy = std::default_initializable<T> &&
    requires(T solver, const Matrix& A, const Vector& b) {
    { solver.factorize(A) } -> std::same_as<bool>;
    { solver.solve(b) } -> std::same_as<LinearSolveResult>;
    { solver.is_singular() } -> std::same_as<bool>;
};

// =============================================================================
// Dense LU Policy
// =============================================================================

class DenseLUPolicy {
public:
    DenseLUPolicy() = default;

    bool factorize(const Matrix& A) {
        lu_.compute(A);
        singular_ = !lu_.isInvertible();
        factorized_ = !singular_;
        return factorized_;
    }

    [[nodiscard]] LinearSolveResult solve(const Vector& b) {
        if (!factorized_) {
            return LinearSolveResult::failure("Matrix not factorized");
        }

        Vector x = lu_.solve(b);

        if (!x.allFinite()) {
            return LinearSolveResult::failure("Linear solve produced non-finite values");
        }

        return LinearSolveResult::success(std::move(x));
    }

    [[nodiscard]] bool is_singular() const { return singular_; }

private:
    Eigen::FullPivLU<Matrix> lu_;
    bool factorized_ = false;
    bool singular_ = false;
};

// =============================================================================
// Dense QR Policy
// =============================================================================

class DenseQRPolicy {
public:
    DenseQRPolicy() = default;

    bool factorize(const Matrix& A) {
        qr_.compute(A);
        singular_ = !qr_.isInvertible();
        factorized_ = !singular_;
        return factorized_;
    }

    [[nodiscard]] LinearSolveResult solve(const Vector& b) {
        if (!factorized_) {
            return LinearSolveResult::failure("Matrix not factorized");
        }

        Vector x = qr_.solve(b);

        if (!x.allFinite()) {
            return LinearSolveResult::failure("Linear solve produced non-finite values");
        }

        return LinearSolveResult::success(std::move(x));
    }

    [[nodiscard]] bool is_singular() const { return singular_; }

private:
    Eigen::ColPivHouseholderQR<Matrix> qr_;
    bool factorized_ = false;
    bool singular_ = false;
};

static_assert(LinearSolverPolicy<DenseLUPolicy>);
static_assert(LinearSolverPolicy<DenseQRPolicy>);

}  // namespace kutta::v1
