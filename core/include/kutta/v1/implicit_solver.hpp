#pragma once

// =============================================================================
// Kutta v1 - Implicit Stage Solver
// =============================================================================
// Solves the coupled stage equations of an implicit Runge-Kutta step
//
//     K_i = f(t + c_i h, y + h * sum_j a_ij K_j),   i = 1..s
//
// The unknowns are the stage increments Z_i = h * sum_j a_ij K_j, so every
// update norm measures the change of the arguments handed to the field.
// Two schemes:
// - Fixed point: K <- F(Z), Z <- h (A x I) K
// - Simplified Newton: (I - h A x J) dZ = -(Z - h (A x I) F(Z)), with J
//   frozen at (t, y) for the whole solve
//
// Convergence uses the weighted infinity norm
//     max_c |dZ_c| / (abstol + reltol * |y_c + Z_c|) <= 1
// Non-convergence is reported through ImplicitSolveStatus and never thrown;
// exceptions from the field propagate unchanged.
// =============================================================================

#include "kutta/v1/concepts.hpp"
#include "kutta/v1/errors.hpp"
#include "kutta/v1/linear_solver.hpp"
#include "kutta/v1/options.hpp"
#include "kutta/v1/tableau.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace kutta::v1 {

/// Stage derivatives k_1..k_s of one step attempt
template<StateVector State>
using StageSet = std::vector<State>;

// =============================================================================
// Convergence History Tracking
// =============================================================================

/// Single iteration record for convergence analysis
struct IterationRecord {
    int iteration = 0;
    Real update_norm = 0.0;  // Weighted norm of dZ
    bool converged = false;
};

/// Iteration history of one implicit solve
class ConvergenceHistory {
public:
    static constexpr std::size_t max_history = 128;

    ConvergenceHistory() = default;

    void clear() {
        records_.clear();
        final_status_ = ImplicitSolveStatus::Success;
    }

    /// Keeps the most recent max_history records
    void add_record(const IterationRecord& record) {
        if (records_.size() == max_history) {
            records_.erase(records_.begin());
        }
        records_.push_back(record);
    }

    void set_final_status(ImplicitSolveStatus status) {
        final_status_ = status;
    }

    [[nodiscard]] std::size_t size() const { return records_.size(); }
    [[nodiscard]] bool empty() const { return records_.empty(); }

    [[nodiscard]] const IterationRecord& operator[](std::size_t i) const {
        return records_[i];
    }

    [[nodiscard]] const IterationRecord& last() const {
        return records_.back();
    }

    [[nodiscard]] ImplicitSolveStatus final_status() const { return final_status_; }

    [[nodiscard]] auto begin() const { return records_.begin(); }
    [[nodiscard]] auto end() const { return records_.end(); }

    /// True when the update norm grew on each of the last `growths` iterations
    [[nodiscard]] bool is_diverging(std::size_t growths = 3) const {
        if (records_.size() < growths + 1) return false;

        for (std::size_t i = records_.size() - growths; i < records_.size(); ++i) {
            if (records_[i].update_norm <= records_[i - 1].update_norm) {
                return false;
            }
        }
        return true;
    }

    /// Average contraction of the update norm per iteration
    [[nodiscard]] Real convergence_rate() const {
        if (records_.size() < 2) return 0.0;

        Real first = records_.front().update_norm;
        Real last = records_.back().update_norm;

        if (first <= 0 || last <= 0) return 0.0;

        return std::pow(last / first, 1.0 / static_cast<Real>(records_.size() - 1));
    }

private:
    std::vector<IterationRecord> records_;
    ImplicitSolveStatus final_status_ = ImplicitSolveStatus::Success;
};

// =============================================================================
// Implicit Solve Options and Result
// =============================================================================

struct ImplicitSolverOptions {
    ImplicitMode mode = ImplicitMode::FixedPoint;
    int max_iterations = 50;
    Real abstol = 1e-10;
    Real reltol = 1e-10;
    Real jacobian_perturbation = 1.4901161193847656e-08;
    bool track_history = true;

    [[nodiscard]] static ImplicitSolverOptions from(const IntegratorOptions& opts) {
        ImplicitSolverOptions result;
        result.mode = opts.implicit_mode;
        result.max_iterations = opts.implicit_iteration_cap;
        result.abstol = opts.implicit_convergence_tolerance;
        result.reltol = opts.implicit_relative_tolerance;
        result.jacobian_perturbation = opts.jacobian_perturbation;
        return result;
    }
};

template<StateVector State>
struct ImplicitSolveResult {
    StageSet<State> stages;
    ImplicitSolveStatus status = ImplicitSolveStatus::NumericalError;
    int iterations = 0;
    int field_evaluations = 0;
    Real final_update_norm = 0.0;
    ConvergenceHistory history;
    std::string error_message;

    [[nodiscard]] bool success() const {
        return status == ImplicitSolveStatus::Success;
    }
};

// =============================================================================
// Implicit Stage Solver
// =============================================================================

template<StateVector State, LinearSolverPolicy LinearPolicy = DenseLUPolicy>
class ImplicitStageSolver {
public:
    using Traits = state_traits<State>;
    using Field = VectorField<State>;
    using Jacobian = JacobianFunction<State>;
    using Result = ImplicitSolveResult<State>;

    explicit ImplicitStageSolver(const ImplicitSolverOptions& opts = {})
        : options_(opts) {}

    /// Supply df/dy for Newton mode; finite differences are used otherwise
    void set_jacobian(Jacobian jacobian) { jacobian_ = std::move(jacobian); }
    [[nodiscard]] bool has_jacobian() const { return static_cast<bool>(jacobian_); }

    [[nodiscard]] const ImplicitSolverOptions& options() const { return options_; }

    /// Solve the stage system of one step.
    /// @param initial_guess starting stage derivatives, one per stage
    [[nodiscard]] Result solve(const Field& field, const Tableau& tableau, Real t,
                               const State& y, Real h, const StageSet<State>& initial_guess) {
        StageSystem problem(field, tableau, t, y, h);
        Result result;

        if (initial_guess.size() != tableau.stages()) {
            result.status = ImplicitSolveStatus::NumericalError;
            result.error_message = "Initial guess has " + std::to_string(initial_guess.size()) +
                                   " stages, tableau has " + std::to_string(tableau.stages());
            result.history.set_final_status(result.status);
            return result;
        }

        Vector k = problem.stack(initial_guess);
        Vector z = problem.increments(k);

        if (options_.mode == ImplicitMode::Newton) {
            solve_newton(problem, z, result);
        } else {
            solve_fixed_point(problem, z, result);
        }

        result.field_evaluations = problem.field_evaluations;
        result.history.set_final_status(result.status);
        return result;
    }

private:
    /// Stacked (s*n) view of one step's stage system
    struct StageSystem {
        const Field& field;
        const Tableau& tableau;
        Real t;
        const State& y;
        Real h;
        Vector y_vec;
        Index n;
        Index s;
        int field_evaluations = 0;

        StageSystem(const Field& f, const Tableau& tab, Real t0, const State& y0, Real step)
            : field(f)
            , tableau(tab)
            , t(t0)
            , y(y0)
            , h(step)
            , y_vec(Traits::to_vector(y0))
            , n(y_vec.size())
            , s(static_cast<Index>(tab.stages())) {}

        [[nodiscard]] Vector stack(const StageSet<State>& stages) const {
            Vector k(s * n);
            for (Index i = 0; i < s; ++i) {
                k.segment(i * n, n) = Traits::to_vector(stages[static_cast<std::size_t>(i)]);
            }
            return k;
        }

        /// Z = h (A x I) K
        [[nodiscard]] Vector increments(const Vector& k) const {
            Vector z = Vector::Zero(s * n);
            for (Index i = 0; i < s; ++i) {
                for (Index j = 0; j < s; ++j) {
                    const Real a = tableau.coefficient(static_cast<std::size_t>(i),
                                                       static_cast<std::size_t>(j));
                    if (a != 0.0) {
                        z.segment(i * n, n).noalias() += (h * a) * k.segment(j * n, n);
                    }
                }
            }
            return z;
        }

        /// K_i = f(t + c_i h, y + Z_i); the stages are also written to `stages`
        [[nodiscard]] Vector evaluate(const Vector& z, StageSet<State>& stages) {
            stages.clear();
            stages.reserve(static_cast<std::size_t>(s));
            Vector k(s * n);
            for (Index i = 0; i < s; ++i) {
                const State arg = Traits::from_vector(y_vec + z.segment(i * n, n), y);
                const Real ti = t + tableau.node(static_cast<std::size_t>(i)) * h;
                State ki = field(ti, arg);
                ++field_evaluations;
                k.segment(i * n, n) = Traits::to_vector(ki);
                stages.push_back(std::move(ki));
            }
            return k;
        }

        /// max_c |dZ_c| / (abstol + reltol * |y_c + Z_c|)
        [[nodiscard]] Real weighted_norm(const Vector& dz, const Vector& z, Real abstol,
                                         Real reltol) const {
            Real max_error = 0.0;
            for (Index i = 0; i < s; ++i) {
                for (Index c = 0; c < n; ++c) {
                    const Real delta = std::abs(dz[i * n + c]);
                    if (delta == 0.0) continue;
                    const Real tol = abstol + reltol * std::abs(y_vec[c] + z[i * n + c]);
                    max_error = std::max(max_error, delta / tol);
                }
            }
            return max_error;
        }
    };

    void record(Result& result, int iteration, Real norm, bool converged) const {
        result.iterations = iteration;
        result.final_update_norm = norm;
        if (options_.track_history) {
            result.history.add_record({iteration, norm, converged});
        }
    }

    void solve_fixed_point(StageSystem& problem, Vector& z, Result& result) {
        for (int iter = 1; iter <= options_.max_iterations; ++iter) {
            Vector k = problem.evaluate(z, result.stages);
            if (!k.allFinite()) {
                result.status = ImplicitSolveStatus::NumericalError;
                result.iterations = iter;
                result.error_message = "Non-finite stage derivative in fixed-point iteration";
                return;
            }

            Vector z_next = problem.increments(k);
            const Real norm = problem.weighted_norm(z_next - z, z_next, options_.abstol,
                                                    options_.reltol);
            z = std::move(z_next);

            const bool converged = norm <= 1.0;
            record(result, iter, norm, converged);

            if (converged) {
                result.status = ImplicitSolveStatus::Success;
                return;
            }
            if (!std::isfinite(norm)) {
                result.status = ImplicitSolveStatus::NumericalError;
                result.error_message = "Non-finite update norm in fixed-point iteration";
                return;
            }
            if (result.history.is_diverging()) {
                result.status = ImplicitSolveStatus::Diverging;
                result.error_message = "Fixed-point iteration diverging";
                return;
            }
        }

        result.status = ImplicitSolveStatus::MaxIterationsReached;
        result.error_message = "Fixed-point iteration did not converge in " +
                               std::to_string(options_.max_iterations) + " iterations";
    }

    void solve_newton(StageSystem& problem, Vector& z, Result& result) {
        Matrix jac = jacobian_at(problem);
        if (jac.rows() != problem.n || jac.cols() != problem.n || !jac.allFinite()) {
            result.status = ImplicitSolveStatus::NumericalError;
            result.error_message = "Jacobian must be a finite " + std::to_string(problem.n) +
                                   "x" + std::to_string(problem.n) + " matrix";
            return;
        }

        // I - h (A x J)
        const Matrix coefficients = problem.tableau.coefficient_matrix();
        const Index sn = problem.s * problem.n;
        Matrix iteration_matrix = Matrix::Identity(sn, sn);
        for (Index i = 0; i < problem.s; ++i) {
            for (Index j = 0; j < problem.s; ++j) {
                const Real a = coefficients(i, j);
                if (a != 0.0) {
                    iteration_matrix.block(i * problem.n, j * problem.n, problem.n, problem.n) -=
                        (problem.h * a) * jac;
                }
            }
        }

        LinearPolicy linear_solver;
        if (!linear_solver.factorize(iteration_matrix)) {
            result.status = ImplicitSolveStatus::SingularMatrix;
            result.error_message = "Newton iteration matrix is singular";
            return;
        }

        for (int iter = 1; iter <= options_.max_iterations; ++iter) {
            Vector k = problem.evaluate(z, result.stages);
            if (!k.allFinite()) {
                result.status = ImplicitSolveStatus::NumericalError;
                result.iterations = iter;
                result.error_message = "Non-finite stage derivative in Newton iteration";
                return;
            }

            const Vector residual = z - problem.increments(k);
            auto dz = linear_solver.solve(-residual);
            if (!dz) {
                result.status = ImplicitSolveStatus::NumericalError;
                result.iterations = iter;
                result.error_message = dz.error;
                return;
            }

            z += *dz;
            const Real norm = problem.weighted_norm(*dz, z, options_.abstol, options_.reltol);
            const bool converged = norm <= 1.0;
            record(result, iter, norm, converged);

            if (!z.allFinite() || !std::isfinite(norm)) {
                result.status = ImplicitSolveStatus::NumericalError;
                result.error_message = "Non-finite Newton iterate";
                return;
            }

            if (converged) {
                // Stage derivatives consistent with the converged increments
                Vector k_final = problem.evaluate(z, result.stages);
                if (!k_final.allFinite()) {
                    result.status = ImplicitSolveStatus::NumericalError;
                    result.error_message = "Non-finite stage derivative at converged iterate";
                    return;
                }
                result.status = ImplicitSolveStatus::Success;
                return;
            }
            if (result.history.is_diverging()) {
                result.status = ImplicitSolveStatus::Diverging;
                result.error_message = "Newton iteration diverging";
                return;
            }
        }

        result.status = ImplicitSolveStatus::MaxIterationsReached;
        result.error_message = "Newton iteration did not converge in " +
                               std::to_string(options_.max_iterations) + " iterations";
    }

    /// df/dy at (t, y): user callback or forward differences
    [[nodiscard]] Matrix jacobian_at(StageSystem& problem) const {
        if (jacobian_) {
            return jacobian_(problem.t, problem.y);
        }

        const Index n = problem.n;
        Matrix jac(n, n);
        const Vector f0 = Traits::to_vector(problem.field(problem.t, problem.y));
        ++problem.field_evaluations;

        State perturbed = problem.y;
        for (Index j = 0; j < n; ++j) {
            const Real yj = problem.y_vec[j];
            const Real eps = options_.jacobian_perturbation * std::max(std::abs(yj), Real{1.0});
            Traits::set_component(perturbed, j, yj + eps);
            const Vector fj = Traits::to_vector(problem.field(problem.t, perturbed));
            ++problem.field_evaluations;
            jac.col(j) = (fj - f0) / eps;
            Traits::set_component(perturbed, j, yj);
        }
        return jac;
    }

    ImplicitSolverOptions options_;
    Jacobian jacobian_;
};

}  // namespace kutta::v1
