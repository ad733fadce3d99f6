#pragma once

// =============================================================================
// Kutta v1 - Stage Evaluator
// =============================================================================
// Computes the stage derivatives k_1..k_s of one step attempt and combines
// them into the candidate y + h * sum b_i k_i.
//
// Explicit tableaus are evaluated in closed form, strictly in ascending stage
// order. Implicit tableaus are handed to the ImplicitStageSolver. The
// dispatch follows the StageStructure fixed when the tableau was built.
// =============================================================================

#include "kutta/v1/implicit_solver.hpp"

#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace kutta::v1 {

template<StateVector State>
struct StageEvaluation {
    StageSet<State> stages;
    ImplicitSolveStatus status = ImplicitSolveStatus::Success;
    int implicit_iterations = 0;  // 0 for explicit tableaus
    int field_evaluations = 0;
    std::string message;

    [[nodiscard]] bool converged() const {
        return status == ImplicitSolveStatus::Success;
    }
};

/// y + h * sum_i w_i k_i
template<StateVector State>
[[nodiscard]] State combine_stages(const State& y, Real h, const StageSet<State>& stages,
                                   std::span<const Real> weights) {
    State result = y;
    for (std::size_t i = 0; i < stages.size() && i < weights.size(); ++i) {
        if (weights[i] != 0.0) {
            state_traits<State>::axpy(result, h * weights[i], stages[i]);
        }
    }
    return result;
}

/// k_i = f(t + c_i h, y + h * sum_{j<i} a_ij k_j), i ascending
template<StateVector State>
[[nodiscard]] StageEvaluation<State> evaluate_explicit_stages(const VectorField<State>& field,
                                                              Real t, const State& y, Real h,
                                                              const Tableau& tableau) {
    StageEvaluation<State> evaluation;
    const std::size_t s = tableau.stages();
    evaluation.stages.reserve(s);

    for (std::size_t i = 0; i < s; ++i) {
        State arg = y;
        for (std::size_t j = 0; j < i; ++j) {
            const Real a = tableau.coefficient(i, j);
            if (a != 0.0) {
                state_traits<State>::axpy(arg, h * a, evaluation.stages[j]);
            }
        }
        evaluation.stages.push_back(field(t + tableau.node(i) * h, arg));
        ++evaluation.field_evaluations;
    }
    return evaluation;
}

// =============================================================================
// Stage Evaluator
// =============================================================================

template<StateVector State, LinearSolverPolicy LinearPolicy = DenseLUPolicy>
class StageEvaluator {
public:
    using Field = VectorField<State>;

    explicit StageEvaluator(const IntegratorOptions& opts = {})
        : implicit_solver_(ImplicitSolverOptions::from(opts)) {}

    void set_jacobian(JacobianFunction<State> jacobian) {
        implicit_solver_.set_jacobian(std::move(jacobian));
    }

    /// Evaluate the stages of one attempt from (t, y) with step h.
    /// @param warm_start previous accepted stages used as the implicit initial
    ///        guess; ignored for explicit tableaus or when sizes disagree
    [[nodiscard]] StageEvaluation<State> evaluate(const Field& field, Real t, const State& y,
                                                  Real h, const Tableau& tableau,
                                                  const StageSet<State>* warm_start = nullptr) {
        return std::visit([&](const auto& structure) -> StageEvaluation<State> {
            using T = std::decay_t<decltype(structure)>;
            if constexpr (std::is_same_v<T, ExplicitStructure>) {
                return evaluate_explicit_stages(field, t, y, h, tableau);
            } else {
                return evaluate_implicit(field, t, y, h, tableau, warm_start);
            }
        }, tableau.structure());
    }

private:
    [[nodiscard]] StageEvaluation<State> evaluate_implicit(const Field& field, Real t,
                                                           const State& y, Real h,
                                                           const Tableau& tableau,
                                                           const StageSet<State>* warm_start) {
        StageEvaluation<State> evaluation;

        StageSet<State> guess;
        if (warm_start != nullptr && warm_start->size() == tableau.stages()) {
            guess = *warm_start;
        } else {
            guess.assign(tableau.stages(), field(t, y));
            ++evaluation.field_evaluations;
        }

        auto solved = implicit_solver_.solve(field, tableau, t, y, h, guess);
        evaluation.stages = std::move(solved.stages);
        evaluation.status = solved.status;
        evaluation.implicit_iterations = solved.iterations;
        evaluation.field_evaluations += solved.field_evaluations;
        evaluation.message = std::move(solved.error_message);
        return evaluation;
    }

    ImplicitStageSolver<State, LinearPolicy> implicit_solver_;
};

}  // namespace kutta::v1
