#pragma once

// =============================================================================
// Kutta v1 - Embedded Error Estimator
// =============================================================================
// Local error of one step from the embedded weights b*:
//
//     e    = h * sum_i (b*_i - b_i) k_i
//     norm = max_c |e_c| / (atol + rtol * max(|y_c|, |y_candidate_c|))
//
// norm <= 1 means the step meets the requested tolerance.
// =============================================================================

#include "kutta/v1/concepts.hpp"
#include "kutta/v1/errors.hpp"
#include "kutta/v1/implicit_solver.hpp"
#include "kutta/v1/tableau.hpp"

#include <algorithm>
#include <cmath>

namespace kutta::v1 {

template<StateVector State>
struct ErrorEstimate {
    State error;
    Real norm = 0.0;
};

/// Weighted infinity norm of an error vector against the step endpoints
template<StateVector State>
[[nodiscard]] Real scaled_error_norm(const State& error, const State& y, const State& y_candidate,
                                     Real atol, Real rtol) {
    using Traits = state_traits<State>;
    Real max_error = 0.0;
    const Index n = Traits::size(error);
    for (Index c = 0; c < n; ++c) {
        const Real e = std::abs(Traits::component(error, c));
        if (e == 0.0) continue;
        if (!std::isfinite(e)) return e;
        const Real scale = std::max(std::abs(Traits::component(y, c)),
                                    std::abs(Traits::component(y_candidate, c)));
        max_error = std::max(max_error, e / (atol + rtol * scale));
    }
    return max_error;
}

class ErrorEstimator {
public:
    ErrorEstimator(Real atol, Real rtol)
        : atol_(atol), rtol_(rtol) {}

    [[nodiscard]] Real absolute_tolerance() const { return atol_; }
    [[nodiscard]] Real relative_tolerance() const { return rtol_; }

    /// @throws ConfigurationError (MissingEmbeddedMethod) for tableaus
    ///         without embedded weights
    template<StateVector State>
    [[nodiscard]] ErrorEstimate<State> estimate(const StageSet<State>& stages, Real h,
                                                const Tableau& tableau, const State& y,
                                                const State& y_candidate) const {
        if (!tableau.has_embedded_method()) {
            throw ConfigurationError(ConfigurationErrorCode::MissingEmbeddedMethod,
                                     "Tableau '" + tableau.name() +
                                         "' has no embedded weights for error estimation");
        }

        const auto d = tableau.error_weights();
        ErrorEstimate<State> estimate{state_traits<State>::zero_like(y), 0.0};
        for (std::size_t i = 0; i < stages.size() && i < d.size(); ++i) {
            if (d[i] != 0.0) {
                state_traits<State>::axpy(estimate.error, h * d[i], stages[i]);
            }
        }
        estimate.norm = scaled_error_norm(estimate.error, y, y_candidate, atol_, rtol_);
        return estimate;
    }

private:
    Real atol_;
    Real rtol_;
};

}  // namespace kutta::v1
