#pragma once

// =============================================================================
// Kutta v1 - Adaptive Step Size Controller
// =============================================================================
// Elementary error-per-step controller:
//
//     factor = safety * norm^(-1/(p+1))
//     accepted (norm <= 1): h_next  = h * clamp(factor, min_growth, max_growth)
//     rejected (norm >  1): h_retry = h * clamp(factor, max_shrink, 1)
//
// Step sizes carry the sign of the integration direction. |h| is capped by
// max_step_size; a proposal below min_step_size is flagged as underflow.
// The controller holds no history between attempts.
// =============================================================================

#include "kutta/v1/numeric_types.hpp"
#include "kutta/v1/options.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace kutta::v1 {

enum class ControllerState {
    Proposing,
    Accepted,
    Rejected
};

[[nodiscard]] constexpr const char* to_string(ControllerState state) noexcept {
    switch (state) {
        case ControllerState::Proposing: return "Proposing";
        case ControllerState::Accepted: return "Accepted";
        case ControllerState::Rejected: return "Rejected";
        default: return "Unknown";
    }
}

/// Result of one accept/reject decision
struct StepDecision {
    bool accepted = false;
    Real h_new = 0.0;         // h_next when accepted, h_retry when rejected
    Real factor = 1.0;        // h_new / h before the max_step_size cap
    Real error_norm = 0.0;
    bool at_maximum = false;  // Capped by max_step_size
    bool underflow = false;   // |h_new| < min_step_size: fatal
};

class StepController {
public:
    explicit StepController(const IntegratorOptions& opts = {})
        : safety_(opts.safety_factor)
        , min_growth_(opts.min_growth_factor)
        , max_growth_(opts.max_growth_factor)
        , max_shrink_(opts.max_shrink_factor)
        , nonconvergence_shrink_(opts.nonconvergence_shrink_factor)
        , min_step_(opts.min_step_size)
        , max_step_(opts.max_step_size) {}

    /// Enter the Proposing state at the start of an attempt
    void begin_attempt() { state_ = ControllerState::Proposing; }

    /// Decide on an attempt of size h from its scaled error norm.
    /// @param order exponent base p of the error model (tableau order)
    [[nodiscard]] StepDecision decide(Real h, Real error_norm, int order) {
        StepDecision result;
        result.error_norm = error_norm;
        result.accepted = std::isfinite(error_norm) && error_norm <= 1.0;

        const Real exponent = -1.0 / (static_cast<Real>(order) + 1.0);
        if (result.accepted) {
            result.factor = (error_norm == 0.0)
                ? max_growth_
                : std::clamp(safety_ * std::pow(error_norm, exponent), min_growth_, max_growth_);
        } else if (std::isfinite(error_norm)) {
            result.factor = std::clamp(safety_ * std::pow(error_norm, exponent), max_shrink_, 1.0);
        } else {
            result.factor = max_shrink_;
        }

        finish(result, h);
        return result;
    }

    /// Reject an attempt whose implicit stages did not converge
    [[nodiscard]] StepDecision nonconvergence(Real h) {
        StepDecision result;
        result.accepted = false;
        result.error_norm = std::numeric_limits<Real>::infinity();
        result.factor = nonconvergence_shrink_;
        finish(result, h);
        return result;
    }

    /// Apply the max_step_size cap and the direction sign to a magnitude
    [[nodiscard]] Real limit(Real magnitude, Real direction) const {
        const Real capped = std::min(std::abs(magnitude), max_step_);
        return direction < 0.0 ? -capped : capped;
    }

    [[nodiscard]] bool below_minimum(Real h) const { return std::abs(h) < min_step_; }

    [[nodiscard]] ControllerState state() const { return state_; }
    [[nodiscard]] Real min_step_size() const { return min_step_; }
    [[nodiscard]] Real max_step_size() const { return max_step_; }

private:
    void finish(StepDecision& result, Real h) {
        const Real direction = (h < 0.0) ? -1.0 : 1.0;
        const Real proposed = std::abs(h) * result.factor;
        result.at_maximum = proposed > max_step_;
        result.h_new = limit(proposed, direction);
        result.underflow = below_minimum(result.h_new);
        state_ = result.accepted ? ControllerState::Accepted : ControllerState::Rejected;
    }

    Real safety_;
    Real min_growth_;
    Real max_growth_;
    Real max_shrink_;
    Real nonconvergence_shrink_;
    Real min_step_;
    Real max_step_;
    ControllerState state_ = ControllerState::Proposing;
};

}  // namespace kutta::v1
