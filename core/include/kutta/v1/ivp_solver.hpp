#pragma once

// =============================================================================
// Kutta v1 - Initial Value Problem Solvers
// =============================================================================
// - FixedStepper / IVPSolver: constant step, last step shortened to land on
//   t_end exactly
// - AdaptiveStepper / IVPEmbeddedSolver: embedded error control with
//   accept/reject/resize; rejected attempts never touch (t, y)
//
// Solvers are immutable configurations (tableau + options). Each call to
// integrate() creates an independent stepper wrapped in a lazy Trajectory
// with its own state, stages and controller. Solves on different threads may
// share one solver or one Tableau; the only shared mutable object is the
// solver's StepLogger, which locks internally.
// Integration runs backwards when t_end < t0.
// =============================================================================

#include "kutta/v1/error_estimator.hpp"
#include "kutta/v1/options.hpp"
#include "kutta/v1/stage_evaluator.hpp"
#include "kutta/v1/step_controller.hpp"
#include "kutta/v1/step_log.hpp"
#include "kutta/v1/tableau.hpp"
#include "kutta/v1/trajectory.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace kutta::v1 {

/// Everything a stepper shares with the solver that created it
template<StateVector State>
struct StepperConfig {
    std::shared_ptr<const Tableau> tableau;
    IntegratorOptions options;
    JacobianFunction<State> jacobian;
    std::shared_ptr<StepLogger> logger;
};

namespace detail {

/// Reject malformed solve requests before any sample is produced
template<StateVector State>
void validate_request(Real t0, const State& y0, Real t_end) {
    if (state_size(y0) == 0) {
        throw ConfigurationError(ConfigurationErrorCode::InvalidInitialState,
                                 "Initial state must have at least one component");
    }
    if (!all_finite(y0)) {
        throw ConfigurationError(ConfigurationErrorCode::InvalidInitialState,
                                 "Initial state contains non-finite values");
    }
    if (!std::isfinite(t0) || !std::isfinite(t_end)) {
        throw ConfigurationError(ConfigurationErrorCode::InvalidTimeSpan,
                                 "Time span must be finite");
    }
    if (t0 == t_end) {
        throw ConfigurationError(ConfigurationErrorCode::InvalidTimeSpan,
                                 "Time span must have non-zero length");
    }
}

/// RMS norm of v scaled by atol + rtol * |y|
template<StateVector State>
[[nodiscard]] Real scaled_rms(const State& v, const State& y, Real atol, Real rtol) {
    using Traits = state_traits<State>;
    const Index n = Traits::size(v);
    Real sum = 0.0;
    for (Index i = 0; i < n; ++i) {
        const Real scale = atol + rtol * std::abs(Traits::component(y, i));
        const Real r = Traits::component(v, i) / scale;
        sum += r * r;
    }
    return std::sqrt(sum / static_cast<Real>(n));
}

/// True when a step of size h from t covers the remaining span up to rounding
/// of the time coordinate
[[nodiscard]] inline bool reaches_end(Real remaining, Real h, Real t, Real t_end) {
    constexpr Real kRelativeSlack = 1e-10;
    constexpr Real kRoundingUlps = 64.0;
    const Real slack = kRelativeSlack * std::abs(h) +
        kRoundingUlps * std::numeric_limits<Real>::epsilon() *
            std::max(std::abs(t), std::abs(t_end));
    return std::abs(remaining) <= std::abs(h) + slack;
}

/// Starting step magnitude from |y0|, |f(t0, y0)| and one trial Euler step
/// (Hairer, Norsett & Wanner, Solving ODEs I, II.4).
template<StateVector State>
[[nodiscard]] Real starting_step_size(const VectorField<State>& field, Real t0, const State& y0,
                                      Real direction, int order, const IntegratorOptions& opts,
                                      std::size_t& field_evaluations) {
    const Real atol = opts.absolute_tolerance;
    const Real rtol = opts.relative_tolerance;

    const State f0 = field(t0, y0);
    ++field_evaluations;

    const Real d0 = scaled_rms(y0, y0, atol, rtol);
    const Real d1 = scaled_rms(f0, y0, atol, rtol);
    Real h0 = (d0 < 1e-5 || d1 < 1e-5) ? 1e-6 : 0.01 * d0 / d1;
    if (!std::isfinite(h0)) h0 = 1e-6;

    State y1 = y0;
    state_traits<State>::axpy(y1, direction * h0, f0);
    const State f1 = field(t0 + direction * h0, y1);
    ++field_evaluations;

    State df = f1;
    state_traits<State>::axpy(df, -1.0, f0);
    const Real d2 = scaled_rms(df, y0, atol, rtol) / h0;

    const Real dmax = std::max(d1, d2);
    Real h1 = (!std::isfinite(dmax) || dmax <= 1e-15)
        ? std::max(1e-6, h0 * 1e-3)
        : std::pow(0.01 / dmax, 1.0 / (static_cast<Real>(order) + 1.0));

    return std::min(100.0 * h0, h1);
}

}  // namespace detail

// =============================================================================
// Fixed Stepper
// =============================================================================

template<StateVector StateT, LinearSolverPolicy LinearPolicy = DenseLUPolicy>
class FixedStepper {
public:
    using State = StateT;
    using Field = VectorField<State>;

    FixedStepper(StepperConfig<State> config, Field field, Real t0, State y0, Real t_end,
                 Real step_size)
        : config_(std::move(config))
        , field_(std::move(field))
        , evaluator_(config_.options)
        , t0_(t0)
        , y0_(y0)
        , t_end_(t_end)
        , direction_(t_end >= t0 ? 1.0 : -1.0)
        , anchor_t_(t0) {
        state_.t = t0;
        state_.y = std::move(y0);
        state_.h = direction_ * std::abs(step_size);
        if (config_.jacobian) {
            evaluator_.set_jacobian(config_.jacobian);
        }
    }

    [[nodiscard]] Sample<State> initial() const { return {t0_, y0_}; }

    /// Advance by h (any sign) from the current state, ignoring t_end.
    /// @return false if the step failed; the state is then left unchanged
    ///         and status() reports why
    [[nodiscard]] bool step(Real h) {
        if (!advance(h)) {
            return false;
        }
        state_.t += h;
        anchor_t_ = state_.t;
        anchor_steps_ = 0;
        return true;
    }

    /// Next accepted sample, or nullopt once t_end was reached or a step failed
    [[nodiscard]] std::optional<Sample<State>> next() {
        if (status_ != IntegrationStatus::Running) {
            return std::nullopt;
        }

        const Real remaining = t_end_ - state_.t;
        if (direction_ * remaining <= 0.0) {
            status_ = IntegrationStatus::Completed;
            return std::nullopt;
        }

        Real h = state_.h;
        const bool landing = detail::reaches_end(remaining, h, state_.t, t_end_);
        if (landing) {
            h = remaining;
        }

        if (!advance(h)) {
            return std::nullopt;
        }

        if (landing) {
            state_.t = t_end_;
            status_ = IntegrationStatus::Completed;
            message_ = "Reached t_end";
        } else {
            // t0 + n h, so rounding does not accumulate over long runs
            ++anchor_steps_;
            state_.t = anchor_t_ + static_cast<Real>(anchor_steps_) * state_.h;
        }
        return Sample<State>{state_.t, state_.y};
    }

    void fail(IntegrationStatus status, std::string message) {
        status_ = status;
        message_ = std::move(message);
    }

    [[nodiscard]] const SolverState<State>& state() const { return state_; }
    [[nodiscard]] Real step_size() const { return state_.h; }
    [[nodiscard]] IntegrationStatus status() const { return status_; }
    [[nodiscard]] const std::string& message() const { return message_; }
    [[nodiscard]] const SolveStatistics& statistics() const { return stats_; }

private:
    /// One step of size h from (t, y); y is updated, t is left to the caller
    [[nodiscard]] bool advance(Real h) {
        const Tableau& tableau = *config_.tableau;
        const StageSet<State>* warm =
            (config_.options.warm_start_implicit && !previous_stages_.empty())
                ? &previous_stages_ : nullptr;
        auto evaluation = evaluator_.evaluate(field_, state_.t, state_.y, h, tableau, warm);
        stats_.field_evaluations += static_cast<std::size_t>(evaluation.field_evaluations);
        stats_.implicit_iterations += static_cast<std::size_t>(evaluation.implicit_iterations);

        if (!evaluation.converged()) {
            ++stats_.nonconvergent_attempts;
            log(h, StepEvent::NonConvergence, evaluation.implicit_iterations);
            fail(IntegrationStatus::SolverStalled,
                 "Implicit stages did not converge at t = " + std::to_string(state_.t) + " (" +
                     to_string(evaluation.status) + "): " + evaluation.message);
            return false;
        }

        State candidate = combine_stages(state_.y, h, evaluation.stages, tableau.weights());
        if (!all_finite(candidate)) {
            log(h, StepEvent::Rejected, evaluation.implicit_iterations);
            fail(IntegrationStatus::NonFiniteState,
                 "Non-finite state after step from t = " + std::to_string(state_.t));
            return false;
        }

        log(h, StepEvent::Accepted, evaluation.implicit_iterations);
        state_.y = std::move(candidate);
        ++stats_.accepted_steps;
        if (config_.options.warm_start_implicit) {
            previous_stages_ = std::move(evaluation.stages);
        }
        return true;
    }

    void log(Real h, StepEvent event, int iterations) {
        if (config_.logger) {
            config_.logger->log(state_.t, h, 0.0, event, iterations);
        }
    }

    StepperConfig<State> config_;
    Field field_;
    StageEvaluator<State, LinearPolicy> evaluator_;
    Real t0_;
    State y0_;
    Real t_end_;
    Real direction_;
    Real anchor_t_;                 // Time of the last off-grid step (t0 initially)
    std::size_t anchor_steps_ = 0;  // Nominal steps taken since anchor_t_
    SolverState<State> state_;
    StageSet<State> previous_stages_;
    SolveStatistics stats_;
    IntegrationStatus status_ = IntegrationStatus::Running;
    std::string message_;
};

// =============================================================================
// Adaptive Stepper
// =============================================================================

template<StateVector StateT, LinearSolverPolicy LinearPolicy = DenseLUPolicy>
class AdaptiveStepper {
public:
    using State = StateT;
    using Field = VectorField<State>;

    AdaptiveStepper(StepperConfig<State> config, Field field, Real t0, State y0, Real t_end)
        : config_(std::move(config))
        , field_(std::move(field))
        , evaluator_(config_.options)
        , estimator_(config_.options.absolute_tolerance, config_.options.relative_tolerance)
        , controller_(config_.options)
        , t0_(t0)
        , y0_(y0)
        , t_end_(t_end)
        , direction_(t_end >= t0 ? 1.0 : -1.0) {
        state_.t = t0;
        state_.y = std::move(y0);
        if (config_.options.initial_step_size > 0.0) {
            state_.h = controller_.limit(config_.options.initial_step_size, direction_);
        }
        if (config_.jacobian) {
            evaluator_.set_jacobian(config_.jacobian);
        }
    }

    [[nodiscard]] Sample<State> initial() const { return {t0_, y0_}; }

    /// One attempt from the current state with the proposed step size.
    /// Accepted: (t, y) advance and the next step size is adopted.
    /// Rejected: (t, y) are untouched and the step size shrinks.
    [[nodiscard]] StepDecision attempt() {
        const Tableau& tableau = *config_.tableau;
        const IntegratorOptions& opts = config_.options;

        if (state_.h == 0.0) {
            const Real h = detail::starting_step_size(field_, state_.t, state_.y, direction_,
                                                      tableau.order(), opts,
                                                      stats_.field_evaluations);
            state_.h = controller_.limit(std::max(h, controller_.min_step_size()), direction_);
        }

        controller_.begin_attempt();

        Real h = state_.h;
        const Real remaining = t_end_ - state_.t;
        const bool landing = detail::reaches_end(remaining, h, state_.t, t_end_);
        if (landing) {
            h = remaining;
        }

        const StageSet<State>* warm =
            (opts.warm_start_implicit && !previous_stages_.empty()) ? &previous_stages_ : nullptr;
        auto evaluation = evaluator_.evaluate(field_, state_.t, state_.y, h, tableau, warm);
        stats_.field_evaluations += static_cast<std::size_t>(evaluation.field_evaluations);
        stats_.implicit_iterations += static_cast<std::size_t>(evaluation.implicit_iterations);

        if (!evaluation.converged()) {
            return handle_nonconvergence(h, evaluation);
        }
        consecutive_nonconvergence_ = 0;

        State candidate = combine_stages(state_.y, h, evaluation.stages, tableau.weights());
        auto estimate = estimator_.estimate(evaluation.stages, h, tableau, state_.y, candidate);
        const Real norm = all_finite(candidate) ? estimate.norm
                                                : std::numeric_limits<Real>::infinity();
        last_estimate_ = std::move(estimate);

        StepDecision decision = controller_.decide(h, norm, tableau.order());

        if (decision.accepted) {
            log(h, norm, StepEvent::Accepted, evaluation.implicit_iterations);
            state_.t = landing ? t_end_ : state_.t + h;
            state_.y = std::move(candidate);
            ++stats_.accepted_steps;
            if (opts.warm_start_implicit) {
                previous_stages_ = std::move(evaluation.stages);
            }

            if (landing) {
                fail(IntegrationStatus::Completed, "Reached t_end");
            } else {
                state_.h = decision.h_new;
                if (decision.underflow) {
                    underflow(decision.h_new);
                }
            }
            return decision;
        }

        ++stats_.rejected_steps;
        log(h, norm, StepEvent::Rejected, evaluation.implicit_iterations);
        if (decision.underflow) {
            underflow(decision.h_new);
        } else {
            state_.h = decision.h_new;
        }
        return decision;
    }

    /// Next accepted sample, or nullopt once integration ended
    [[nodiscard]] std::optional<Sample<State>> next() {
        while (status_ == IntegrationStatus::Running) {
            if (direction_ * (t_end_ - state_.t) <= 0.0) {
                fail(IntegrationStatus::Completed, "Reached t_end");
                break;
            }

            const StepDecision decision = attempt();
            if (decision.accepted) {
                return Sample<State>{state_.t, state_.y};
            }
        }
        return std::nullopt;
    }

    void fail(IntegrationStatus status, std::string message) {
        status_ = status;
        message_ = std::move(message);
    }

    [[nodiscard]] const SolverState<State>& state() const { return state_; }

    /// Step size the next attempt will use (0 until chosen automatically)
    [[nodiscard]] Real proposed_step_size() const { return state_.h; }

    /// Error estimate of the last attempt that produced stages
    [[nodiscard]] const std::optional<ErrorEstimate<State>>& last_error_estimate() const {
        return last_estimate_;
    }

    [[nodiscard]] ControllerState controller_state() const { return controller_.state(); }
    [[nodiscard]] int consecutive_nonconvergence() const { return consecutive_nonconvergence_; }
    [[nodiscard]] IntegrationStatus status() const { return status_; }
    [[nodiscard]] const std::string& message() const { return message_; }
    [[nodiscard]] const SolveStatistics& statistics() const { return stats_; }

private:
    StepDecision handle_nonconvergence(Real h, const StageEvaluation<State>& evaluation) {
        ++stats_.nonconvergent_attempts;
        ++consecutive_nonconvergence_;
        log(h, std::numeric_limits<Real>::infinity(), StepEvent::NonConvergence,
            evaluation.implicit_iterations);

        StepDecision decision = controller_.nonconvergence(h);
        if (consecutive_nonconvergence_ >= config_.options.max_consecutive_nonconvergence) {
            fail(IntegrationStatus::SolverStalled,
                 "Implicit stages failed to converge " +
                     std::to_string(consecutive_nonconvergence_) +
                     " consecutive times at t = " + std::to_string(state_.t) + " (" +
                     to_string(evaluation.status) + "): " + evaluation.message);
        } else if (decision.underflow) {
            underflow(decision.h_new);
        } else {
            state_.h = decision.h_new;
        }
        return decision;
    }

    void underflow(Real h) {
        log(h, 0.0, StepEvent::Underflow, 0);
        fail(IntegrationStatus::StepSizeUnderflow,
             "Step size " + std::to_string(std::abs(h)) + " below min_step_size " +
                 std::to_string(controller_.min_step_size()) + " at t = " +
                 std::to_string(state_.t));
    }

    void log(Real h, Real norm, StepEvent event, int iterations) {
        if (config_.logger) {
            config_.logger->log(state_.t, h, norm, event, iterations);
        }
    }

    StepperConfig<State> config_;
    Field field_;
    StageEvaluator<State, LinearPolicy> evaluator_;
    ErrorEstimator estimator_;
    StepController controller_;
    Real t0_;
    State y0_;
    Real t_end_;
    Real direction_;
    SolverState<State> state_;
    StageSet<State> previous_stages_;
    std::optional<ErrorEstimate<State>> last_estimate_;
    int consecutive_nonconvergence_ = 0;
    SolveStatistics stats_;
    IntegrationStatus status_ = IntegrationStatus::Running;
    std::string message_;
};

// =============================================================================
// Solver Front Ends
// =============================================================================

namespace detail {

inline std::shared_ptr<const Tableau> require_tableau(std::shared_ptr<const Tableau> tableau) {
    if (!tableau) {
        throw ConfigurationError(ConfigurationErrorCode::EmptyTableau, "Tableau is null");
    }
    return tableau;
}

template<typename Stepper>
[[nodiscard]] typename Stepper::State finish_solve_to(Trajectory<Stepper> trajectory) {
    std::optional<typename Stepper::State> last;
    for (const auto& sample : trajectory) {
        last = sample.y;
    }
    if (trajectory.status() != IntegrationStatus::Completed) {
        throw IntegrationError(trajectory.status(), trajectory.message());
    }
    return *last;
}

}  // namespace detail

/// Fixed-step Runge-Kutta solver
template<StateVector StateT = Vector, LinearSolverPolicy LinearPolicy = DenseLUPolicy>
class IVPSolver {
public:
    using State = StateT;
    using Field = VectorField<State>;
    using Stepper = FixedStepper<State, LinearPolicy>;

    IVPSolver(std::shared_ptr<const Tableau> tableau, Real step_size,
              IntegratorOptions options = IntegratorOptions::defaults())
        : tableau_(detail::require_tableau(std::move(tableau)))
        , options_(std::move(options))
        , step_size_(step_size)
        , logger_(std::make_shared<StepLogger>()) {
        options_.validate();
        if (!std::isfinite(step_size_) || step_size_ <= 0.0) {
            throw ConfigurationError(ConfigurationErrorCode::InvalidStepSize,
                                     "Fixed step size must be finite and > 0");
        }
    }

    IVPSolver(Tableau tableau, Real step_size,
              IntegratorOptions options = IntegratorOptions::defaults())
        : IVPSolver(std::make_shared<const Tableau>(std::move(tableau)), step_size,
                    std::move(options)) {}

    /// Jacobian used by Newton-mode implicit stages
    void set_jacobian(JacobianFunction<State> jacobian) { jacobian_ = std::move(jacobian); }

    /// Shared by every trajectory this solver creates
    [[nodiscard]] StepLogger& logger() { return *logger_; }

    [[nodiscard]] const Tableau& tableau() const { return *tableau_; }
    [[nodiscard]] const IntegratorOptions& options() const { return options_; }
    [[nodiscard]] Real step_size() const { return step_size_; }

    /// Single-step access without a target time
    [[nodiscard]] std::unique_ptr<Stepper> stepper(Field field, Real t0, State y0,
                                                   Real t_end) const {
        detail::validate_request(t0, y0, t_end);
        return std::make_unique<Stepper>(config(), std::move(field), t0, std::move(y0), t_end,
                                         step_size_);
    }

    /// Lazy sequence of (t, y) from (t0, y0) to t_end
    [[nodiscard]] Trajectory<Stepper> integrate(Field field, Real t0, State y0, Real t_end) const {
        return Trajectory<Stepper>(stepper(std::move(field), t0, std::move(y0), t_end));
    }

    [[nodiscard]] SolveResult<State> solve(Field field, Real t0, State y0, Real t_end) const {
        return collect(integrate(std::move(field), t0, std::move(y0), t_end));
    }

    /// State at t_end. @throws IntegrationError on a fatal status
    [[nodiscard]] State solve_to(Field field, Real t0, State y0, Real t_end) const {
        return detail::finish_solve_to(integrate(std::move(field), t0, std::move(y0), t_end));
    }

private:
    [[nodiscard]] StepperConfig<State> config() const {
        return {tableau_, options_, jacobian_, logger_};
    }

    std::shared_ptr<const Tableau> tableau_;
    IntegratorOptions options_;
    Real step_size_;
    JacobianFunction<State> jacobian_;
    std::shared_ptr<StepLogger> logger_;
};

/// Adaptive Runge-Kutta solver driven by an embedded error estimate
template<StateVector StateT = Vector, LinearSolverPolicy LinearPolicy = DenseLUPolicy>
class IVPEmbeddedSolver {
public:
    using State = StateT;
    using Field = VectorField<State>;
    using Stepper = AdaptiveStepper<State, LinearPolicy>;

    /// @throws ConfigurationError (MissingEmbeddedMethod) when the tableau
    ///         has no embedded weights
    explicit IVPEmbeddedSolver(std::shared_ptr<const Tableau> tableau,
                               IntegratorOptions options = IntegratorOptions::defaults())
        : tableau_(detail::require_tableau(std::move(tableau)))
        , options_(std::move(options))
        , logger_(std::make_shared<StepLogger>()) {
        options_.validate();
        if (!tableau_->has_embedded_method()) {
            throw ConfigurationError(ConfigurationErrorCode::MissingEmbeddedMethod,
                                     "Adaptive stepping needs embedded weights; tableau '" +
                                         tableau_->name() + "' has none");
        }
    }

    explicit IVPEmbeddedSolver(Tableau tableau,
                               IntegratorOptions options = IntegratorOptions::defaults())
        : IVPEmbeddedSolver(std::make_shared<const Tableau>(std::move(tableau)),
                            std::move(options)) {}

    void set_jacobian(JacobianFunction<State> jacobian) { jacobian_ = std::move(jacobian); }

    [[nodiscard]] StepLogger& logger() { return *logger_; }

    [[nodiscard]] const Tableau& tableau() const { return *tableau_; }
    [[nodiscard]] const IntegratorOptions& options() const { return options_; }

    [[nodiscard]] std::unique_ptr<Stepper> stepper(Field field, Real t0, State y0,
                                                   Real t_end) const {
        detail::validate_request(t0, y0, t_end);
        return std::make_unique<Stepper>(config(), std::move(field), t0, std::move(y0), t_end);
    }

    [[nodiscard]] Trajectory<Stepper> integrate(Field field, Real t0, State y0, Real t_end) const {
        return Trajectory<Stepper>(stepper(std::move(field), t0, std::move(y0), t_end));
    }

    [[nodiscard]] SolveResult<State> solve(Field field, Real t0, State y0, Real t_end) const {
        return collect(integrate(std::move(field), t0, std::move(y0), t_end));
    }

    [[nodiscard]] State solve_to(Field field, Real t0, State y0, Real t_end) const {
        return detail::finish_solve_to(integrate(std::move(field), t0, std::move(y0), t_end));
    }

private:
    [[nodiscard]] StepperConfig<State> config() const {
        return {tableau_, options_, jacobian_, logger_};
    }

    std::shared_ptr<const Tableau> tableau_;
    IntegratorOptions options_;
    JacobianFunction<State> jacobian_;
    std::shared_ptr<StepLogger> logger_;
};

}  // namespace kutta::v1
