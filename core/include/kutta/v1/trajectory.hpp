#pragma once

// =============================================================================
// Kutta v1 - Lazy Trajectories
// =============================================================================
// A Trajectory owns one stepper and exposes its accepted (t, y) samples as a
// single-pass input range. Steps are computed only when the iterator is
// advanced; the first sample is the initial condition. The range cannot be
// restarted: a second begin() resumes where the previous iteration stopped.
//
// Stepper requirements:
//   using State = ...;
//   Sample<State> initial() const;
//   std::optional<Sample<State>> next();   // nullopt once integration ended
//   IntegrationStatus status() const;
//   const std::string& message() const;
//   const SolveStatistics& statistics() const;
//   void fail(IntegrationStatus, std::string);
// =============================================================================

#include "kutta/v1/concepts.hpp"
#include "kutta/v1/errors.hpp"

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kutta::v1 {

/// Mutable stepping state, advanced only when a step is accepted
template<StateVector State>
struct SolverState {
    Real t = 0.0;
    State y;
    Real h = 0.0;  // Signed step size for the next attempt
};

/// One accepted point of a trajectory
template<StateVector State>
struct Sample {
    Real t = 0.0;
    State y;
};

struct SolveStatistics {
    std::size_t accepted_steps = 0;
    std::size_t rejected_steps = 0;
    std::size_t nonconvergent_attempts = 0;
    std::size_t field_evaluations = 0;
    std::size_t implicit_iterations = 0;

    [[nodiscard]] std::size_t total_attempts() const {
        return accepted_steps + rejected_steps + nonconvergent_attempts;
    }
};

// =============================================================================
// Trajectory
// =============================================================================

template<typename Stepper>
class Trajectory {
public:
    using State = typename Stepper::State;
    using value_type = Sample<State>;

    class iterator {
    public:
        using iterator_concept = std::input_iterator_tag;
        using iterator_category = std::input_iterator_tag;
        using value_type = Sample<State>;
        using difference_type = std::ptrdiff_t;
        using pointer = const value_type*;
        using reference = const value_type&;

        iterator() = default;

        [[nodiscard]] reference operator*() const { return *owner_->current_; }
        [[nodiscard]] pointer operator->() const { return &*owner_->current_; }

        iterator& operator++() {
            owner_->advance();
            return *this;
        }

        void operator++(int) { ++*this; }

        [[nodiscard]] friend bool operator==(const iterator& it, std::default_sentinel_t) {
            return it.finished();
        }

    private:
        friend class Trajectory;
        explicit iterator(Trajectory* owner) : owner_(owner) {}

        [[nodiscard]] bool finished() const { return owner_ == nullptr || owner_->done_; }

        Trajectory* owner_ = nullptr;
    };

    explicit Trajectory(std::unique_ptr<Stepper> stepper)
        : stepper_(std::move(stepper)) {}

    Trajectory(Trajectory&&) = default;
    Trajectory& operator=(Trajectory&&) = default;
    Trajectory(const Trajectory&) = delete;
    Trajectory& operator=(const Trajectory&) = delete;

    /// Iterators refer to this object; do not move it while iterating
    [[nodiscard]] iterator begin() {
        if (!started_) {
            started_ = true;
            current_ = stepper_->initial();
        }
        return iterator(this);
    }

    [[nodiscard]] std::default_sentinel_t end() const { return {}; }

    /// Why the sequence ended (Running while samples remain)
    [[nodiscard]] IntegrationStatus status() const { return stepper_->status(); }
    [[nodiscard]] const std::string& message() const { return stepper_->message(); }
    [[nodiscard]] const SolveStatistics& statistics() const { return stepper_->statistics(); }

    [[nodiscard]] Stepper& stepper() { return *stepper_; }
    [[nodiscard]] const Stepper& stepper() const { return *stepper_; }

private:
    void advance() {
        // Stays done if the field throws
        done_ = true;
        std::optional<value_type> next;
        try {
            next = stepper_->next();
        } catch (const FieldEvaluationError& e) {
            stepper_->fail(IntegrationStatus::FieldEvaluationFailure, e.what());
            current_.reset();
            throw;
        }

        if (next) {
            current_ = std::move(next);
            done_ = false;
        } else {
            current_.reset();
        }
    }

    std::unique_ptr<Stepper> stepper_;
    std::optional<value_type> current_;
    bool started_ = false;
    bool done_ = false;
};

// =============================================================================
// Eager Collection
// =============================================================================

template<StateVector State>
struct SolveResult {
    std::vector<Real> time;
    std::vector<State> states;
    bool success = false;
    IntegrationStatus status = IntegrationStatus::Running;
    std::string message;
    SolveStatistics statistics;

    [[nodiscard]] std::size_t size() const { return time.size(); }
    [[nodiscard]] const State& final_state() const { return states.back(); }
    [[nodiscard]] Real final_time() const { return time.back(); }
};

/// Drain a trajectory. A FieldEvaluationError ends collection with status
/// FieldEvaluationFailure; the samples produced before it are kept.
template<typename Stepper>
[[nodiscard]] SolveResult<typename Stepper::State> collect(Trajectory<Stepper> trajectory) {
    SolveResult<typename Stepper::State> result;

    try {
        for (const auto& sample : trajectory) {
            result.time.push_back(sample.t);
            result.states.push_back(sample.y);
        }
    } catch (const FieldEvaluationError&) {
        // status and message were recorded on the stepper
    }

    result.status = trajectory.status();
    result.message = trajectory.message();
    result.success = result.status == IntegrationStatus::Completed;
    result.statistics = trajectory.statistics();
    return result;
}

}  // namespace kutta::v1
