#pragma once

// =============================================================================
// Kutta v1 - Step Logging Hook for Debugging
// =============================================================================
// Per-solver, opt-in record of every step attempt: accepted and rejected
// steps, implicit non-convergence and the fatal step-size floor. Disabled by
// default; enable with set_enabled(true). An Underflow entry trails the
// attempt that hit the floor and is not counted as an attempt.
// =============================================================================

#include "kutta/v1/numeric_types.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace kutta::v1 {

enum class StepEvent {
    Accepted,
    Rejected,
    NonConvergence,
    Underflow
};

[[nodiscard]] constexpr const char* to_string(StepEvent event) noexcept {
    switch (event) {
        case StepEvent::Accepted: return "accepted";
        case StepEvent::Rejected: return "rejected";
        case StepEvent::NonConvergence: return "nonconvergence";
        case StepEvent::Underflow: return "underflow";
        default: return "unknown";
    }
}

/// Step log entry
struct StepLogEntry {
    Real time = 0.0;              // Start of the attempted interval
    Real h = 0.0;                 // Step size attempted
    Real error_norm = 0.0;        // Scaled error norm (0 for fixed steps)
    StepEvent event = StepEvent::Accepted;
    int implicit_iterations = 0;  // 0 for explicit tableaus

    [[nodiscard]] std::string to_csv() const {
        return std::to_string(time) + "," +
               std::to_string(h) + "," +
               std::to_string(error_norm) + "," +
               to_string(event) + "," +
               std::to_string(implicit_iterations);
    }

    [[nodiscard]] static std::string csv_header() {
        return "time,h,error_norm,event,implicit_iterations";
    }
};

using StepLogCallback = std::function<void(const StepLogEntry&)>;

/// Thread-safe: every stepper created by one solver logs into the same
/// instance, so concurrent solves serialize here. The callback runs under the
/// logger's lock and must not call back into the logger.
class StepLogger {
public:
    StepLogger() = default;

    void set_enabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        enabled_ = enabled;
    }

    [[nodiscard]] bool is_enabled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return enabled_;
    }

    void set_callback(StepLogCallback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = std::move(callback);
    }

    /// Log an entry (no-op if disabled)
    void log(const StepLogEntry& entry) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!enabled_) return;

        if (buffer_.size() < max_buffer_size_) {
            buffer_.push_back(entry);
        }

        if (callback_) {
            callback_(entry);
        }

        ++total_entries_;
        // Underflow follows the attempt that triggered it; it is not an attempt itself
        if (entry.event != StepEvent::Underflow) ++attempts_;
        if (entry.event == StepEvent::Rejected || entry.event == StepEvent::NonConvergence) {
            ++rejected_steps_;
        }
        if (std::isfinite(entry.error_norm)) {
            max_error_norm_ = std::max(max_error_norm_, entry.error_norm);
            sum_error_norm_ += entry.error_norm;
            ++finite_entries_;
        }
    }

    void log(Real time, Real h, Real error_norm, StepEvent event, int implicit_iterations = 0) {
        log(StepLogEntry{time, h, error_norm, event, implicit_iterations});
    }

    /// Snapshot of the buffered entries
    [[nodiscard]] std::vector<StepLogEntry> buffer() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return buffer_;
    }

    void clear_buffer() {
        std::lock_guard<std::mutex> lock(mutex_);
        buffer_.clear();
    }

    [[nodiscard]] std::string to_csv() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string result = StepLogEntry::csv_header() + "\n";
        for (const auto& entry : buffer_) {
            result += entry.to_csv() + "\n";
        }
        return result;
    }

    [[nodiscard]] std::size_t total_entries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_entries_;
    }

    /// Rejected and non-convergent attempts
    [[nodiscard]] std::size_t rejected_steps() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return rejected_steps_;
    }

    [[nodiscard]] Real max_error_norm() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return max_error_norm_;
    }

    [[nodiscard]] Real average_error_norm() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return finite_entries_ > 0 ? sum_error_norm_ / static_cast<Real>(finite_entries_) : 0.0;
    }

    /// Fraction of step attempts that were not accepted
    [[nodiscard]] Real rejection_rate() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return attempts_ > 0
            ? static_cast<Real>(rejected_steps_) / static_cast<Real>(attempts_)
            : 0.0;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        buffer_.clear();
        total_entries_ = 0;
        attempts_ = 0;
        rejected_steps_ = 0;
        finite_entries_ = 0;
        max_error_norm_ = 0.0;
        sum_error_norm_ = 0.0;
    }

    void set_max_buffer_size(std::size_t size) {
        std::lock_guard<std::mutex> lock(mutex_);
        max_buffer_size_ = size;
    }

private:
    mutable std::mutex mutex_;
    bool enabled_ = false;
    StepLogCallback callback_;
    std::vector<StepLogEntry> buffer_;
    std::size_t max_buffer_size_ = 10000;

    std::size_t total_entries_ = 0;
    std::size_t attempts_ = 0;
    std::size_t rejected_steps_ = 0;
    std::size_t finite_entries_ = 0;
    Real max_error_norm_ = 0.0;
    Real sum_error_norm_ = 0.0;
};

}  // namespace kutta::v1
