/*
 * Copyright 2025 Bulwark Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Bulwark Circuit Breaker - Header
// Stops calling a failing dependency for a cooldown period

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace bulwark::resilience {

/// Circuit breaker state
enum class CircuitState : uint8_t {
    CLOSED,     // Normal operation, calls pass through
    OPEN,       // Dependency failing, calls rejected without being attempted
    HALF_OPEN   // Timeout elapsed, trial calls allowed
};

/// Circuit breaker configuration
struct CircuitBreakerConfig {
    /// Consecutive failures while CLOSED to open the circuit
    uint32_t failure_threshold = 5;

    /// Consecutive successes while HALF_OPEN to close the circuit
    uint32_t success_threshold = 3;

    /// Time in milliseconds spent OPEN before the next call is let through
    uint32_t timeout_ms = 60000;

    /// Concurrent trial calls admitted while HALF_OPEN (0 = unlimited)
    uint32_t half_open_max_calls = 3;
};

/// Point-in-time view of a breaker, readable without invoking the protected call
struct CircuitBreakerStats {
    CircuitState state = CircuitState::CLOSED;
    uint32_t failure_count = 0;
    uint32_t success_count = 0;
    std::optional<std::chrono::system_clock::time_point> last_failure_time;
    std::chrono::system_clock::time_point last_state_change;

    uint64_t total_calls = 0;
    uint64_t total_successes = 0;
    uint64_t total_failures = 0;
    uint64_t rejected_calls = 0;
    uint64_t state_transitions = 0;

    [[nodiscard]] double failure_rate() const noexcept {
        if (total_calls == 0) return 0.0;
        return static_cast<double>(total_failures) / static_cast<double>(total_calls);
    }
};

/// Structured event emitted on every state transition
struct StateChangeEvent {
    CircuitState from;
    CircuitState to;
    std::chrono::system_clock::time_point timestamp;
    std::string dependency;
};

/// Admission handed out by acquire_permission(). Each state transition starts a
/// new generation; an outcome recorded with a permit from an older generation
/// only updates the cumulative metrics.
struct CallPermit {
    uint64_t generation = 0;
};

/// Decides whether an error counts toward breaker state
using ErrorPredicate = std::function<bool(const std::exception&)>;

/// Circuit breaker for one dependency
///
/// State machine:
///   CLOSED → OPEN (failure_threshold consecutive failures)
///   OPEN → HALF_OPEN (timeout_ms elapsed, evaluated lazily on the next call)
///   HALF_OPEN → CLOSED (success_threshold consecutive successes)
///   HALF_OPEN → OPEN (any failure)
///
/// Thread-safety: state and counters are guarded by one mutex per breaker.
/// Cumulative metrics are atomic for lock-free observability.
class CircuitBreaker {
public:
    /// @param expected_errors Errors for which this returns true count as failures;
    ///        others propagate without touching state. Defaults to every error
    ///        except policy rejections.
    explicit CircuitBreaker(std::string name, CircuitBreakerConfig config = {},
                            ErrorPredicate expected_errors = {});
    ~CircuitBreaker() = default;

    // Non-copyable, non-movable (owns a mutex, shared through the registry)
    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /// Run fn through the breaker.
    /// Throws CircuitOpenError without invoking fn while OPEN; otherwise
    /// invokes fn, records the outcome and rethrows fn's error unchanged.
    template <typename Fn>
    std::invoke_result_t<Fn&> call(Fn&& fn);

    /// Admit a call or throw CircuitOpenError
    CallPermit acquire_permission();

    /// Non-throwing admission check (a rejection is still counted)
    [[nodiscard]] bool allow_request();

    /// Record successful call completion against the current state
    void record_success();
    void record_success(CallPermit permit);

    /// Record a qualifying failure against the current state
    void record_failure();
    void record_failure(CallPermit permit);

    /// Record a completed call whose error does not count (releases a trial slot)
    void record_ignored();
    void record_ignored(CallPermit permit);

    /// Whether this error counts toward breaker state
    [[nodiscard]] bool counts_as_failure(const std::exception& error) const;

    /// Force circuit to OPEN state (used by health checks)
    void force_open();

    /// Return to CLOSED and clear counters
    void reset();

    /// Register callback for state transitions (invoked outside the lock)
    void set_on_state_change(std::function<void(const StateChangeEvent&)> cb);

    [[nodiscard]] CircuitState get_state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] CircuitBreakerStats stats() const;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    [[nodiscard]] const CircuitBreakerConfig& config() const noexcept { return config_; }

private:
    /// Transition to new state; caller holds mutex_
    std::optional<StateChangeEvent> transition_to(CircuitState new_state, std::string_view reason);

    /// OPEN → HALF_OPEN when the timeout has elapsed; caller holds mutex_
    std::optional<StateChangeEvent> try_half_open(std::chrono::steady_clock::time_point now);

    /// Reserve a call slot; returns remaining OPEN time when rejected
    std::optional<std::chrono::milliseconds> admit(std::optional<StateChangeEvent>& event,
                                                   uint64_t& generation);

    void on_success(std::optional<uint64_t> generation);
    void on_failure(std::optional<uint64_t> generation);
    void on_ignored(std::optional<uint64_t> generation);

    /// Whether an outcome belongs to an earlier state period; caller holds mutex_
    [[nodiscard]] bool is_stale(std::optional<uint64_t> generation) const noexcept {
        return generation.has_value() && *generation != generation_;
    }

    void release_trial_slot();
    void notify(const std::optional<StateChangeEvent>& event);

    std::string name_;
    CircuitBreakerConfig config_;
    ErrorPredicate expected_errors_;

    mutable std::mutex mutex_;
    std::atomic<CircuitState> state_{CircuitState::CLOSED};
    uint32_t failure_count_ = 0;
    uint32_t success_count_ = 0;
    uint32_t half_open_in_flight_ = 0;
    uint64_t generation_ = 0;
    std::chrono::steady_clock::time_point opened_at_;
    std::optional<std::chrono::system_clock::time_point> last_failure_time_;
    std::chrono::system_clock::time_point last_state_change_;

    std::function<void(const StateChangeEvent&)> on_state_change_;

    // Metrics (atomic for cross-thread observability)
    std::atomic<uint64_t> total_calls_{0};
    std::atomic<uint64_t> total_successes_{0};
    std::atomic<uint64_t> total_failures_{0};
    std::atomic<uint64_t> rejected_calls_{0};
    std::atomic<uint64_t> state_transitions_{0};
};

template <typename Fn>
std::invoke_result_t<Fn&> CircuitBreaker::call(Fn&& fn) {
    using Result = std::invoke_result_t<Fn&>;

    CallPermit permit = acquire_permission();

    try {
        if constexpr (std::is_void_v<Result>) {
            fn();
            record_success(permit);
        } else {
            Result result = fn();
            record_success(permit);
            return result;
        }
    } catch (const std::exception& e) {
        if (counts_as_failure(e)) {
            record_failure(permit);
        } else {
            record_ignored(permit);
        }
        throw;
    } catch (...) {
        record_ignored(permit);
        throw;
    }
}

/// Convert circuit state to string for logging
[[nodiscard]] constexpr std::string_view to_string(CircuitState state) noexcept {
    switch (state) {
        case CircuitState::CLOSED:
            return "CLOSED";
        case CircuitState::OPEN:
            return "OPEN";
        case CircuitState::HALF_OPEN:
            return "HALF_OPEN";
    }
    return "UNKNOWN";
}

}  // namespace bulwark::resilience
