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

// Bulwark Circuit Breaker - Implementation

#include "circuit_breaker.hpp"

#include <algorithm>
#include <stdexcept>

#include "../core/errors.hpp"
#include "../core/logging.hpp"

namespace bulwark::resilience {

CircuitBreaker::CircuitBreaker(std::string name, CircuitBreakerConfig config,
                               ErrorPredicate expected_errors)
    : name_(std::move(name))
    , config_(config)
    , expected_errors_(std::move(expected_errors))
    , last_state_change_(std::chrono::system_clock::now()) {
    if (config_.failure_threshold == 0) {
        throw std::invalid_argument("circuit breaker failure_threshold must be > 0");
    }
    if (config_.success_threshold == 0) {
        throw std::invalid_argument("circuit breaker success_threshold must be > 0");
    }
}

bool CircuitBreaker::counts_as_failure(const std::exception& error) const {
    if (expected_errors_) {
        return expected_errors_(error);
    }
    return !core::is_policy_rejection(error);
}

std::optional<std::chrono::milliseconds> CircuitBreaker::admit(
    std::optional<StateChangeEvent>& event, uint64_t& generation) {
    auto now = std::chrono::steady_clock::now();

    std::lock_guard lock(mutex_);

    auto state = state_.load(std::memory_order_relaxed);
    if (state == CircuitState::OPEN) {
        event = try_half_open(now);
        state = state_.load(std::memory_order_relaxed);
    }

    switch (state) {
        case CircuitState::CLOSED:
            break;

        case CircuitState::OPEN: {
            auto open_for = std::chrono::duration_cast<std::chrono::milliseconds>(now - opened_at_);
            auto remaining = std::chrono::milliseconds(config_.timeout_ms) - open_for;
            rejected_calls_.fetch_add(1, std::memory_order_relaxed);
            return std::max(remaining, std::chrono::milliseconds(0));
        }

        case CircuitState::HALF_OPEN:
            if (config_.half_open_max_calls > 0 &&
                half_open_in_flight_ >= config_.half_open_max_calls) {
                rejected_calls_.fetch_add(1, std::memory_order_relaxed);
                return std::chrono::milliseconds(0);
            }
            ++half_open_in_flight_;
            break;
    }

    generation = generation_;
    total_calls_.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
}

CallPermit CircuitBreaker::acquire_permission() {
    std::optional<StateChangeEvent> event;
    CallPermit permit;
    auto rejected = admit(event, permit.generation);
    notify(event);

    if (rejected) {
        throw core::CircuitOpenError(name_, *rejected);
    }
    return permit;
}

bool CircuitBreaker::allow_request() {
    std::optional<StateChangeEvent> event;
    uint64_t generation = 0;
    auto rejected = admit(event, generation);
    notify(event);
    return !rejected.has_value();
}

void CircuitBreaker::release_trial_slot() {
    if (half_open_in_flight_ > 0) {
        --half_open_in_flight_;
    }
}

void CircuitBreaker::record_success() { on_success(std::nullopt); }
void CircuitBreaker::record_success(CallPermit permit) { on_success(permit.generation); }
void CircuitBreaker::record_failure() { on_failure(std::nullopt); }
void CircuitBreaker::record_failure(CallPermit permit) { on_failure(permit.generation); }
void CircuitBreaker::record_ignored() { on_ignored(std::nullopt); }
void CircuitBreaker::record_ignored(CallPermit permit) { on_ignored(permit.generation); }

void CircuitBreaker::on_success(std::optional<uint64_t> generation) {
    total_successes_.fetch_add(1, std::memory_order_relaxed);

    std::optional<StateChangeEvent> event;
    {
        std::lock_guard lock(mutex_);
        if (is_stale(generation)) {
            // Admitted under an earlier state; holds no trial slot
            return;
        }

        switch (state_.load(std::memory_order_relaxed)) {
            case CircuitState::CLOSED:
                // Failures must be consecutive to trip the breaker
                failure_count_ = 0;
                break;

            case CircuitState::HALF_OPEN:
                release_trial_slot();
                ++success_count_;
                if (success_count_ >= config_.success_threshold) {
                    event = transition_to(CircuitState::CLOSED, "recovery successful");
                }
                break;

            case CircuitState::OPEN:
                // Late completion of a call admitted before the circuit opened
                break;
        }
    }
    notify(event);
}

void CircuitBreaker::on_failure(std::optional<uint64_t> generation) {
    total_failures_.fetch_add(1, std::memory_order_relaxed);

    std::optional<StateChangeEvent> event;
    {
        std::lock_guard lock(mutex_);
        last_failure_time_ = std::chrono::system_clock::now();
        if (is_stale(generation)) {
            return;
        }

        switch (state_.load(std::memory_order_relaxed)) {
            case CircuitState::CLOSED:
                ++failure_count_;
                if (failure_count_ >= config_.failure_threshold) {
                    event = transition_to(CircuitState::OPEN, "failure threshold reached");
                }
                break;

            case CircuitState::HALF_OPEN:
                release_trial_slot();
                event = transition_to(CircuitState::OPEN, "recovery test failed");
                break;

            case CircuitState::OPEN:
                break;
        }
    }
    notify(event);
}

void CircuitBreaker::on_ignored(std::optional<uint64_t> generation) {
    std::lock_guard lock(mutex_);
    if (!is_stale(generation) &&
        state_.load(std::memory_order_relaxed) == CircuitState::HALF_OPEN) {
        release_trial_slot();
    }
}

void CircuitBreaker::force_open() {
    std::optional<StateChangeEvent> event;
    {
        std::lock_guard lock(mutex_);
        if (state_.load(std::memory_order_relaxed) != CircuitState::OPEN) {
            event = transition_to(CircuitState::OPEN, "forced open");
        }
    }
    notify(event);
}

void CircuitBreaker::reset() {
    std::optional<StateChangeEvent> event;
    {
        std::lock_guard lock(mutex_);
        if (state_.load(std::memory_order_relaxed) != CircuitState::CLOSED) {
            event = transition_to(CircuitState::CLOSED, "manual reset");
        }
        failure_count_ = 0;
        success_count_ = 0;
        half_open_in_flight_ = 0;
        ++generation_;
        last_failure_time_.reset();
    }
    notify(event);
}

void CircuitBreaker::set_on_state_change(std::function<void(const StateChangeEvent&)> cb) {
    std::lock_guard lock(mutex_);
    on_state_change_ = std::move(cb);
}

CircuitBreakerStats CircuitBreaker::stats() const {
    CircuitBreakerStats s;
    {
        std::lock_guard lock(mutex_);
        s.state = state_.load(std::memory_order_relaxed);
        s.failure_count = failure_count_;
        s.success_count = success_count_;
        s.last_failure_time = last_failure_time_;
        s.last_state_change = last_state_change_;
    }
    s.total_calls = total_calls_.load(std::memory_order_relaxed);
    s.total_successes = total_successes_.load(std::memory_order_relaxed);
    s.total_failures = total_failures_.load(std::memory_order_relaxed);
    s.rejected_calls = rejected_calls_.load(std::memory_order_relaxed);
    s.state_transitions = state_transitions_.load(std::memory_order_relaxed);
    return s;
}

std::optional<StateChangeEvent> CircuitBreaker::try_half_open(
    std::chrono::steady_clock::time_point now) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - opened_at_);
    if (elapsed.count() < static_cast<int64_t>(config_.timeout_ms)) {
        return std::nullopt;
    }
    return transition_to(CircuitState::HALF_OPEN, "open timeout elapsed");
}

std::optional<StateChangeEvent> CircuitBreaker::transition_to(CircuitState new_state,
                                                              std::string_view reason) {
    auto old_state = state_.load(std::memory_order_relaxed);
    if (old_state == new_state) {
        return std::nullopt;
    }

    state_.store(new_state, std::memory_order_release);
    ++generation_;
    state_transitions_.fetch_add(1, std::memory_order_relaxed);
    last_state_change_ = std::chrono::system_clock::now();

    if (old_state == CircuitState::HALF_OPEN) {
        success_count_ = 0;
        half_open_in_flight_ = 0;
    }

    switch (new_state) {
        case CircuitState::CLOSED:
            failure_count_ = 0;
            break;
        case CircuitState::OPEN:
            opened_at_ = std::chrono::steady_clock::now();
            break;
        case CircuitState::HALF_OPEN:
            success_count_ = 0;
            half_open_in_flight_ = 0;
            break;
    }

    auto* logger = logging::get_logger();
    if (new_state == CircuitState::OPEN) {
        LOG_WARNING(logger, "Circuit breaker {} -> {}: dependency={}, reason={}",
                    to_string(old_state), to_string(new_state), name_, reason);
    } else {
        LOG_TRANSITION(logger, name_, to_string(old_state), to_string(new_state), reason);
    }

    return StateChangeEvent{old_state, new_state, last_state_change_, name_};
}

void CircuitBreaker::notify(const std::optional<StateChangeEvent>& event) {
    if (!event) {
        return;
    }

    std::function<void(const StateChangeEvent&)> cb;
    {
        std::lock_guard lock(mutex_);
        cb = on_state_change_;
    }
    if (cb) {
        cb(*event);
    }
}

}  // namespace bulwark::resilience
