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

// Bulwark Errors - Header
// Policy-layer error taxonomy (std::system_error with a dedicated category)

#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

namespace bulwark::core {

/// Policy-layer error codes
enum class ResilienceErrc : int {
    circuit_open = 1,
    retry_budget_exceeded,
    bulkhead_full,
    bulkhead_timeout,
    rate_limit_exceeded,
    all_fallbacks_exhausted,
    call_timeout
};

/// Resilience error category for std::error_code
class ResilienceErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override {
        return "resilience";
    }

    [[nodiscard]] std::string message(int ev) const override;
};

/// Get resilience error category instance
[[nodiscard]] const ResilienceErrorCategory& resilience_category() noexcept;

[[nodiscard]] std::error_code make_error_code(ResilienceErrc e) noexcept;

/// Base class for every protective rejection raised by the engine
class ResilienceError : public std::system_error {
public:
    ResilienceError(ResilienceErrc code, std::string dependency, const std::string& what);

    /// Dependency (or limiter) name the error was raised for
    [[nodiscard]] const std::string& dependency() const noexcept { return dependency_; }

    [[nodiscard]] ResilienceErrc errc() const noexcept {
        return static_cast<ResilienceErrc>(code().value());
    }

private:
    std::string dependency_;
};

/// Breaker is OPEN; the unit of work was never invoked
class CircuitOpenError : public ResilienceError {
public:
    CircuitOpenError(std::string dependency, std::chrono::milliseconds retry_after);

    /// Time left until the breaker will admit a trial call
    [[nodiscard]] std::chrono::milliseconds retry_after() const noexcept { return retry_after_; }

private:
    std::chrono::milliseconds retry_after_;
};

/// Aggregate retry ceiling reached; failed fast instead of retrying
class RetryBudgetExceededError : public ResilienceError {
public:
    RetryBudgetExceededError(std::string dependency, double retry_rate_percent,
                             double budget_percent);

    [[nodiscard]] double retry_rate_percent() const noexcept { return retry_rate_percent_; }
    [[nodiscard]] double budget_percent() const noexcept { return budget_percent_; }

private:
    double retry_rate_percent_;
    double budget_percent_;
};

/// Concurrency and queue both saturated; the unit of work was never invoked
class BulkheadFullError : public ResilienceError {
public:
    BulkheadFullError(std::string dependency, uint32_t max_concurrent, uint32_t max_queue_size);
};

/// Queued call was not serviced within the queue timeout
class BulkheadTimeoutError : public ResilienceError {
public:
    BulkheadTimeoutError(std::string dependency, std::chrono::milliseconds waited);
};

/// Limiter denied admission
class RateLimitExceededError : public ResilienceError {
public:
    explicit RateLimitExceededError(std::string limiter);
};

/// Every registered fallback handler failed
class AllFallbacksExhaustedError : public ResilienceError {
public:
    AllFallbacksExhaustedError(std::string dependency, std::vector<std::string> failures);

    /// One "<LEVEL>: <message>" entry per handler that was tried
    [[nodiscard]] const std::vector<std::string>& failures() const noexcept { return failures_; }

private:
    std::vector<std::string> failures_;
};

/// A single attempt exceeded its deadline (retryable)
class CallTimeoutError : public ResilienceError {
public:
    CallTimeoutError(std::string dependency, std::chrono::milliseconds timeout);

    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return timeout_; }

private:
    std::chrono::milliseconds timeout_;
};

/// Underlying failure carrying a transport status code (e.g. HTTP status)
/// Transport clients may throw this so retry classification can use the status.
class StatusError : public std::runtime_error {
public:
    StatusError(uint16_t status, const std::string& message)
        : std::runtime_error(message), status_(status) {}

    [[nodiscard]] uint16_t status() const noexcept { return status_; }

private:
    uint16_t status_;
};

/// True for rejections that never reached the dependency
/// (circuit open, bulkhead full/timeout, rate limit)
[[nodiscard]] bool is_policy_rejection(const std::exception& e) noexcept;

/// Convert error code to string for logging
[[nodiscard]] constexpr std::string_view to_string(ResilienceErrc e) noexcept {
    switch (e) {
        case ResilienceErrc::circuit_open:
            return "circuit_open";
        case ResilienceErrc::retry_budget_exceeded:
            return "retry_budget_exceeded";
        case ResilienceErrc::bulkhead_full:
            return "bulkhead_full";
        case ResilienceErrc::bulkhead_timeout:
            return "bulkhead_timeout";
        case ResilienceErrc::rate_limit_exceeded:
            return "rate_limit_exceeded";
        case ResilienceErrc::all_fallbacks_exhausted:
            return "all_fallbacks_exhausted";
        case ResilienceErrc::call_timeout:
            return "call_timeout";
    }
    return "unknown";
}

}  // namespace bulwark::core

template <>
struct std::is_error_code_enum<bulwark::core::ResilienceErrc> : std::true_type {};
