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

// Bulwark Errors - Implementation

#include "errors.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace bulwark::core {

std::string ResilienceErrorCategory::message(int ev) const {
    switch (static_cast<ResilienceErrc>(ev)) {
        case ResilienceErrc::circuit_open:
            return "circuit breaker is open";
        case ResilienceErrc::retry_budget_exceeded:
            return "retry budget exceeded";
        case ResilienceErrc::bulkhead_full:
            return "bulkhead full";
        case ResilienceErrc::bulkhead_timeout:
            return "bulkhead queue wait timed out";
        case ResilienceErrc::rate_limit_exceeded:
            return "rate limit exceeded";
        case ResilienceErrc::all_fallbacks_exhausted:
            return "all fallbacks exhausted";
        case ResilienceErrc::call_timeout:
            return "call timed out";
    }
    return "unknown resilience error";
}

const ResilienceErrorCategory& resilience_category() noexcept {
    static ResilienceErrorCategory instance;
    return instance;
}

std::error_code make_error_code(ResilienceErrc e) noexcept {
    return std::error_code(static_cast<int>(e), resilience_category());
}

ResilienceError::ResilienceError(ResilienceErrc code, std::string dependency,
                                 const std::string& what)
    : std::system_error(make_error_code(code), what)
    , dependency_(std::move(dependency)) {}

CircuitOpenError::CircuitOpenError(std::string dependency, std::chrono::milliseconds retry_after)
    : ResilienceError(ResilienceErrc::circuit_open, dependency,
                      fmt::format("dependency '{}' (retry after {}ms)", dependency,
                                  retry_after.count()))
    , retry_after_(retry_after) {}

RetryBudgetExceededError::RetryBudgetExceededError(std::string dependency,
                                                   double retry_rate_percent,
                                                   double budget_percent)
    : ResilienceError(ResilienceErrc::retry_budget_exceeded, dependency,
                      fmt::format("dependency '{}' (retry rate {:.2f}% exceeds budget {:.2f}%)",
                                  dependency, retry_rate_percent, budget_percent))
    , retry_rate_percent_(retry_rate_percent)
    , budget_percent_(budget_percent) {}

BulkheadFullError::BulkheadFullError(std::string dependency, uint32_t max_concurrent,
                                     uint32_t max_queue_size)
    : ResilienceError(ResilienceErrc::bulkhead_full, dependency,
                      fmt::format("dependency '{}' (max_concurrent {}, max_queue {})", dependency,
                                  max_concurrent, max_queue_size)) {}

BulkheadTimeoutError::BulkheadTimeoutError(std::string dependency,
                                           std::chrono::milliseconds waited)
    : ResilienceError(ResilienceErrc::bulkhead_timeout, dependency,
                      fmt::format("dependency '{}' (queued {}ms)", dependency, waited.count())) {}

RateLimitExceededError::RateLimitExceededError(std::string limiter)
    : ResilienceError(ResilienceErrc::rate_limit_exceeded, limiter,
                      fmt::format("limiter '{}'", limiter)) {}

AllFallbacksExhaustedError::AllFallbacksExhaustedError(std::string dependency,
                                                       std::vector<std::string> failures)
    : ResilienceError(ResilienceErrc::all_fallbacks_exhausted, dependency,
                      fmt::format("dependency '{}' [{}]", dependency,
                                  fmt::join(failures, "; ")))
    , failures_(std::move(failures)) {}

CallTimeoutError::CallTimeoutError(std::string dependency, std::chrono::milliseconds timeout)
    : ResilienceError(ResilienceErrc::call_timeout, dependency,
                      fmt::format("dependency '{}' (deadline {}ms)", dependency, timeout.count()))
    , timeout_(timeout) {}

bool is_policy_rejection(const std::exception& e) noexcept {
    const auto* err = dynamic_cast<const ResilienceError*>(&e);
    if (!err) {
        return false;
    }

    switch (err->errc()) {
        case ResilienceErrc::circuit_open:
        case ResilienceErrc::bulkhead_full:
        case ResilienceErrc::bulkhead_timeout:
        case ResilienceErrc::rate_limit_exceeded:
            return true;
        default:
            return false;
    }
}

}  // namespace bulwark::core
