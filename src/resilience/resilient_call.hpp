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

// Bulwark Resilient Call - Header
// Composes Bulkhead -> CircuitBreaker -> Retry (adaptive timeout per attempt) -> Fallback

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "../core/deadline.hpp"
#include "../core/errors.hpp"
#include "../core/logging.hpp"
#include "fallback_chain.hpp"
#include "registry.hpp"

namespace bulwark::resilience {

/// Per-call overrides; unset configs fall back to the registry policy.
/// Configs only take effect when the dependency's component is first created.
struct CallOptions {
    std::optional<CircuitBreakerConfig> circuit_breaker;
    std::optional<RetryConfig> retry;
    std::optional<BulkheadConfig> bulkhead;
    std::optional<TimeoutConfig> timeout;
    std::optional<std::string> idempotency_key;
    std::optional<std::vector<uint16_t>> retry_on_status;
    Priority priority = Priority::NORMAL;
};

/// Builder for one protected call against a named dependency
///
/// Usage:
///   auto user = ResilientCall(registry, "user-db")
///                   .with_idempotency_key(request_id)
///                   .with_priority(Priority::HIGH)
///                   .execute([id](std::stop_token) { return db.load_user(id); });
class ResilientCall {
public:
    ResilientCall(ResilienceRegistry& registry, std::string dependency, CallOptions options = {})
        : registry_(registry), dependency_(std::move(dependency)), options_(std::move(options)) {}

    ResilientCall& with_circuit_breaker(CircuitBreakerConfig config) {
        options_.circuit_breaker = config;
        return *this;
    }

    ResilientCall& with_retry(RetryConfig config) {
        options_.retry = std::move(config);
        return *this;
    }

    ResilientCall& with_bulkhead(BulkheadConfig config) {
        options_.bulkhead = config;
        return *this;
    }

    ResilientCall& with_timeout(TimeoutConfig config) {
        options_.timeout = config;
        return *this;
    }

    ResilientCall& with_idempotency_key(std::string key) {
        options_.idempotency_key = std::move(key);
        return *this;
    }

    ResilientCall& with_priority(Priority priority) {
        options_.priority = priority;
        return *this;
    }

    ResilientCall& with_retry_on_status(std::vector<uint16_t> statuses) {
        options_.retry_on_status = std::move(statuses);
        return *this;
    }

    /// Run fn through the full policy stack.
    /// Returns fn's result or throws: a ResilienceError for protective
    /// rejections, fn's own error unchanged otherwise.
    template <typename Fn>
    core::call_result_t<Fn> execute(Fn fn);

    /// Like execute(), serving from chain's lower levels when the protected call fails
    template <typename Fn, typename T = core::call_result_t<Fn>>
    FallbackResult<T> execute_with_fallback(Fn fn, FallbackChain<T>& chain);

    [[nodiscard]] const std::string& dependency() const noexcept { return dependency_; }
    [[nodiscard]] const CallOptions& options() const noexcept { return options_; }

private:
    ResilienceRegistry& registry_;
    std::string dependency_;
    CallOptions options_;
};

template <typename Fn>
core::call_result_t<Fn> ResilientCall::execute(Fn fn) {
    auto correlation_id = logging::generate_correlation_id();

    auto bulkhead = registry_.get_or_create_bulkhead(dependency_, options_.bulkhead);
    auto breaker = registry_.get_or_create_circuit_breaker(dependency_, options_.circuit_breaker);
    // Timeout first: the retry manager binds to the dependency's timeout on creation
    registry_.get_or_create_adaptive_timeout(dependency_, options_.timeout);
    auto retry = registry_.get_or_create_retry_manager(dependency_, options_.retry);

    auto* logger = logging::get_logger();
    LOG_DEBUG(logger, "Protected call: dependency={}, priority={}, correlation_id={}", dependency_,
              to_string(options_.priority), correlation_id);

    try {
        return bulkhead->execute(
            [&]() {
                return breaker->call([&]() {
                    return retry->execute_with_retry(std::move(fn), options_.idempotency_key,
                                                     options_.retry_on_status);
                });
            },
            options_.priority);
    } catch (const core::ResilienceError& e) {
        LOG_REJECTION(logger, "resilient_call", dependency_, core::to_string(e.errc()),
                      correlation_id);
        throw;
    }
}

template <typename Fn, typename T>
FallbackResult<T> ResilientCall::execute_with_fallback(Fn fn, FallbackChain<T>& chain) {
    static_assert(!std::is_void_v<T>, "fallback requires a value-returning call");

    typename FallbackChain<T>::Handler primary = [this, &fn]() { return execute(std::move(fn)); };
    return chain.execute_with_primary(primary);
}

/// Protect one call against a named dependency
template <typename Fn>
core::call_result_t<Fn> wrap(ResilienceRegistry& registry, std::string_view dependency, Fn fn,
                             CallOptions options = {}) {
    return ResilientCall(registry, std::string(dependency), std::move(options))
        .execute(std::move(fn));
}

}  // namespace bulwark::resilience
