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

// Bulwark Resilience Registry - Header
// Named per-dependency component instances and aggregated statistics

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "../control/health.hpp"
#include "../core/containers.hpp"
#include "adaptive_timeout.hpp"
#include "bulkhead.hpp"
#include "circuit_breaker.hpp"
#include "policy.hpp"
#include "rate_limit.hpp"
#include "retry_manager.hpp"

namespace bulwark::resilience {

/// Snapshot of every live component, keyed by dependency (or limiter) name
struct ResilienceStats {
    std::map<std::string, CircuitBreakerStats> circuit_breakers;
    std::map<std::string, RetryManagerStats> retry_managers;
    std::map<std::string, BulkheadStats> bulkheads;
    std::map<std::string, AdaptiveTimeoutStats> adaptive_timeouts;
    std::map<std::string, RateLimiterStats> rate_limiters;
    std::optional<control::HealthReport> health;
};

/// Creates and retrieves named component instances.
///
/// Explicitly constructed and passed to whatever composes the call path.
/// Creation is idempotent per (name, kind): the first call creates the
/// instance, later calls return it and ignore their config argument.
/// Each component kind has its own lock, so lookups for one kind never
/// contend with creation of another.
class ResilienceRegistry {
public:
    ResilienceRegistry() = default;
    explicit ResilienceRegistry(DependencyPolicy default_policy);

    ResilienceRegistry(const ResilienceRegistry&) = delete;
    ResilienceRegistry& operator=(const ResilienceRegistry&) = delete;

    // Policies (used when no explicit config is passed at creation)

    void set_default_policy(DependencyPolicy policy);
    void set_policy(std::string_view name, DependencyPolicy policy);
    [[nodiscard]] DependencyPolicy policy_for(std::string_view name) const;

    // Get or create

    std::shared_ptr<CircuitBreaker> get_or_create_circuit_breaker(
        std::string_view name, std::optional<CircuitBreakerConfig> config = std::nullopt,
        ErrorPredicate expected_errors = {});

    /// The retry manager is bound to the dependency's AdaptiveTimeout
    std::shared_ptr<RetryManager> get_or_create_retry_manager(
        std::string_view name, std::optional<RetryConfig> config = std::nullopt);

    std::shared_ptr<Bulkhead> get_or_create_bulkhead(
        std::string_view name, std::optional<BulkheadConfig> config = std::nullopt);

    std::shared_ptr<AdaptiveTimeout> get_or_create_adaptive_timeout(
        std::string_view name, std::optional<TimeoutConfig> config = std::nullopt);

    /// Keyed by config.name
    std::shared_ptr<RateLimiter> get_or_create_rate_limiter(const RateLimiterConfig& config);

    // Lookup (nullptr when absent)

    [[nodiscard]] std::shared_ptr<CircuitBreaker> circuit_breaker(std::string_view name) const;
    [[nodiscard]] std::shared_ptr<RetryManager> retry_manager(std::string_view name) const;
    [[nodiscard]] std::shared_ptr<Bulkhead> bulkhead(std::string_view name) const;
    [[nodiscard]] std::shared_ptr<AdaptiveTimeout> adaptive_timeout(std::string_view name) const;
    [[nodiscard]] std::shared_ptr<RateLimiter> rate_limiter(std::string_view name) const;

    void set_health_checker(std::shared_ptr<control::HealthChecker> checker);
    [[nodiscard]] std::shared_ptr<control::HealthChecker> health_checker() const;

    /// Return every circuit breaker to CLOSED
    void reset_all_circuit_breakers();

    /// Sorted names of every dependency with at least one component or policy
    [[nodiscard]] std::vector<std::string> dependency_names() const;

    [[nodiscard]] ResilienceStats get_comprehensive_stats() const;

private:
    template <typename T>
    struct Slot {
        mutable std::shared_mutex mutex;
        core::fast_map<std::string, std::shared_ptr<T>> items;
    };

    template <typename T, typename Factory>
    std::shared_ptr<T> get_or_create(Slot<T>& slot, std::string_view name, std::string_view kind,
                                     Factory&& factory);

    template <typename T>
    std::shared_ptr<T> find(const Slot<T>& slot, std::string_view name) const;

    mutable std::mutex policy_mutex_;
    DependencyPolicy default_policy_;
    core::fast_map<std::string, DependencyPolicy> policies_;

    Slot<CircuitBreaker> breakers_;
    Slot<RetryManager> retries_;
    Slot<Bulkhead> bulkheads_;
    Slot<AdaptiveTimeout> timeouts_;
    Slot<RateLimiter> limiters_;

    mutable std::mutex health_mutex_;
    std::shared_ptr<control::HealthChecker> health_;
};

}  // namespace bulwark::resilience
