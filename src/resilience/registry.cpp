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

// Bulwark Resilience Registry - Implementation

#include "registry.hpp"

#include <algorithm>
#include <set>

#include "../core/logging.hpp"

namespace bulwark::resilience {

ResilienceRegistry::ResilienceRegistry(DependencyPolicy default_policy)
    : default_policy_(std::move(default_policy)) {}

template <typename T, typename Factory>
std::shared_ptr<T> ResilienceRegistry::get_or_create(Slot<T>& slot, std::string_view name,
                                                     std::string_view kind, Factory&& factory) {
    std::string key{name};

    // Read-mostly fast path
    {
        std::shared_lock lock(slot.mutex);
        auto it = slot.items.find(key);
        if (it != slot.items.end()) {
            return it->second;
        }
    }

    std::unique_lock lock(slot.mutex);
    auto it = slot.items.find(key);
    if (it != slot.items.end()) {
        return it->second;
    }

    std::shared_ptr<T> created = factory();
    slot.items.emplace(key, created);
    lock.unlock();

    auto* logger = logging::get_logger();
    LOG_INFO(logger, "Registered {}: dependency={}", kind, key);
    return created;
}

template <typename T>
std::shared_ptr<T> ResilienceRegistry::find(const Slot<T>& slot, std::string_view name) const {
    std::shared_lock lock(slot.mutex);
    auto it = slot.items.find(std::string(name));
    if (it == slot.items.end()) {
        return nullptr;
    }
    return it->second;
}

void ResilienceRegistry::set_default_policy(DependencyPolicy policy) {
    std::lock_guard lock(policy_mutex_);
    default_policy_ = std::move(policy);
}

void ResilienceRegistry::set_policy(std::string_view name, DependencyPolicy policy) {
    std::lock_guard lock(policy_mutex_);
    policies_.insert_or_assign(std::string(name), std::move(policy));
}

DependencyPolicy ResilienceRegistry::policy_for(std::string_view name) const {
    std::lock_guard lock(policy_mutex_);
    auto it = policies_.find(std::string(name));
    if (it != policies_.end()) {
        return it->second;
    }
    return default_policy_;
}

std::shared_ptr<CircuitBreaker> ResilienceRegistry::get_or_create_circuit_breaker(
    std::string_view name, std::optional<CircuitBreakerConfig> config,
    ErrorPredicate expected_errors) {
    return get_or_create(breakers_, name, "circuit_breaker", [&] {
        auto resolved = config ? *config : policy_for(name).circuit_breaker;
        return std::make_shared<CircuitBreaker>(std::string(name), resolved,
                                                std::move(expected_errors));
    });
}

std::shared_ptr<RetryManager> ResilienceRegistry::get_or_create_retry_manager(
    std::string_view name, std::optional<RetryConfig> config) {
    return get_or_create(retries_, name, "retry_manager", [&] {
        auto resolved = config ? std::move(*config) : policy_for(name).retry;
        return std::make_shared<RetryManager>(std::string(name), std::move(resolved),
                                              get_or_create_adaptive_timeout(name));
    });
}

std::shared_ptr<Bulkhead> ResilienceRegistry::get_or_create_bulkhead(
    std::string_view name, std::optional<BulkheadConfig> config) {
    return get_or_create(bulkheads_, name, "bulkhead", [&] {
        auto resolved = config ? *config : policy_for(name).bulkhead;
        return std::make_shared<Bulkhead>(std::string(name), resolved);
    });
}

std::shared_ptr<AdaptiveTimeout> ResilienceRegistry::get_or_create_adaptive_timeout(
    std::string_view name, std::optional<TimeoutConfig> config) {
    return get_or_create(timeouts_, name, "adaptive_timeout", [&] {
        auto resolved = config ? *config : policy_for(name).timeout;
        return std::make_shared<AdaptiveTimeout>(std::string(name), resolved);
    });
}

std::shared_ptr<RateLimiter> ResilienceRegistry::get_or_create_rate_limiter(
    const RateLimiterConfig& config) {
    return get_or_create(limiters_, config.name, "rate_limiter", [&] {
        return std::shared_ptr<RateLimiter>(make_rate_limiter(config));
    });
}

std::shared_ptr<CircuitBreaker> ResilienceRegistry::circuit_breaker(std::string_view name) const {
    return find(breakers_, name);
}

std::shared_ptr<RetryManager> ResilienceRegistry::retry_manager(std::string_view name) const {
    return find(retries_, name);
}

std::shared_ptr<Bulkhead> ResilienceRegistry::bulkhead(std::string_view name) const {
    return find(bulkheads_, name);
}

std::shared_ptr<AdaptiveTimeout> ResilienceRegistry::adaptive_timeout(std::string_view name) const {
    return find(timeouts_, name);
}

std::shared_ptr<RateLimiter> ResilienceRegistry::rate_limiter(std::string_view name) const {
    return find(limiters_, name);
}

void ResilienceRegistry::set_health_checker(std::shared_ptr<control::HealthChecker> checker) {
    std::lock_guard lock(health_mutex_);
    health_ = std::move(checker);
}

std::shared_ptr<control::HealthChecker> ResilienceRegistry::health_checker() const {
    std::lock_guard lock(health_mutex_);
    return health_;
}

void ResilienceRegistry::reset_all_circuit_breakers() {
    std::vector<std::shared_ptr<CircuitBreaker>> breakers;
    {
        std::shared_lock lock(breakers_.mutex);
        for (const auto& [name, breaker] : breakers_.items) {
            breakers.push_back(breaker);
        }
    }
    for (auto& breaker : breakers) {
        breaker->reset();
    }

    auto* logger = logging::get_logger();
    LOG_INFO(logger, "Reset all circuit breakers: count={}", breakers.size());
}

std::vector<std::string> ResilienceRegistry::dependency_names() const {
    std::set<std::string> names;

    auto collect = [&names](const auto& slot) {
        std::shared_lock lock(slot.mutex);
        for (const auto& [name, item] : slot.items) {
            names.insert(name);
        }
    };
    collect(breakers_);
    collect(retries_);
    collect(bulkheads_);
    collect(timeouts_);

    {
        std::lock_guard lock(policy_mutex_);
        for (const auto& [name, policy] : policies_) {
            names.insert(name);
        }
    }

    return {names.begin(), names.end()};
}

ResilienceStats ResilienceRegistry::get_comprehensive_stats() const {
    ResilienceStats stats;

    // Copy the instance lists first so no component lock is taken under a slot lock
    auto snapshot = [](const auto& slot) {
        std::shared_lock lock(slot.mutex);
        return std::vector(slot.items.begin(), slot.items.end());
    };

    for (const auto& [name, breaker] : snapshot(breakers_)) {
        stats.circuit_breakers.emplace(name, breaker->stats());
    }
    for (const auto& [name, retry] : snapshot(retries_)) {
        stats.retry_managers.emplace(name, retry->stats());
    }
    for (const auto& [name, bulkhead] : snapshot(bulkheads_)) {
        stats.bulkheads.emplace(name, bulkhead->stats());
    }
    for (const auto& [name, timeout] : snapshot(timeouts_)) {
        stats.adaptive_timeouts.emplace(name, timeout->stats());
    }
    for (const auto& [name, limiter] : snapshot(limiters_)) {
        stats.rate_limiters.emplace(name, limiter->stats());
    }

    if (auto checker = health_checker()) {
        stats.health = checker->report();
    }

    return stats;
}

}  // namespace bulwark::resilience
