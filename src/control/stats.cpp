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

// Bulwark Stats Export - Implementation

#include "stats.hpp"

#include <chrono>
#include <string>

namespace bulwark::control {

namespace {

int64_t epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

nlohmann::json optional_epoch_ms(const std::optional<std::chrono::system_clock::time_point>& tp) {
    if (!tp) {
        return nullptr;
    }
    return epoch_ms(*tp);
}

nlohmann::json percentiles_to_json(const resilience::PercentileSnapshot& s) {
    return {{"sample_count", s.sample_count},
            {"p50", s.p50},
            {"p95", s.p95},
            {"p99", s.p99},
            {"p999", s.p999},
            {"min", s.min},
            {"max", s.max},
            {"mean", s.mean}};
}

template <typename Map, typename Render>
nlohmann::json map_to_json(const Map& items, Render render) {
    auto out = nlohmann::json::object();
    for (const auto& [name, item] : items) {
        out[name] = render(item);
    }
    return out;
}

}  // namespace

nlohmann::json health_to_json(const HealthReport& report) {
    nlohmann::json checks = nlohmann::json::object();
    for (const auto& check : report.checks) {
        checks[std::string(to_string(check.kind))] = {
            {"status", std::string(to_string(check.status))},
            {"latency_ms", check.latency.count()},
            {"consecutive_failures", check.consecutive_failures},
            {"last_check_time", optional_epoch_ms(check.last_check_time)},
            {"last_error", check.last_error},
            {"total_checks", check.total_checks},
            {"failed_checks", check.failed_checks}};
    }
    return {{"status", std::string(to_string(report.overall))}, {"checks", std::move(checks)}};
}

nlohmann::json circuit_breaker_to_json(const resilience::CircuitBreakerStats& s) {
    return {{"state", std::string(resilience::to_string(s.state))},
            {"failure_count", s.failure_count},
            {"success_count", s.success_count},
            {"last_failure_time", optional_epoch_ms(s.last_failure_time)},
            {"last_state_change", epoch_ms(s.last_state_change)},
            {"total_calls", s.total_calls},
            {"total_successes", s.total_successes},
            {"total_failures", s.total_failures},
            {"rejected_calls", s.rejected_calls},
            {"state_transitions", s.state_transitions},
            {"failure_rate", s.failure_rate()}};
}

nlohmann::json retry_manager_to_json(const resilience::RetryManagerStats& s) {
    return {{"total_executions", s.total_executions},
            {"total_attempts", s.total_attempts},
            {"total_retries", s.total_retries},
            {"successful_executions", s.successful_executions},
            {"failed_executions", s.failed_executions},
            {"idempotent_hits", s.idempotent_hits},
            {"budget_rejections", s.budget_rejections},
            {"idempotency_entries", s.idempotency_entries},
            {"budget",
             {{"total_calls", s.budget.total_calls},
              {"total_retries", s.budget.total_retries},
              {"retry_rate_percent", s.budget.retry_rate_percent},
              {"budget_percent", s.budget.budget_percent},
              {"window_seconds", s.budget.window_seconds}}}};
}

nlohmann::json bulkhead_to_json(const resilience::BulkheadStats& s) {
    return {{"active_calls", s.active_calls},
            {"queued_calls", s.queued_calls},
            {"max_concurrent", s.max_concurrent},
            {"max_queue_size", s.max_queue_size},
            {"accepted_calls", s.accepted_calls},
            {"rejected_calls", s.rejected_calls},
            {"timed_out_calls", s.timed_out_calls},
            {"successful_calls", s.successful_calls},
            {"failed_calls", s.failed_calls},
            {"peak_active_calls", s.peak_active_calls}};
}

nlohmann::json adaptive_timeout_to_json(const resilience::AdaptiveTimeoutStats& s) {
    return {{"current_timeout_ms", s.current_timeout_ms},
            {"adaptive", s.adaptive},
            {"latency", percentiles_to_json(s.latency)}};
}

nlohmann::json rate_limiter_to_json(const resilience::RateLimiterStats& s) {
    return {{"name", s.name},
            {"algorithm", std::string(resilience::to_string(s.algorithm))},
            {"allowed", s.allowed},
            {"denied", s.denied},
            {"level", s.level},
            {"capacity", s.capacity}};
}

nlohmann::json fallback_to_json(const resilience::FallbackStats& s) {
    nlohmann::json levels = nlohmann::json::object();
    for (size_t i = 0; i < resilience::kFallbackLevelCount; ++i) {
        auto level = static_cast<resilience::FallbackLevel>(i);
        levels[std::string(resilience::to_string(level))] = {{"served", s.served[i]},
                                                             {"failed", s.failed[i]}};
    }
    return {{"levels", std::move(levels)}, {"exhausted", s.exhausted}};
}

nlohmann::json stats_to_json(const resilience::ResilienceStats& stats) {
    nlohmann::json j;
    j["circuit_breakers"] = map_to_json(stats.circuit_breakers, circuit_breaker_to_json);
    j["retry_managers"] = map_to_json(stats.retry_managers, retry_manager_to_json);
    j["bulkheads"] = map_to_json(stats.bulkheads, bulkhead_to_json);
    j["adaptive_timeouts"] = map_to_json(stats.adaptive_timeouts, adaptive_timeout_to_json);
    j["rate_limiters"] = map_to_json(stats.rate_limiters, rate_limiter_to_json);
    j["health"] = stats.health ? health_to_json(*stats.health) : nlohmann::json(nullptr);
    return j;
}

}  // namespace bulwark::control
