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

// Bulwark Configuration - Implementation

#include "config.hpp"

#include <fmt/format.h>

#include <cmath>
#include <fstream>
#include <memory>
#include <sstream>

#include "../core/containers.hpp"
#include "../core/logging.hpp"
#include "../resilience/registry.hpp"

namespace bulwark::resilience {

void from_json(const nlohmann::json& j, CircuitBreakerConfig& c) {
    c.failure_threshold = j.value("failure_threshold", c.failure_threshold);
    c.success_threshold = j.value("success_threshold", c.success_threshold);
    if (j.contains("timeout_seconds")) {
        double seconds = j.at("timeout_seconds").get<double>();
        c.timeout_ms = static_cast<uint32_t>(std::llround(std::max(seconds, 0.0) * 1000.0));
    }
    c.half_open_max_calls = j.value("half_open_max_calls", c.half_open_max_calls);
}

void to_json(nlohmann::json& j, const CircuitBreakerConfig& c) {
    j = nlohmann::json{{"failure_threshold", c.failure_threshold},
                       {"success_threshold", c.success_threshold},
                       {"timeout_seconds", static_cast<double>(c.timeout_ms) / 1000.0},
                       {"half_open_max_calls", c.half_open_max_calls}};
}

void from_json(const nlohmann::json& j, RetryConfig& r) {
    r.max_retries = j.value("max_retries", r.max_retries);
    r.base_delay_ms = j.value("base_delay_ms", r.base_delay_ms);
    r.max_delay_ms = j.value("max_delay_ms", r.max_delay_ms);
    r.jitter_percent = j.value("jitter_percent", r.jitter_percent);
    if (j.contains("strategy")) {
        auto name = j.at("strategy").get<std::string>();
        auto strategy = parse_backoff_strategy(name);
        if (!strategy) {
            throw std::invalid_argument(fmt::format("unknown retry strategy '{}'", name));
        }
        r.strategy = *strategy;
    }
    r.multiplier = j.value("multiplier", r.multiplier);
    r.retry_budget_percent = j.value("retry_budget_percent", r.retry_budget_percent);
    r.retry_budget_window_seconds =
        j.value("retry_budget_window_seconds", r.retry_budget_window_seconds);
    r.min_calls_before_budget = j.value("min_calls_before_budget", r.min_calls_before_budget);
    r.idempotency_ttl_seconds = j.value("idempotency_ttl_seconds", r.idempotency_ttl_seconds);
    if (j.contains("retry_on_status")) {
        j.at("retry_on_status").get_to(r.retry_on_status);
    }
}

void to_json(nlohmann::json& j, const RetryConfig& r) {
    j = nlohmann::json{{"max_retries", r.max_retries},
                       {"base_delay_ms", r.base_delay_ms},
                       {"max_delay_ms", r.max_delay_ms},
                       {"jitter_percent", r.jitter_percent},
                       {"strategy", std::string(to_string(r.strategy))},
                       {"multiplier", r.multiplier},
                       {"retry_budget_percent", r.retry_budget_percent},
                       {"retry_budget_window_seconds", r.retry_budget_window_seconds},
                       {"min_calls_before_budget", r.min_calls_before_budget},
                       {"idempotency_ttl_seconds", r.idempotency_ttl_seconds},
                       {"retry_on_status", r.retry_on_status}};
}

void from_json(const nlohmann::json& j, BulkheadConfig& b) {
    b.max_concurrent_calls = j.value("max_concurrent_calls", b.max_concurrent_calls);
    b.max_queue_size = j.value("max_queue_size", b.max_queue_size);
    b.timeout_ms = j.value("timeout_ms", b.timeout_ms);
    b.priority_enabled = j.value("priority_enabled", b.priority_enabled);
}

void to_json(nlohmann::json& j, const BulkheadConfig& b) {
    j = nlohmann::json{{"max_concurrent_calls", b.max_concurrent_calls},
                       {"max_queue_size", b.max_queue_size},
                       {"timeout_ms", b.timeout_ms},
                       {"priority_enabled", b.priority_enabled}};
}

void from_json(const nlohmann::json& j, TimeoutConfig& t) {
    t.adaptive_enabled = j.value("adaptive_enabled", t.adaptive_enabled);
    t.default_timeout_ms = j.value("default_timeout_ms", t.default_timeout_ms);
    t.min_timeout_ms = j.value("min_timeout_ms", t.min_timeout_ms);
    t.max_timeout_ms = j.value("max_timeout_ms", t.max_timeout_ms);
    t.percentile_window = j.value("percentile_window", t.percentile_window);
    t.min_samples = j.value("min_samples", t.min_samples);
    t.multiplier = j.value("multiplier", t.multiplier);
}

void to_json(nlohmann::json& j, const TimeoutConfig& t) {
    j = nlohmann::json{{"adaptive_enabled", t.adaptive_enabled},
                       {"default_timeout_ms", t.default_timeout_ms},
                       {"min_timeout_ms", t.min_timeout_ms},
                       {"max_timeout_ms", t.max_timeout_ms},
                       {"percentile_window", t.percentile_window},
                       {"min_samples", t.min_samples},
                       {"multiplier", t.multiplier}};
}

void from_json(const nlohmann::json& j, DependencyPolicy& p) {
    // contains() + get_to() so each section layers over the current values
    if (j.contains("circuit_breaker")) {
        j.at("circuit_breaker").get_to(p.circuit_breaker);
    }
    if (j.contains("retry")) {
        j.at("retry").get_to(p.retry);
    }
    if (j.contains("bulkhead")) {
        j.at("bulkhead").get_to(p.bulkhead);
    }
    if (j.contains("timeout")) {
        j.at("timeout").get_to(p.timeout);
    }
}

void to_json(nlohmann::json& j, const DependencyPolicy& p) {
    j = nlohmann::json{{"circuit_breaker", p.circuit_breaker},
                       {"retry", p.retry},
                       {"bulkhead", p.bulkhead},
                       {"timeout", p.timeout}};
}

void from_json(const nlohmann::json& j, RateLimiterConfig& r) {
    r.name = j.value("name", r.name);
    if (j.contains("algorithm")) {
        auto name = j.at("algorithm").get<std::string>();
        auto algorithm = parse_rate_limit_algorithm(name);
        if (!algorithm) {
            throw std::invalid_argument(fmt::format("unknown rate limit algorithm '{}'", name));
        }
        r.algorithm = *algorithm;
    }
    r.capacity = j.value("capacity", r.capacity);
    r.refill_rate = j.value("refill_rate", r.refill_rate);
    r.limit = j.value("limit", r.limit);
    r.window_seconds = j.value("window_seconds", r.window_seconds);
    r.leak_rate = j.value("leak_rate", r.leak_rate);
}

void to_json(nlohmann::json& j, const RateLimiterConfig& r) {
    j = nlohmann::json{{"name", r.name},
                       {"algorithm", std::string(to_string(r.algorithm))},
                       {"capacity", r.capacity},
                       {"refill_rate", r.refill_rate},
                       {"limit", r.limit},
                       {"window_seconds", r.window_seconds},
                       {"leak_rate", r.leak_rate}};
}

}  // namespace bulwark::resilience

namespace bulwark::control {

void from_json(const nlohmann::json& j, DependencyConfig& d) {
    d.name = j.value("name", d.name);
    j.get_to(d.policy);
}

void to_json(nlohmann::json& j, const DependencyConfig& d) {
    j = d.policy;
    j["name"] = d.name;
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
    if (j.contains("defaults")) {
        j.at("defaults").get_to(c.defaults);
    }
    if (j.contains("dependencies")) {
        c.dependencies.clear();
        for (const auto& entry : j.at("dependencies")) {
            // Each dependency starts from the defaults section
            DependencyConfig dependency{std::string(), c.defaults};
            entry.get_to(dependency);
            c.dependencies.push_back(std::move(dependency));
        }
    }
    if (j.contains("rate_limiters")) {
        c.rate_limiters.clear();
        for (const auto& entry : j.at("rate_limiters")) {
            resilience::RateLimiterConfig limiter;
            entry.get_to(limiter);
            c.rate_limiters.push_back(std::move(limiter));
        }
    }
    if (j.contains("health")) {
        j.at("health").get_to(c.health);
    }
    if (j.contains("version")) {
        j.at("version").get_to(c.version);
    }
    if (j.contains("description")) {
        c.description = j.at("description").get<std::string>();
    }
}

void to_json(nlohmann::json& j, const Config& c) {
    j["logging"] = c.logging;
    j["defaults"] = c.defaults;
    j["dependencies"] = c.dependencies;
    j["rate_limiters"] = c.rate_limiters;
    j["health"] = c.health;
    j["version"] = c.version;
    if (c.description) {
        j["description"] = *c.description;
    }
}

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        auto* logger = logging::get_logger();
        LOG_ERROR(logger, "Cannot open config file: path={}", path_str);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    return load_from_json(json);
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json) {
    auto* logger = logging::get_logger();
    Config config;

    try {
        auto j = nlohmann::json::parse(json);
        config = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR(logger, "JSON parsing error: {}", e.what());
        return std::nullopt;
    } catch (const std::invalid_argument& e) {
        LOG_ERROR(logger, "Invalid configuration value: {}", e.what());
        return std::nullopt;
    }

    auto validation = validate(config);
    for (const auto& warning : validation.warnings) {
        LOG_WARNING(logger, "Config warning: {}", warning);
    }
    if (validation.has_errors()) {
        for (const auto& error : validation.errors) {
            LOG_ERROR(logger, "Config error: {}", error);
        }
        return std::nullopt;
    }

    return config;
}

namespace {

void validate_policy(const resilience::DependencyPolicy& policy, const std::string& context,
                     ValidationResult& result) {
    const auto& cb = policy.circuit_breaker;
    if (cb.failure_threshold == 0) {
        result.add_error(fmt::format("{}: circuit_breaker.failure_threshold must be > 0", context));
    }
    if (cb.success_threshold == 0) {
        result.add_error(fmt::format("{}: circuit_breaker.success_threshold must be > 0", context));
    }
    if (cb.timeout_ms == 0) {
        result.add_warning(
            fmt::format("{}: circuit_breaker.timeout_seconds is 0, open circuits retry immediately",
                        context));
    }

    const auto& retry = policy.retry;
    if (retry.jitter_percent < 0.0 || retry.jitter_percent > 1.0) {
        result.add_error(fmt::format("{}: retry.jitter_percent must be in [0, 1]", context));
    }
    if (retry.retry_budget_percent <= 0.0 || retry.retry_budget_percent > 100.0) {
        result.add_error(fmt::format("{}: retry.retry_budget_percent must be in (0, 100]", context));
    }
    if (retry.base_delay_ms > retry.max_delay_ms) {
        result.add_error(fmt::format("{}: retry.base_delay_ms exceeds max_delay_ms", context));
    }
    if (retry.multiplier < 1.0) {
        result.add_error(fmt::format("{}: retry.multiplier must be >= 1", context));
    }
    if (retry.retry_budget_window_seconds == 0) {
        result.add_error(fmt::format("{}: retry.retry_budget_window_seconds must be > 0", context));
    }
    if (retry.idempotency_ttl_seconds == 0) {
        result.add_error(fmt::format("{}: retry.idempotency_ttl_seconds must be > 0", context));
    }
    for (auto status : retry.retry_on_status) {
        if (status < 100 || status > 599) {
            result.add_error(fmt::format("{}: retry.retry_on_status has invalid status {}", context,
                                         status));
        }
    }

    const auto& bulkhead = policy.bulkhead;
    if (bulkhead.max_concurrent_calls == 0) {
        result.add_error(fmt::format("{}: bulkhead.max_concurrent_calls must be > 0", context));
    }

    const auto& timeout = policy.timeout;
    if (timeout.min_timeout_ms > timeout.max_timeout_ms) {
        result.add_error(fmt::format("{}: timeout.min_timeout_ms exceeds max_timeout_ms", context));
    }
    if (timeout.multiplier <= 0.0) {
        result.add_error(fmt::format("{}: timeout.multiplier must be > 0", context));
    }
    if (timeout.percentile_window == 0) {
        result.add_error(fmt::format("{}: timeout.percentile_window must be > 0", context));
    }
    if (timeout.min_samples > timeout.percentile_window) {
        result.add_warning(fmt::format(
            "{}: timeout.min_samples exceeds percentile_window, timeout never adapts", context));
    }
}

void validate_rate_limiter(const resilience::RateLimiterConfig& limiter,
                           ValidationResult& result) {
    auto context = fmt::format("rate_limiters['{}']", limiter.name);
    switch (limiter.algorithm) {
        case resilience::RateLimitAlgorithm::TOKEN_BUCKET:
            if (limiter.capacity <= 0.0) {
                result.add_error(fmt::format("{}: capacity must be > 0", context));
            }
            if (limiter.refill_rate < 0.0) {
                result.add_error(fmt::format("{}: refill_rate must be >= 0", context));
            }
            break;
        case resilience::RateLimitAlgorithm::SLIDING_WINDOW:
            if (limiter.limit == 0) {
                result.add_error(fmt::format("{}: limit must be > 0", context));
            }
            if (limiter.window_seconds <= 0.0) {
                result.add_error(fmt::format("{}: window_seconds must be > 0", context));
            }
            break;
        case resilience::RateLimitAlgorithm::LEAKY_BUCKET:
            if (limiter.capacity <= 0.0) {
                result.add_error(fmt::format("{}: capacity must be > 0", context));
            }
            if (limiter.leak_rate < 0.0) {
                result.add_error(fmt::format("{}: leak_rate must be >= 0", context));
            }
            break;
    }
}

void validate_health(const HealthCheckConfig& health, std::string_view kind,
                     ValidationResult& result) {
    if (health.grace_period_failures == 0) {
        result.add_error(fmt::format("health.{}: grace_period_failures must be > 0", kind));
    }
    if (health.interval_seconds <= 0.0) {
        result.add_error(fmt::format("health.{}: interval_seconds must be > 0", kind));
    }
    if (health.timeout_seconds < 0.0) {
        result.add_error(fmt::format("health.{}: timeout_seconds must be >= 0", kind));
    }
    if (health.timeout_seconds > health.interval_seconds) {
        result.add_warning(fmt::format("health.{}: timeout_seconds exceeds interval_seconds", kind));
    }
}

}  // namespace

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    const auto& level = config.logging.level;
    if (level != "debug" && level != "info" && level != "warning" && level != "warn" &&
        level != "error") {
        result.add_error(fmt::format("logging.level '{}' is not one of debug|info|warning|error",
                                     level));
    }
    if (config.logging.format != "json" && config.logging.format != "text") {
        result.add_error(fmt::format("logging.format '{}' is not one of json|text",
                                     config.logging.format));
    }

    validate_policy(config.defaults, "defaults", result);

    if (config.dependencies.empty()) {
        result.add_warning("No dependencies configured, every dependency uses the defaults");
    }

    core::fast_set<std::string> seen;
    for (const auto& dependency : config.dependencies) {
        if (dependency.name.empty()) {
            result.add_error("dependencies: entry without a name");
            continue;
        }
        if (!seen.insert(dependency.name).second) {
            result.add_error(fmt::format("dependencies: duplicate name '{}'", dependency.name));
        }
        validate_policy(dependency.policy, fmt::format("dependencies['{}']", dependency.name),
                        result);
    }

    core::fast_set<std::string> limiter_names;
    for (const auto& limiter : config.rate_limiters) {
        if (limiter.name.empty()) {
            result.add_error("rate_limiters: entry without a name");
            continue;
        }
        if (!limiter_names.insert(limiter.name).second) {
            result.add_error(fmt::format("rate_limiters: duplicate name '{}'", limiter.name));
        }
        validate_rate_limiter(limiter, result);
    }

    validate_health(config.health.liveness, "liveness", result);
    validate_health(config.health.readiness, "readiness", result);
    validate_health(config.health.deep, "deep", result);

    return result;
}

bool ConfigLoader::save_to_file(const Config& config, std::string_view path) {
    std::string json = to_json(config);
    if (json.empty()) {
        return false;
    }

    std::string path_str{path};
    std::ofstream file{path_str};
    if (!file.is_open()) {
        return false;
    }

    file << json;
    return file.good();
}

std::string ConfigLoader::to_json(const Config& config) {
    try {
        nlohmann::json j = config;
        return j.dump(2);
    } catch (const nlohmann::json::exception& e) {
        auto* logger = logging::get_logger();
        LOG_ERROR(logger, "Config serialization error: {}", e.what());
        return "";
    }
}

void configure_registry(resilience::ResilienceRegistry& registry, const Config& config) {
    registry.set_default_policy(config.defaults);

    for (const auto& dependency : config.dependencies) {
        registry.set_policy(dependency.name, dependency.policy);
        registry.get_or_create_circuit_breaker(dependency.name);
        registry.get_or_create_bulkhead(dependency.name);
        registry.get_or_create_retry_manager(dependency.name);
    }

    for (const auto& limiter : config.rate_limiters) {
        registry.get_or_create_rate_limiter(limiter);
    }

    registry.set_health_checker(std::make_shared<HealthChecker>(config.health));

    auto* logger = logging::get_logger();
    LOG_INFO(logger, "Registry configured: dependencies={}, rate_limiters={}, version={}",
             config.dependencies.size(), config.rate_limiters.size(), config.version);
}

}  // namespace bulwark::control
