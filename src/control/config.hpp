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

// Bulwark Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "../resilience/policy.hpp"
#include "../resilience/rate_limit.hpp"
#include "health.hpp"

namespace bulwark::resilience {
class ResilienceRegistry;
}

namespace bulwark::control {

/// Logging configuration
struct LogConfig {
    std::string level = "info";   // debug, info, warning, error
    std::string format = "json";  // json, text
    std::string output;           // Log directory; empty or "console" logs to stdout

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Explicit policy for one dependency
struct DependencyConfig {
    std::string name;
    resilience::DependencyPolicy policy;
};

/// Full Bulwark configuration
struct Config {
    LogConfig logging;

    /// Policy for dependencies without an explicit entry; also the base
    /// every explicit entry overrides
    resilience::DependencyPolicy defaults;
    std::vector<DependencyConfig> dependencies;

    std::vector<resilience::RateLimiterConfig> rate_limiters;
    HealthCheckSettings health;

    // Metadata
    std::string version = "1.0";
    std::optional<std::string> description;
};

// Every from_json below reads into an existing object and uses its current
// field values as defaults, so get_to() layers a partial section over a base.

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", r.max_size_mb);
    r.max_files = j.value("max_files", r.max_files);
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", l.level);
    l.format = j.value("format", l.format);
    l.output = j.value("output", l.output);
    if (j.contains("rotation")) {
        j.at("rotation").get_to(l.rotation);
    }
}

inline void from_json(const nlohmann::json& j, HealthCheckConfig& h) {
    h.interval_seconds = j.value("interval_seconds", h.interval_seconds);
    h.timeout_seconds = j.value("timeout_seconds", h.timeout_seconds);
    h.grace_period_failures = j.value("grace_period_failures", h.grace_period_failures);
}

inline void from_json(const nlohmann::json& j, HealthCheckSettings& s) {
    if (j.contains("liveness")) {
        j.at("liveness").get_to(s.liveness);
    }
    if (j.contains("readiness")) {
        j.at("readiness").get_to(s.readiness);
    }
    if (j.contains("deep")) {
        j.at("deep").get_to(s.deep);
    }
}

void from_json(const nlohmann::json& j, DependencyConfig& d);
void from_json(const nlohmann::json& j, Config& c);

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{
        {"level", l.level}, {"format", l.format}, {"output", l.output}, {"rotation", l.rotation}};
}

inline void to_json(nlohmann::json& j, const HealthCheckConfig& h) {
    j = nlohmann::json{{"interval_seconds", h.interval_seconds},
                       {"timeout_seconds", h.timeout_seconds},
                       {"grace_period_failures", h.grace_period_failures}};
}

inline void to_json(nlohmann::json& j, const HealthCheckSettings& s) {
    j = nlohmann::json{{"liveness", s.liveness}, {"readiness", s.readiness}, {"deep", s.deep}};
}

void to_json(nlohmann::json& j, const DependencyConfig& d);
void to_json(nlohmann::json& j, const Config& c);

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path);

    /// Load configuration from JSON string (nullopt on parse or validation error)
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Save configuration to JSON file
    [[nodiscard]] static bool save_to_file(const Config& config, std::string_view path);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);
};

/// Install the configured policies, rate limiters and health checker into a registry,
/// creating every configured dependency's components up front
void configure_registry(resilience::ResilienceRegistry& registry, const Config& config);

}  // namespace bulwark::control

// Serializers for the component configs live with the schema, in the
// components' namespace so nlohmann's ADL lookup finds them.
namespace bulwark::resilience {

void from_json(const nlohmann::json& j, CircuitBreakerConfig& c);
void to_json(nlohmann::json& j, const CircuitBreakerConfig& c);

void from_json(const nlohmann::json& j, RetryConfig& r);
void to_json(nlohmann::json& j, const RetryConfig& r);

void from_json(const nlohmann::json& j, BulkheadConfig& b);
void to_json(nlohmann::json& j, const BulkheadConfig& b);

void from_json(const nlohmann::json& j, TimeoutConfig& t);
void to_json(nlohmann::json& j, const TimeoutConfig& t);

void from_json(const nlohmann::json& j, DependencyPolicy& p);
void to_json(nlohmann::json& j, const DependencyPolicy& p);

void from_json(const nlohmann::json& j, RateLimiterConfig& r);
void to_json(nlohmann::json& j, const RateLimiterConfig& r);

}  // namespace bulwark::resilience
