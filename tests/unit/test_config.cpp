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

// Bulwark Configuration Layer Unit Tests

#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

#include "../../src/control/config.hpp"
#include "../../src/resilience/registry.hpp"

using namespace bulwark;
using namespace bulwark::control;

namespace {

bool contains_message(const std::vector<std::string>& messages, std::string_view needle) {
    for (const auto& message : messages) {
        if (message.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

Config config_with_dependency(std::string name) {
    Config config;
    DependencyConfig dependency;
    dependency.name = std::move(name);
    config.dependencies.push_back(dependency);
    return config;
}

}  // namespace

TEST_CASE("Config JSON deserialization", "[control][config]") {
    const char* json = R"({
        "version": "2.1",
        "description": "checkout tier",
        "logging": {"level": "debug", "format": "text"},
        "defaults": {
            "circuit_breaker": {"failure_threshold": 4, "timeout_seconds": 2.5},
            "retry": {"max_retries": 2, "strategy": "fibonacci", "retry_on_status": [503]},
            "bulkhead": {"max_concurrent_calls": 16, "priority_enabled": true},
            "timeout": {"default_timeout_ms": 800, "adaptive_enabled": false}
        },
        "dependencies": [
            {"name": "payments", "circuit_breaker": {"failure_threshold": 2}},
            {"name": "inventory"}
        ],
        "rate_limiters": [
            {"name": "ingress", "algorithm": "sliding_window", "limit": 50, "window_seconds": 1.0}
        ],
        "health": {"readiness": {"interval_seconds": 10, "grace_period_failures": 5}}
    })";

    auto maybe_config = ConfigLoader::load_from_json(json);
    REQUIRE(maybe_config.has_value());
    const auto& config = *maybe_config;

    REQUIRE(config.version == "2.1");
    REQUIRE(config.description == "checkout tier");
    REQUIRE(config.logging.level == "debug");
    REQUIRE(config.logging.format == "text");

    SECTION("defaults") {
        REQUIRE(config.defaults.circuit_breaker.failure_threshold == 4);
        REQUIRE(config.defaults.circuit_breaker.timeout_ms == 2500);
        REQUIRE(config.defaults.circuit_breaker.success_threshold == 3);
        REQUIRE(config.defaults.retry.max_retries == 2);
        REQUIRE(config.defaults.retry.strategy == resilience::BackoffStrategy::FIBONACCI);
        REQUIRE(config.defaults.retry.retry_on_status == std::vector<uint16_t>{503});
        REQUIRE(config.defaults.bulkhead.max_concurrent_calls == 16);
        REQUIRE(config.defaults.bulkhead.priority_enabled);
        REQUIRE_FALSE(config.defaults.timeout.adaptive_enabled);
    }

    SECTION("dependencies layer over the defaults") {
        REQUIRE(config.dependencies.size() == 2);

        const auto& payments = config.dependencies[0];
        REQUIRE(payments.name == "payments");
        REQUIRE(payments.policy.circuit_breaker.failure_threshold == 2);
        REQUIRE(payments.policy.circuit_breaker.timeout_ms == 2500);
        REQUIRE(payments.policy.retry.strategy == resilience::BackoffStrategy::FIBONACCI);
        REQUIRE(payments.policy.timeout.default_timeout_ms == 800);

        const auto& inventory = config.dependencies[1];
        REQUIRE(inventory.policy.circuit_breaker.failure_threshold == 4);
        REQUIRE(inventory.policy.bulkhead.max_concurrent_calls == 16);
    }

    SECTION("rate limiters and health") {
        REQUIRE(config.rate_limiters.size() == 1);
        REQUIRE(config.rate_limiters[0].algorithm == resilience::RateLimitAlgorithm::SLIDING_WINDOW);
        REQUIRE(config.rate_limiters[0].limit == 50);

        REQUIRE(config.health.readiness.interval_seconds == 10.0);
        REQUIRE(config.health.readiness.grace_period_failures == 5);
        REQUIRE(config.health.readiness.timeout_seconds == 5.0);
        REQUIRE(config.health.liveness.interval_seconds == 30.0);
    }
}

TEST_CASE("Config JSON deserialization - rejected input", "[control][config]") {
    SECTION("malformed JSON") {
        REQUIRE_FALSE(ConfigLoader::load_from_json("{not json").has_value());
    }

    SECTION("unknown backoff strategy") {
        const char* json = R"({"defaults": {"retry": {"strategy": "quadratic"}}})";
        REQUIRE_FALSE(ConfigLoader::load_from_json(json).has_value());
    }

    SECTION("unknown rate limit algorithm") {
        const char* json = R"({"rate_limiters": [{"name": "x", "algorithm": "gcra"}]})";
        REQUIRE_FALSE(ConfigLoader::load_from_json(json).has_value());
    }

    SECTION("wrong value type") {
        const char* json = R"({"defaults": {"bulkhead": {"max_concurrent_calls": "many"}}})";
        REQUIRE_FALSE(ConfigLoader::load_from_json(json).has_value());
    }

    SECTION("semantically invalid") {
        const char* json = R"({"defaults": {"retry": {"jitter_percent": 1.5}}})";
        REQUIRE_FALSE(ConfigLoader::load_from_json(json).has_value());
    }
}

TEST_CASE("Config validation - valid config", "[control][config]") {
    auto config = config_with_dependency("payments");

    auto result = ConfigLoader::validate(config);
    REQUIRE(result.valid);
    REQUIRE_FALSE(result.has_errors());
    REQUIRE(result.warnings.empty());
}

TEST_CASE("Config validation - empty dependency list warns", "[control][config]") {
    Config config;

    auto result = ConfigLoader::validate(config);
    REQUIRE_FALSE(result.has_errors());
    REQUIRE(contains_message(result.warnings, "No dependencies configured"));
}

TEST_CASE("Config validation - invalid values", "[control][config]") {
    auto config = config_with_dependency("payments");

    SECTION("duplicate dependency names") {
        config.dependencies.push_back(config.dependencies.front());
        auto result = ConfigLoader::validate(config);
        REQUIRE(result.has_errors());
        REQUIRE(contains_message(result.errors, "duplicate name 'payments'"));
    }

    SECTION("unnamed dependency") {
        config.dependencies.push_back(DependencyConfig{});
        auto result = ConfigLoader::validate(config);
        REQUIRE(contains_message(result.errors, "entry without a name"));
    }

    SECTION("zero failure threshold") {
        config.dependencies[0].policy.circuit_breaker.failure_threshold = 0;
        auto result = ConfigLoader::validate(config);
        REQUIRE(contains_message(result.errors, "dependencies['payments']"));
        REQUIRE(contains_message(result.errors, "failure_threshold"));
    }

    SECTION("retry budget out of range") {
        config.defaults.retry.retry_budget_percent = 0.0;
        auto result = ConfigLoader::validate(config);
        REQUIRE(contains_message(result.errors, "defaults: retry.retry_budget_percent"));
    }

    SECTION("base delay above max delay") {
        config.defaults.retry.base_delay_ms = 5000;
        config.defaults.retry.max_delay_ms = 1000;
        auto result = ConfigLoader::validate(config);
        REQUIRE(contains_message(result.errors, "base_delay_ms exceeds max_delay_ms"));
    }

    SECTION("retry status outside the HTTP range") {
        config.defaults.retry.retry_on_status = {42};
        auto result = ConfigLoader::validate(config);
        REQUIRE(contains_message(result.errors, "invalid status 42"));
    }

    SECTION("timeout floor above ceiling") {
        config.defaults.timeout.min_timeout_ms = 500;
        config.defaults.timeout.max_timeout_ms = 100;
        auto result = ConfigLoader::validate(config);
        REQUIRE(contains_message(result.errors, "min_timeout_ms exceeds max_timeout_ms"));
    }

    SECTION("unknown log level") {
        config.logging.level = "verbose";
        auto result = ConfigLoader::validate(config);
        REQUIRE(contains_message(result.errors, "logging.level 'verbose'"));
    }

    SECTION("rate limiter with zero capacity") {
        resilience::RateLimiterConfig limiter;
        limiter.name = "ingress";
        limiter.capacity = 0.0;
        config.rate_limiters.push_back(limiter);
        auto result = ConfigLoader::validate(config);
        REQUIRE(contains_message(result.errors, "rate_limiters['ingress']: capacity"));
    }

    SECTION("health grace period of zero") {
        config.health.deep.grace_period_failures = 0;
        auto result = ConfigLoader::validate(config);
        REQUIRE(contains_message(result.errors, "health.deep"));
    }
}

TEST_CASE("Config validation - questionable values warn", "[control][config]") {
    auto config = config_with_dependency("payments");
    config.defaults.circuit_breaker.timeout_ms = 0;
    config.health.liveness.timeout_seconds = 60.0;

    auto result = ConfigLoader::validate(config);
    REQUIRE_FALSE(result.has_errors());
    REQUIRE(contains_message(result.warnings, "open circuits retry immediately"));
    REQUIRE(contains_message(result.warnings, "health.liveness: timeout_seconds exceeds"));
}

TEST_CASE("Config JSON serialization", "[control][config]") {
    auto config = config_with_dependency("payments");
    config.dependencies[0].policy.circuit_breaker.timeout_ms = 1500;
    config.dependencies[0].policy.retry.strategy = resilience::BackoffStrategy::LINEAR;
    config.description = "edge";

    std::string json = ConfigLoader::to_json(config);
    REQUIRE_FALSE(json.empty());

    auto j = nlohmann::json::parse(json);
    REQUIRE(j["version"] == "1.0");
    REQUIRE(j["description"] == "edge");
    REQUIRE(j["dependencies"][0]["name"] == "payments");
    REQUIRE(j["dependencies"][0]["circuit_breaker"]["timeout_seconds"] == 1.5);
    REQUIRE(j["dependencies"][0]["retry"]["strategy"] == "linear");

    auto reloaded = ConfigLoader::load_from_json(json);
    REQUIRE(reloaded.has_value());
    REQUIRE(reloaded->dependencies[0].policy.circuit_breaker.timeout_ms == 1500);
    REQUIRE(reloaded->dependencies[0].policy.retry.strategy == resilience::BackoffStrategy::LINEAR);
}

TEST_CASE("Config file IO", "[control][config]") {
    SECTION("missing file") {
        REQUIRE_FALSE(ConfigLoader::load_from_file("/nonexistent/bulwark.json").has_value());
    }

    SECTION("save and load") {
        auto path = std::filesystem::temp_directory_path() / "bulwark_test_config.json";
        auto config = config_with_dependency("search");
        config.dependencies[0].policy.bulkhead.max_queue_size = 7;

        REQUIRE(ConfigLoader::save_to_file(config, path.string()));

        auto loaded = ConfigLoader::load_from_file(path.string());
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->dependencies.size() == 1);
        REQUIRE(loaded->dependencies[0].policy.bulkhead.max_queue_size == 7);

        std::filesystem::remove(path);
    }
}

TEST_CASE("Config - configure_registry", "[control][config]") {
    const char* json = R"({
        "defaults": {"circuit_breaker": {"failure_threshold": 9}},
        "dependencies": [
            {"name": "payments", "circuit_breaker": {"failure_threshold": 2}}
        ],
        "rate_limiters": [{"name": "ingress", "capacity": 5, "refill_rate": 1}]
    })";

    auto config = ConfigLoader::load_from_json(json);
    REQUIRE(config.has_value());

    resilience::ResilienceRegistry registry;
    configure_registry(registry, *config);

    auto breaker = registry.circuit_breaker("payments");
    REQUIRE(breaker != nullptr);
    REQUIRE(breaker->config().failure_threshold == 2);
    REQUIRE(registry.bulkhead("payments") != nullptr);
    REQUIRE(registry.retry_manager("payments") != nullptr);
    REQUIRE(registry.adaptive_timeout("payments") != nullptr);

    REQUIRE(registry.rate_limiter("ingress") != nullptr);
    REQUIRE(registry.health_checker() != nullptr);

    // Unconfigured dependencies use the defaults
    REQUIRE(registry.get_or_create_circuit_breaker("other")->config().failure_threshold == 9);
}
