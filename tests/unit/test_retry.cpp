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

// Unit tests for RetryManager, RetryBudget and IdempotencyCache

#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include <fmt/format.h>

#include "../../src/core/errors.hpp"
#include "../../src/resilience/retry_manager.hpp"

using namespace bulwark::resilience;
using bulwark::core::CallTimeoutError;
using bulwark::core::RetryBudgetExceededError;
using bulwark::core::StatusError;
using namespace std::chrono_literals;

namespace {

// Fast retries with a budget that never gets in the way
RetryConfig quick_config(uint32_t max_retries = 3) {
    RetryConfig config;
    config.max_retries = max_retries;
    config.base_delay_ms = 1;
    config.max_delay_ms = 5;
    config.jitter_percent = 0.0;
    config.retry_budget_percent = 100.0;
    return config;
}

}  // namespace

TEST_CASE("RetryManager - Backoff strategies", "[retry]") {
    RetryConfig config;
    config.base_delay_ms = 100;
    config.max_delay_ms = 1000;
    config.multiplier = 2.0;

    SECTION("exponential") {
        config.strategy = BackoffStrategy::EXPONENTIAL;
        RetryManager retry("svc", config);
        REQUIRE(retry.base_delay(1) == 100ms);
        REQUIRE(retry.base_delay(2) == 200ms);
        REQUIRE(retry.base_delay(3) == 400ms);
        REQUIRE(retry.base_delay(5) == 1000ms);  // capped
    }

    SECTION("linear") {
        config.strategy = BackoffStrategy::LINEAR;
        RetryManager retry("svc", config);
        REQUIRE(retry.base_delay(1) == 100ms);
        REQUIRE(retry.base_delay(2) == 200ms);
        REQUIRE(retry.base_delay(3) == 300ms);
    }

    SECTION("fibonacci") {
        config.strategy = BackoffStrategy::FIBONACCI;
        RetryManager retry("svc", config);
        REQUIRE(retry.base_delay(1) == 100ms);
        REQUIRE(retry.base_delay(2) == 200ms);
        REQUIRE(retry.base_delay(3) == 300ms);
        REQUIRE(retry.base_delay(4) == 500ms);
    }

    SECTION("constant") {
        config.strategy = BackoffStrategy::CONSTANT;
        RetryManager retry("svc", config);
        REQUIRE(retry.base_delay(1) == 100ms);
        REQUIRE(retry.base_delay(4) == 100ms);
    }
}

TEST_CASE("RetryManager - Jittered delay stays within bounds", "[retry]") {
    RetryConfig config;
    config.base_delay_ms = 100;
    config.max_delay_ms = 60000;
    config.jitter_percent = 0.5;
    RetryManager retry("svc", config);

    for (int i = 0; i < 500; ++i) {
        auto first = retry.compute_delay(1);
        REQUIRE(first >= 50ms);
        REQUIRE(first <= 150ms);

        auto third = retry.compute_delay(3);
        REQUIRE(third >= 200ms);
        REQUIRE(third <= 600ms);
    }

    SECTION("never exceeds max_delay") {
        RetryConfig capped = config;
        capped.max_delay_ms = 150;
        RetryManager limited("svc", capped);
        for (int i = 0; i < 200; ++i) {
            REQUIRE(limited.compute_delay(6) <= 150ms);
        }
    }
}

TEST_CASE("RetryManager - Strategy names", "[retry]") {
    REQUIRE(to_string(BackoffStrategy::FIBONACCI) == "fibonacci");
    REQUIRE(parse_backoff_strategy("linear") == BackoffStrategy::LINEAR);
    REQUIRE_FALSE(parse_backoff_strategy("quadratic").has_value());
}

TEST_CASE("RetryManager - Rejects invalid configuration", "[retry]") {
    RetryConfig config;

    SECTION("jitter outside [0, 1]") {
        config.jitter_percent = 1.5;
        REQUIRE_THROWS_AS(RetryManager("svc", config), std::invalid_argument);
    }

    SECTION("base above max") {
        config.base_delay_ms = 500;
        config.max_delay_ms = 100;
        REQUIRE_THROWS_AS(RetryManager("svc", config), std::invalid_argument);
    }

    SECTION("budget outside (0, 100]") {
        config.retry_budget_percent = 0.0;
        REQUIRE_THROWS_AS(RetryManager("svc", config), std::invalid_argument);
    }
}

TEST_CASE("RetryManager - Retries until success", "[retry]") {
    RetryManager retry("svc", quick_config());

    auto calls = std::make_shared<std::atomic<int>>(0);
    int result = retry.execute_with_retry([calls]() {
        if (calls->fetch_add(1) < 2) {
            throw std::runtime_error("transient");
        }
        return 99;
    });

    REQUIRE(result == 99);
    REQUIRE(calls->load() == 3);

    auto stats = retry.stats();
    REQUIRE(stats.total_executions == 1);
    REQUIRE(stats.total_attempts == 3);
    REQUIRE(stats.total_retries == 2);
    REQUIRE(stats.successful_executions == 1);
}

TEST_CASE("RetryManager - Gives up after max_retries", "[retry]") {
    RetryManager retry("svc", quick_config(2));

    auto calls = std::make_shared<std::atomic<int>>(0);
    REQUIRE_THROWS_WITH(retry.execute_with_retry([calls]() -> int {
        calls->fetch_add(1);
        throw std::runtime_error("still down");
    }),
                        "still down");

    REQUIRE(calls->load() == 3);
    REQUIRE(retry.stats().failed_executions == 1);
}

TEST_CASE("RetryManager - Status classification", "[retry]") {
    RetryManager retry("svc", quick_config());
    auto calls = std::make_shared<std::atomic<int>>(0);

    SECTION("4xx other than 429 is not retried") {
        REQUIRE_THROWS_AS(retry.execute_with_retry([calls]() -> int {
            calls->fetch_add(1);
            throw StatusError(404, "not found");
        }),
                          StatusError);
        REQUIRE(calls->load() == 1);
    }

    SECTION("503 is retried") {
        int value = retry.execute_with_retry([calls]() {
            if (calls->fetch_add(1) == 0) {
                throw StatusError(503, "unavailable");
            }
            return 1;
        });
        REQUIRE(value == 1);
        REQUIRE(calls->load() == 2);
    }

    SECTION("per-call status list overrides the config") {
        REQUIRE_THROWS_AS(retry.execute_with_retry(
                              [calls]() -> int {
                                  calls->fetch_add(1);
                                  throw StatusError(503, "unavailable");
                              },
                              std::nullopt, std::vector<uint16_t>{429}),
                          StatusError);
        REQUIRE(calls->load() == 1);
    }

    SECTION("default classifier") {
        std::vector<uint16_t> statuses{429, 500, 502, 503, 504};
        REQUIRE(default_retry_classifier(StatusError(429, "slow down"), statuses));
        REQUIRE_FALSE(default_retry_classifier(StatusError(400, "bad"), statuses));
        REQUIRE(default_retry_classifier(CallTimeoutError("svc", 10ms), statuses));
        REQUIRE_FALSE(
            default_retry_classifier(bulwark::core::CircuitOpenError("svc", 0ms), statuses));
        REQUIRE(default_retry_classifier(std::runtime_error("io"), statuses));
    }
}

TEST_CASE("RetryManager - Custom classifier", "[retry]") {
    RetryManager retry("svc", quick_config());
    retry.set_classifier([](const std::exception&, const std::vector<uint16_t>&) { return false; });

    auto calls = std::make_shared<std::atomic<int>>(0);
    REQUIRE_THROWS(retry.execute_with_retry([calls]() -> int {
        calls->fetch_add(1);
        throw std::runtime_error("io");
    }));
    REQUIRE(calls->load() == 1);
}

TEST_CASE("RetryManager - Budget fails fast instead of retrying", "[retry]") {
    RetryConfig config = quick_config();
    config.retry_budget_percent = 10.0;
    config.min_calls_before_budget = 0;
    RetryManager retry("svc", config);

    auto calls = std::make_shared<std::atomic<int>>(0);
    try {
        (void)retry.execute_with_retry([calls]() -> int {
            calls->fetch_add(1);
            throw std::runtime_error("io");
        });
        FAIL("expected RetryBudgetExceededError");
    } catch (const RetryBudgetExceededError& e) {
        // A single retry out of two calls would be 50%, above the 10% ceiling
        REQUIRE(e.retry_rate_percent() == 50.0);
        REQUIRE(e.budget_percent() == 10.0);
        REQUIRE(std::string(e.what()).find("retry rate 50.00% exceeds budget 10.00%") !=
                std::string::npos);
    }

    REQUIRE(calls->load() == 1);

    auto stats = retry.stats();
    REQUIRE(stats.budget_rejections == 1);
    REQUIRE(stats.budget.total_retries == 0);
}

TEST_CASE("RetryManager - Default budget lets a fresh dependency recover", "[retry]") {
    RetryConfig config;
    config.base_delay_ms = 1;
    config.max_delay_ms = 5;
    RetryManager retry("svc", config);

    auto calls = std::make_shared<std::atomic<int>>(0);
    int result = retry.execute_with_retry([calls]() {
        if (calls->fetch_add(1) < 2) {
            throw std::runtime_error("transient");
        }
        return 7;
    });

    REQUIRE(result == 7);
    REQUIRE(calls->load() == 3);
    REQUIRE(retry.stats().budget_rejections == 0);
}

TEST_CASE("RetryBudget - Ratio never exceeds the ceiling", "[retry]") {
    RetryBudget budget(20.0, std::chrono::seconds(60), 0);

    for (int i = 0; i < 100; ++i) {
        budget.record_attempt(false);
        if (budget.can_retry()) {
            REQUIRE(budget.try_acquire_retry());
        }
        REQUIRE(budget.retry_rate_percent() <= 20.0);
    }

    auto stats = budget.stats();
    REQUIRE(stats.total_retries > 0);
    REQUIRE(stats.retry_rate_percent <= 20.0);
    REQUIRE_FALSE(budget.is_exhausted());

    budget.reset();
    REQUIRE(budget.stats().total_calls == 0);
}

TEST_CASE("RetryBudget - Cold start grace", "[retry]") {
    SECTION("fresh budget allows a retry by default") {
        RetryBudget budget;
        REQUIRE(budget.can_retry());
        budget.record_attempt(false);
        REQUIRE(budget.try_acquire_retry());
    }

    SECTION("ceiling applies once the window is warm") {
        RetryBudget budget(10.0, std::chrono::seconds(60), 5);

        budget.record_attempt(false);
        REQUIRE(budget.try_acquire_retry());
        REQUIRE(budget.try_acquire_retry());
        budget.record_attempt(false);
        budget.record_attempt(false);

        // 5 calls, 2 retries: the grace is over and 3/6 is above 10%
        REQUIRE_FALSE(budget.can_retry());
        REQUIRE_FALSE(budget.try_acquire_retry());
        REQUIRE(budget.projected_retry_rate_percent() == 50.0);
        REQUIRE(budget.is_exhausted());
    }

    SECTION("zero grace is strict from the first call") {
        RetryBudget budget(10.0, std::chrono::seconds(60), 0);
        budget.record_attempt(false);
        REQUIRE_FALSE(budget.can_retry());
    }
}

TEST_CASE("RetryBudget - Window eviction", "[retry]") {
    RetryBudget budget(50.0, std::chrono::seconds(1));

    budget.record_attempt(false);
    REQUIRE(budget.try_acquire_retry());
    REQUIRE(budget.stats().total_calls == 2);

    std::this_thread::sleep_for(1100ms);
    REQUIRE(budget.stats().total_calls == 0);
}

TEST_CASE("RetryManager - Idempotency key executes once", "[retry]") {
    RetryManager retry("svc", quick_config());
    auto calls = std::make_shared<std::atomic<int>>(0);

    auto work = [calls]() {
        calls->fetch_add(1);
        return std::string("charged");
    };

    REQUIRE(retry.execute_with_retry(work, std::string("order-1")) == "charged");
    REQUIRE(retry.execute_with_retry(work, std::string("order-1")) == "charged");
    REQUIRE(calls->load() == 1);

    REQUIRE(retry.execute_with_retry(work, std::string("order-2")) == "charged");
    REQUIRE(calls->load() == 2);

    auto stats = retry.stats();
    REQUIRE(stats.idempotent_hits == 1);
    REQUIRE(stats.idempotency_entries == 2);

    SECTION("void calls are deduplicated too") {
        auto side_effects = std::make_shared<std::atomic<int>>(0);
        auto send = [side_effects]() { side_effects->fetch_add(1); };
        retry.execute_with_retry(send, std::string("email-7"));
        retry.execute_with_retry(send, std::string("email-7"));
        REQUIRE(side_effects->load() == 1);
    }

    SECTION("failed calls are not cached") {
        auto attempts = std::make_shared<std::atomic<int>>(0);
        auto flaky = [attempts]() -> int {
            attempts->fetch_add(1);
            throw StatusError(400, "bad request");
        };
        REQUIRE_THROWS(retry.execute_with_retry(flaky, std::string("bad-1")));
        REQUIRE_THROWS(retry.execute_with_retry(flaky, std::string("bad-1")));
        REQUIRE(attempts->load() == 2);
    }
}

TEST_CASE("IdempotencyCache - TTL and type safety", "[retry]") {
    IdempotencyCache cache(std::chrono::seconds(1));

    cache.put("k", 5);
    REQUIRE(cache.get<int>("k") == 5);
    REQUIRE_FALSE(cache.get<std::string>("k").has_value());

    REQUIRE(cache.erase("k"));
    REQUIRE_FALSE(cache.erase("k"));

    cache.put("a", 1);
    cache.put("b", 2);
    REQUIRE(cache.size() == 2);

    std::this_thread::sleep_for(1100ms);
    REQUIRE_FALSE(cache.get<int>("a").has_value());
    REQUIRE(cache.purge_expired() == 1);
    REQUIRE(cache.size() == 0);
}

TEST_CASE("IdempotencyCache - Writes sweep expired records", "[retry]") {
    IdempotencyCache cache(std::chrono::seconds(1));

    for (int i = 0; i < 1000; ++i) {
        cache.put(fmt::format("req-{}", i), i);
    }
    REQUIRE(cache.size() == 1000);

    // None of the earlier keys is looked up again
    std::this_thread::sleep_for(1100ms);
    cache.put("fresh", 1);

    REQUIRE(cache.size() == 1);
    REQUIRE(cache.get<int>("fresh") == 1);
}

TEST_CASE("RetryManager - Attempt observer", "[retry]") {
    RetryManager retry("svc", quick_config());

    std::vector<RetryAttempt> attempts;
    retry.set_attempt_observer([&](const RetryAttempt& a) { attempts.push_back(a); });

    auto calls = std::make_shared<std::atomic<int>>(0);
    retry.execute_with_retry([calls]() {
        if (calls->fetch_add(1) == 0) {
            throw std::runtime_error("first fails");
        }
        return 0;
    });

    REQUIRE(attempts.size() == 2);
    REQUIRE(attempts[0].attempt == 0);
    REQUIRE_FALSE(attempts[0].succeeded);
    REQUIRE(attempts[0].error == "first fails");
    REQUIRE(attempts[1].attempt == 1);
    REQUIRE(attempts[1].succeeded);
    REQUIRE(attempts[1].within_budget);
}

TEST_CASE("RetryManager - Attempts run under the adaptive timeout", "[retry]") {
    TimeoutConfig timeout_config;
    timeout_config.adaptive_enabled = false;
    timeout_config.default_timeout_ms = 30;
    auto timeout = std::make_shared<AdaptiveTimeout>("svc", timeout_config);

    RetryManager retry("svc", quick_config(1), timeout);

    auto calls = std::make_shared<std::atomic<int>>(0);
    auto cancelled = std::make_shared<std::atomic<bool>>(false);

    int value = retry.execute_with_retry([calls, cancelled](std::stop_token token) {
        if (calls->fetch_add(1) == 0) {
            // Hang until the deadline cancels this attempt
            while (!token.stop_requested()) {
                std::this_thread::sleep_for(1ms);
            }
            cancelled->store(true);
            return -1;
        }
        return 7;
    });

    REQUIRE(value == 7);
    REQUIRE(calls->load() == 2);

    std::this_thread::sleep_for(20ms);
    REQUIRE(cancelled->load());

    SECTION("timeouts surface as CallTimeoutError once retries run out") {
        RetryManager no_retry("svc", quick_config(0), timeout);
        REQUIRE_THROWS_AS(no_retry.execute_with_retry([](std::stop_token token) {
            while (!token.stop_requested()) {
                std::this_thread::sleep_for(1ms);
            }
        }),
                          CallTimeoutError);
    }
}
