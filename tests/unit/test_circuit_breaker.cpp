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

// Unit tests for CircuitBreaker

#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

#include "../../src/core/errors.hpp"
#include "../../src/resilience/circuit_breaker.hpp"

using namespace bulwark::resilience;
using bulwark::core::CircuitOpenError;
using namespace std::chrono_literals;

namespace {

CircuitBreakerConfig fast_config() {
    CircuitBreakerConfig config;
    config.failure_threshold = 2;
    config.success_threshold = 2;
    config.timeout_ms = 50;
    config.half_open_max_calls = 3;
    return config;
}

void fail_once(CircuitBreaker& breaker) {
    REQUIRE_THROWS_AS(breaker.call([]() -> int { throw std::runtime_error("down"); }),
                      std::runtime_error);
}

}  // namespace

TEST_CASE("CircuitBreaker - Basic construction", "[circuit_breaker]") {
    CircuitBreaker breaker("db");

    REQUIRE(breaker.name() == "db");
    REQUIRE(breaker.get_state() == CircuitState::CLOSED);

    auto stats = breaker.stats();
    REQUIRE(stats.total_calls == 0);
    REQUIRE(stats.rejected_calls == 0);
    REQUIRE_FALSE(stats.last_failure_time.has_value());
    REQUIRE(stats.failure_rate() == 0.0);
}

TEST_CASE("CircuitBreaker - Rejects impossible thresholds", "[circuit_breaker]") {
    CircuitBreakerConfig config;
    config.failure_threshold = 0;
    REQUIRE_THROWS_AS(CircuitBreaker("db", config), std::invalid_argument);

    config.failure_threshold = 1;
    config.success_threshold = 0;
    REQUIRE_THROWS_AS(CircuitBreaker("db", config), std::invalid_argument);
}

TEST_CASE("CircuitBreaker - to_string conversion", "[circuit_breaker]") {
    REQUIRE(to_string(CircuitState::CLOSED) == "CLOSED");
    REQUIRE(to_string(CircuitState::OPEN) == "OPEN");
    REQUIRE(to_string(CircuitState::HALF_OPEN) == "HALF_OPEN");
}

TEST_CASE("CircuitBreaker - Passes results through while CLOSED", "[circuit_breaker]") {
    CircuitBreaker breaker("db", fast_config());

    REQUIRE(breaker.call([] { return 42; }) == 42);

    int side_effect = 0;
    breaker.call([&] { side_effect = 7; });
    REQUIRE(side_effect == 7);

    auto stats = breaker.stats();
    REQUIRE(stats.total_calls == 2);
    REQUIRE(stats.total_successes == 2);
}

TEST_CASE("CircuitBreaker - Opens after consecutive failures", "[circuit_breaker]") {
    CircuitBreaker breaker("db", fast_config());

    SECTION("a success between failures resets the count") {
        fail_once(breaker);
        breaker.call([] { return 1; });
        fail_once(breaker);
        REQUIRE(breaker.get_state() == CircuitState::CLOSED);
    }

    SECTION("threshold consecutive failures open the circuit") {
        fail_once(breaker);
        fail_once(breaker);
        REQUIRE(breaker.get_state() == CircuitState::OPEN);
        REQUIRE(breaker.stats().last_failure_time.has_value());
    }
}

TEST_CASE("CircuitBreaker - OPEN rejects without invoking", "[circuit_breaker]") {
    CircuitBreaker breaker("db", fast_config());
    fail_once(breaker);
    fail_once(breaker);

    bool invoked = false;
    try {
        breaker.call([&] {
            invoked = true;
            return 1;
        });
        FAIL("expected CircuitOpenError");
    } catch (const CircuitOpenError& e) {
        REQUIRE(e.dependency() == "db");
        REQUIRE(e.retry_after() <= 50ms);
    }

    REQUIRE_FALSE(invoked);
    REQUIRE(breaker.stats().rejected_calls == 1);
}

TEST_CASE("CircuitBreaker - End-to-end recovery", "[circuit_breaker]") {
    CircuitBreaker breaker("db", fast_config());

    fail_once(breaker);
    fail_once(breaker);
    REQUIRE(breaker.get_state() == CircuitState::OPEN);
    REQUIRE_THROWS_AS(breaker.call([] { return 1; }), CircuitOpenError);

    std::this_thread::sleep_for(80ms);

    // First call after the timeout is a trial call
    REQUIRE(breaker.call([] { return 1; }) == 1);
    REQUIRE(breaker.get_state() == CircuitState::HALF_OPEN);

    REQUIRE(breaker.call([] { return 2; }) == 2);
    REQUIRE(breaker.get_state() == CircuitState::CLOSED);

    auto stats = breaker.stats();
    REQUIRE(stats.failure_count == 0);
    REQUIRE(stats.state_transitions == 3);
}

TEST_CASE("CircuitBreaker - HALF_OPEN failure reopens", "[circuit_breaker]") {
    CircuitBreaker breaker("db", fast_config());
    fail_once(breaker);
    fail_once(breaker);

    std::this_thread::sleep_for(80ms);

    fail_once(breaker);
    REQUIRE(breaker.get_state() == CircuitState::OPEN);
    REQUIRE_THROWS_AS(breaker.call([] { return 1; }), CircuitOpenError);
}

TEST_CASE("CircuitBreaker - HALF_OPEN caps concurrent trial calls", "[circuit_breaker]") {
    auto config = fast_config();
    config.half_open_max_calls = 1;
    CircuitBreaker breaker("db", config);

    breaker.force_open();
    std::this_thread::sleep_for(80ms);

    // Reserve the only trial slot without completing the call
    REQUIRE(breaker.allow_request());
    REQUIRE(breaker.get_state() == CircuitState::HALF_OPEN);
    REQUIRE_FALSE(breaker.allow_request());

    breaker.record_success();
    REQUIRE(breaker.allow_request());
}

TEST_CASE("CircuitBreaker - Outcome from an earlier state is not a trial result",
          "[circuit_breaker]") {
    auto config = fast_config();
    config.success_threshold = 1;
    config.half_open_max_calls = 1;
    CircuitBreaker breaker("db", config);

    SECTION("late success") {
        // Admitted while CLOSED, completes after the breaker reached HALF_OPEN
        int result = breaker.call([&breaker]() {
            breaker.force_open();
            std::this_thread::sleep_for(80ms);
            REQUIRE(breaker.allow_request());
            return 1;
        });
        REQUIRE(result == 1);

        REQUIRE(breaker.get_state() == CircuitState::HALF_OPEN);
        REQUIRE(breaker.stats().success_count == 0);
        REQUIRE(breaker.stats().total_successes == 1);

        // The trial slot still belongs to the HALF_OPEN call
        REQUIRE_FALSE(breaker.allow_request());
        breaker.record_success();
        REQUIRE(breaker.get_state() == CircuitState::CLOSED);
    }

    SECTION("late failure") {
        REQUIRE_THROWS_AS(breaker.call([&breaker]() -> int {
            breaker.force_open();
            std::this_thread::sleep_for(80ms);
            REQUIRE(breaker.allow_request());
            throw std::runtime_error("slow and down");
        }),
                          std::runtime_error);

        REQUIRE(breaker.get_state() == CircuitState::HALF_OPEN);
        REQUIRE(breaker.stats().total_failures == 1);
    }
}

TEST_CASE("CircuitBreaker - Policy rejections do not count as failures", "[circuit_breaker]") {
    CircuitBreaker breaker("db", fast_config());

    for (int i = 0; i < 5; ++i) {
        REQUIRE_THROWS_AS(breaker.call([]() -> int {
            throw bulwark::core::BulkheadFullError("db", 1, 1);
        }),
                          bulwark::core::BulkheadFullError);
    }

    REQUIRE(breaker.get_state() == CircuitState::CLOSED);
    REQUIRE(breaker.stats().total_failures == 0);
}

TEST_CASE("CircuitBreaker - Expected error predicate", "[circuit_breaker]") {
    CircuitBreaker breaker("db", fast_config(), [](const std::exception& e) {
        return dynamic_cast<const std::runtime_error*>(&e) != nullptr;
    });

    for (int i = 0; i < 3; ++i) {
        REQUIRE_THROWS_AS(breaker.call([]() -> int { throw std::logic_error("caller bug"); }),
                          std::logic_error);
    }
    REQUIRE(breaker.get_state() == CircuitState::CLOSED);

    fail_once(breaker);
    fail_once(breaker);
    REQUIRE(breaker.get_state() == CircuitState::OPEN);
}

TEST_CASE("CircuitBreaker - Reset and force open", "[circuit_breaker]") {
    CircuitBreaker breaker("db", fast_config());

    breaker.force_open();
    REQUIRE(breaker.get_state() == CircuitState::OPEN);
    REQUIRE_FALSE(breaker.allow_request());

    breaker.reset();
    REQUIRE(breaker.get_state() == CircuitState::CLOSED);
    REQUIRE(breaker.allow_request());
    REQUIRE(breaker.stats().failure_count == 0);
}

TEST_CASE("CircuitBreaker - State change callback", "[circuit_breaker]") {
    CircuitBreaker breaker("db", fast_config());

    std::vector<StateChangeEvent> events;
    breaker.set_on_state_change([&](const StateChangeEvent& e) { events.push_back(e); });

    fail_once(breaker);
    fail_once(breaker);
    breaker.reset();

    REQUIRE(events.size() == 2);
    REQUIRE(events[0].from == CircuitState::CLOSED);
    REQUIRE(events[0].to == CircuitState::OPEN);
    REQUIRE(events[0].dependency == "db");
    REQUIRE(events[1].to == CircuitState::CLOSED);
}

TEST_CASE("CircuitBreaker - Concurrent failures trip exactly once", "[circuit_breaker][race]") {
    CircuitBreakerConfig config;
    config.failure_threshold = 50;
    config.timeout_ms = 60000;
    CircuitBreaker breaker("db", config);

    std::atomic<int> transitions{0};
    breaker.set_on_state_change([&](const StateChangeEvent&) { transitions.fetch_add(1); });

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 25; ++i) {
                breaker.record_failure();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(breaker.get_state() == CircuitState::OPEN);
    REQUIRE(transitions.load() == 1);
    REQUIRE(breaker.stats().total_failures == 200);
}
