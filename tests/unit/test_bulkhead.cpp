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

// Unit tests for Bulkhead

#include <algorithm>
#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "../../src/core/errors.hpp"
#include "../../src/resilience/bulkhead.hpp"

using namespace bulwark::resilience;
using bulwark::core::BulkheadFullError;
using bulwark::core::BulkheadTimeoutError;
using namespace std::chrono_literals;

namespace {

void wait_for_queue(const Bulkhead& bulkhead, uint32_t expected) {
    for (int i = 0; i < 500 && bulkhead.queued_calls() < expected; ++i) {
        std::this_thread::sleep_for(1ms);
    }
    REQUIRE(bulkhead.queued_calls() == expected);
}

// Queue one waiter per priority behind a held permit, then record service order
std::vector<Priority> service_order(bool priority_enabled) {
    BulkheadConfig config;
    config.max_concurrent_calls = 1;
    config.max_queue_size = 10;
    config.timeout_ms = 0;
    config.priority_enabled = priority_enabled;
    Bulkhead bulkhead("ordered", config);

    auto held = bulkhead.acquire();

    std::mutex order_mutex;
    std::vector<Priority> order;
    std::vector<std::thread> threads;

    const std::vector<Priority> arrivals = {Priority::LOW, Priority::HIGH, Priority::CRITICAL,
                                            Priority::NORMAL};
    for (size_t i = 0; i < arrivals.size(); ++i) {
        Priority priority = arrivals[i];
        threads.emplace_back([&bulkhead, &order_mutex, &order, priority]() {
            bulkhead.execute(
                [&]() {
                    std::lock_guard lock(order_mutex);
                    order.push_back(priority);
                },
                priority);
        });
        wait_for_queue(bulkhead, static_cast<uint32_t>(i + 1));
    }

    held.release();
    for (auto& thread : threads) {
        thread.join();
    }
    return order;
}

}  // namespace

TEST_CASE("Bulkhead - Rejects zero concurrency", "[bulkhead]") {
    BulkheadConfig config;
    config.max_concurrent_calls = 0;
    REQUIRE_THROWS_AS(Bulkhead("svc", config), std::invalid_argument);
}

TEST_CASE("Bulkhead - Saturation rejects without invoking", "[bulkhead]") {
    BulkheadConfig config;
    config.max_concurrent_calls = 2;
    config.max_queue_size = 0;
    Bulkhead bulkhead("svc", config);

    auto first = bulkhead.acquire();
    auto second = bulkhead.acquire();
    REQUIRE(bulkhead.active_calls() == 2);

    bool invoked = false;
    REQUIRE_THROWS_AS(bulkhead.execute([&] { invoked = true; }), BulkheadFullError);
    REQUIRE_FALSE(invoked);
    REQUIRE_FALSE(bulkhead.try_acquire().has_value());

    first.release();
    REQUIRE(bulkhead.active_calls() == 1);
    REQUIRE(bulkhead.execute([] { return 5; }) == 5);

    auto stats = bulkhead.stats();
    REQUIRE(stats.rejected_calls == 1);
    REQUIRE(stats.accepted_calls == 3);
    REQUIRE(stats.peak_active_calls == 2);
}

TEST_CASE("Bulkhead - Permit is released however the call ends", "[bulkhead]") {
    BulkheadConfig config;
    config.max_concurrent_calls = 1;
    config.max_queue_size = 0;
    Bulkhead bulkhead("svc", config);

    REQUIRE_THROWS_AS(bulkhead.execute([]() -> int { throw std::runtime_error("boom"); }),
                      std::runtime_error);
    REQUIRE(bulkhead.active_calls() == 0);

    {
        auto permit = bulkhead.try_acquire();
        REQUIRE(permit.has_value());
        REQUIRE(permit->valid());
        REQUIRE(bulkhead.active_calls() == 1);

        Bulkhead::Permit moved = std::move(*permit);
        REQUIRE_FALSE(permit->valid());
        REQUIRE(moved.valid());
    }
    REQUIRE(bulkhead.active_calls() == 0);

    auto stats = bulkhead.stats();
    REQUIRE(stats.failed_calls == 1);
}

TEST_CASE("Bulkhead - Queue wait times out", "[bulkhead]") {
    BulkheadConfig config;
    config.max_concurrent_calls = 1;
    config.max_queue_size = 1;
    config.timeout_ms = 30;
    Bulkhead bulkhead("svc", config);

    auto held = bulkhead.acquire();

    auto start = std::chrono::steady_clock::now();
    REQUIRE_THROWS_AS(bulkhead.acquire(), BulkheadTimeoutError);
    REQUIRE(std::chrono::steady_clock::now() - start >= 30ms);

    REQUIRE(bulkhead.queued_calls() == 0);
    REQUIRE(bulkhead.stats().timed_out_calls == 1);
}

TEST_CASE("Bulkhead - Queued call is served when a slot frees", "[bulkhead]") {
    BulkheadConfig config;
    config.max_concurrent_calls = 1;
    config.max_queue_size = 1;
    config.timeout_ms = 2000;
    Bulkhead bulkhead("svc", config);

    auto held = bulkhead.acquire();

    std::atomic<bool> served{false};
    std::thread waiter([&]() {
        bulkhead.execute([&] { served = true; });
    });
    wait_for_queue(bulkhead, 1);

    SECTION("queue full rejects the next caller") {
        REQUIRE_THROWS_AS(bulkhead.acquire(), BulkheadFullError);
    }

    held.release();
    waiter.join();
    REQUIRE(served.load());
    REQUIRE(bulkhead.active_calls() == 0);
}

TEST_CASE("Bulkhead - Priority ordering", "[bulkhead]") {
    SECTION("highest priority first when enabled") {
        auto order = service_order(true);
        REQUIRE(order == std::vector<Priority>{Priority::CRITICAL, Priority::HIGH,
                                               Priority::NORMAL, Priority::LOW});
    }

    SECTION("FIFO when disabled") {
        auto order = service_order(false);
        REQUIRE(order == std::vector<Priority>{Priority::LOW, Priority::HIGH, Priority::CRITICAL,
                                               Priority::NORMAL});
    }
}

TEST_CASE("Bulkhead - Concurrency never exceeds the limit", "[bulkhead][race]") {
    BulkheadConfig config;
    config.max_concurrent_calls = 3;
    config.max_queue_size = 100;
    config.timeout_ms = 5000;
    Bulkhead bulkhead("svc", config);

    std::atomic<int> current{0};
    std::atomic<int> observed_max{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 12; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 5; ++i) {
                bulkhead.execute([&]() {
                    int now = current.fetch_add(1) + 1;
                    int prev = observed_max.load();
                    while (now > prev && !observed_max.compare_exchange_weak(prev, now)) {
                    }
                    std::this_thread::sleep_for(1ms);
                    current.fetch_sub(1);
                });
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(observed_max.load() <= 3);
    auto stats = bulkhead.stats();
    REQUIRE(stats.accepted_calls == 60);
    REQUIRE(stats.successful_calls == 60);
    REQUIRE(stats.active_calls == 0);
    REQUIRE(stats.peak_active_calls <= 3);
}

TEST_CASE("Bulkhead - to_string", "[bulkhead]") {
    REQUIRE(to_string(Priority::LOW) == "LOW");
    REQUIRE(to_string(Priority::CRITICAL) == "CRITICAL");
}
