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

// Bulwark Resilience Benchmark
// Measures per-call overhead of the hot-path primitives

#include "../src/control/config.hpp"
#include "../src/core/logging.hpp"
#include "../src/resilience/bulkhead.hpp"
#include "../src/resilience/circuit_breaker.hpp"
#include "../src/resilience/percentile_tracker.hpp"
#include "../src/resilience/rate_limit.hpp"
#include "../src/resilience/retry_budget.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace bulwark::resilience;

// Benchmark helper
template<typename Func>
double benchmark(Func&& func, size_t iterations) {
    auto start = std::chrono::high_resolution_clock::now();

    for (size_t i = 0; i < iterations; i++) {
        func();
    }

    auto end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);
    return static_cast<double>(duration.count()) / iterations;
}

void print_row(const std::string& name, double ns_per_op) {
    std::cout << std::setw(36) << std::left << name
              << std::setw(12) << std::right << std::fixed << std::setprecision(2) << ns_per_op
              << " ns/op\n";
}

void benchmark_circuit_breaker() {
    std::cout << "\n=== Circuit Breaker ===\n";
    const size_t iterations = 5000000;

    CircuitBreaker closed("bench-closed");
    print_row("call (CLOSED, success)", benchmark([&]() {
        volatile int result = closed.call([] { return 1; });
        (void)result;
    }, iterations));

    print_row("allow_request (CLOSED)", benchmark([&]() {
        volatile bool allowed = closed.allow_request();
        (void)allowed;
        closed.record_success();
    }, iterations));

    CircuitBreakerConfig config;
    config.timeout_ms = 3600000;
    CircuitBreaker open("bench-open", config);
    open.force_open();
    print_row("allow_request (OPEN, rejected)", benchmark([&]() {
        volatile bool allowed = open.allow_request();
        (void)allowed;
    }, iterations));
}

void benchmark_rate_limiters() {
    std::cout << "\n=== Rate Limiters ===\n";
    const size_t iterations = 5000000;

    TokenBucket bucket("bench-token", 1e12, 1e12);
    print_row("TokenBucket::allow", benchmark([&]() {
        volatile bool allowed = bucket.allow();
        (void)allowed;
    }, iterations));

    LeakyBucket leaky("bench-leaky", 1e12, 1e12);
    print_row("LeakyBucket::allow", benchmark([&]() {
        volatile bool allowed = leaky.allow();
        (void)allowed;
    }, iterations));

    SlidingWindowCounter window("bench-window", 1000, std::chrono::milliseconds(1));
    print_row("SlidingWindowCounter::allow", benchmark([&]() {
        volatile bool allowed = window.allow();
        (void)allowed;
    }, iterations / 10));

    RateLimiterConfig keyed_config;
    keyed_config.name = "bench-keyed";
    keyed_config.capacity = 1e12;
    keyed_config.refill_rate = 1e12;
    KeyedRateLimiter keyed(keyed_config);
    std::vector<std::string> keys;
    for (int i = 0; i < 64; i++) {
        keys.push_back("tenant-" + std::to_string(i));
    }
    size_t next = 0;
    print_row("KeyedRateLimiter::allow (64 keys)", benchmark([&]() {
        volatile bool allowed = keyed.allow(keys[next++ % keys.size()]);
        (void)allowed;
    }, iterations / 5));
}

void benchmark_percentiles() {
    std::cout << "\n=== Percentile Tracker ===\n";
    std::mt19937 rng(42);
    std::lognormal_distribution<double> latency(3.0, 0.5);

    for (size_t window : {100, 1000, 10000}) {
        PercentileTracker tracker(window);
        print_row("record (window " + std::to_string(window) + ")", benchmark([&]() {
            tracker.record(latency(rng));
        }, 2000000));

        print_row("snapshot (window " + std::to_string(window) + ")", benchmark([&]() {
            volatile double p95 = tracker.snapshot().p95;
            (void)p95;
        }, 2000));
    }
}

void benchmark_bulkhead_and_budget() {
    std::cout << "\n=== Bulkhead / Retry Budget ===\n";
    const size_t iterations = 2000000;

    BulkheadConfig config;
    config.max_concurrent_calls = 64;
    Bulkhead bulkhead("bench-bulkhead", config);
    print_row("Bulkhead::try_acquire + release", benchmark([&]() {
        auto permit = bulkhead.try_acquire();
        (void)permit;
    }, iterations));

    print_row("Bulkhead::execute", benchmark([&]() {
        volatile int result = bulkhead.execute([] { return 1; });
        (void)result;
    }, iterations));

    RetryBudget budget(10.0, std::chrono::seconds(1));
    print_row("RetryBudget::record + try_acquire", benchmark([&]() {
        budget.record_attempt(false);
        volatile bool granted = budget.try_acquire_retry();
        (void)granted;
    }, iterations));
}

void benchmark_contended_breaker() {
    std::cout << "\n=== Contended Circuit Breaker ===\n";
    const size_t iterations = 500000;
    CircuitBreaker breaker("bench-contended");

    for (unsigned threads : {1u, 2u, 4u, 8u}) {
        auto start = std::chrono::high_resolution_clock::now();
        std::vector<std::thread> workers;
        for (unsigned t = 0; t < threads; t++) {
            workers.emplace_back([&]() {
                for (size_t i = 0; i < iterations; i++) {
                    volatile int result = breaker.call([] { return 1; });
                    (void)result;
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
        auto end = std::chrono::high_resolution_clock::now();
        double total_ns = static_cast<double>(
            std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count());
        print_row(std::to_string(threads) + " thread(s)", total_ns / (iterations * threads));
    }
}

int main() {
    bulwark::logging::init_logging_system();
    bulwark::control::LogConfig log_config;
    log_config.level = "error";
    log_config.format = "text";
    bulwark::logging::init_logger(log_config);

    std::cout << "Bulwark Resilience Benchmark\n";
    std::cout << "============================\n";

    benchmark_circuit_breaker();
    benchmark_rate_limiters();
    benchmark_percentiles();
    benchmark_bulkhead_and_budget();
    benchmark_contended_breaker();

    bulwark::logging::shutdown_logging();

    std::cout << "\n";
    return 0;
}
