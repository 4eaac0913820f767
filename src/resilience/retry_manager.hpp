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

// Bulwark Retry Manager - Header
// Backoff with jitter, retry budget, idempotency and conditional retry

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "../core/deadline.hpp"
#include "adaptive_timeout.hpp"
#include "idempotency_cache.hpp"
#include "retry_budget.hpp"

namespace bulwark::resilience {

/// Delay growth between attempts
enum class BackoffStrategy : uint8_t {
    EXPONENTIAL,  // base × multiplier^attempt
    LINEAR,       // base × (attempt + 1)
    FIBONACCI,    // base × fib(attempt + 2)
    CONSTANT      // base
};

/// Retry configuration
struct RetryConfig {
    /// Retries after the first attempt
    uint32_t max_retries = 3;

    uint32_t base_delay_ms = 100;
    uint32_t max_delay_ms = 60000;

    /// Randomization fraction in [0, 1] applied as ±jitter_percent
    double jitter_percent = 0.5;

    BackoffStrategy strategy = BackoffStrategy::EXPONENTIAL;
    double multiplier = 2.0;

    /// Ceiling on retries / total calls, in percent
    double retry_budget_percent = 10.0;
    uint32_t retry_budget_window_seconds = 60;
    /// Calls in the window before the ceiling is enforced
    uint32_t min_calls_before_budget = 10;

    uint32_t idempotency_ttl_seconds = 3600;

    /// StatusError codes worth retrying
    std::vector<uint16_t> retry_on_status = {429, 500, 502, 503, 504};
};

/// One attempt of a call, reported to the attempt observer
struct RetryAttempt {
    uint32_t attempt = 0;                    // 0 = first attempt
    std::chrono::milliseconds delay{0};      // backoff slept before this attempt
    bool within_budget = true;
    std::chrono::milliseconds latency{0};
    bool succeeded = false;
    std::string error;
};

struct RetryManagerStats {
    uint64_t total_executions = 0;
    uint64_t total_attempts = 0;
    uint64_t total_retries = 0;
    uint64_t successful_executions = 0;
    uint64_t failed_executions = 0;
    uint64_t idempotent_hits = 0;
    uint64_t budget_rejections = 0;
    RetryBudgetStats budget;
    size_t idempotency_entries = 0;
};

/// Decides whether an error should be retried given the status list in effect
using RetryClassifier =
    std::function<bool(const std::exception&, const std::vector<uint16_t>& retry_on_status)>;

using AttemptObserver = std::function<void(const RetryAttempt&)>;

/// Default classification:
///   StatusError → retryable when its status is listed
///   CallTimeoutError → retryable
///   other policy rejections → not retryable
///   any other error → retryable
[[nodiscard]] bool default_retry_classifier(const std::exception& error,
                                            const std::vector<uint16_t>& retry_on_status);

/// Retry orchestration for one dependency.
///
/// Each attempt runs under the AdaptiveTimeout (when one is attached) and its
/// latency is fed back into it. Retries are gated by the RetryBudget.
class RetryManager {
public:
    explicit RetryManager(std::string name, RetryConfig config = {},
                          std::shared_ptr<AdaptiveTimeout> timeout = nullptr);

    RetryManager(const RetryManager&) = delete;
    RetryManager& operator=(const RetryManager&) = delete;

    /// Run fn with retries.
    ///
    /// fn may take a std::stop_token (signalled when an attempt times out).
    /// It must own everything it touches: a timed-out attempt keeps running
    /// in the background until it observes the stop request.
    ///
    /// @param idempotency_key When set, a live cached result is returned
    ///        without invoking fn, and a successful result is cached.
    /// @param retry_on_status Overrides the configured status list for this call
    template <typename Fn>
    core::call_result_t<Fn> execute_with_retry(
        Fn fn, std::optional<std::string> idempotency_key = std::nullopt,
        std::optional<std::vector<uint16_t>> retry_on_status = std::nullopt);

    /// Backoff before the given retry (1 = first retry), jitter included
    [[nodiscard]] std::chrono::milliseconds compute_delay(uint32_t attempt) const;

    /// Backoff before the given retry without jitter, capped at max_delay_ms
    [[nodiscard]] std::chrono::milliseconds base_delay(uint32_t attempt) const;

    void set_classifier(RetryClassifier classifier) { classifier_ = std::move(classifier); }
    void set_attempt_observer(AttemptObserver observer) { observer_ = std::move(observer); }

    [[nodiscard]] RetryManagerStats stats();

    [[nodiscard]] RetryBudget& budget() noexcept { return budget_; }
    [[nodiscard]] IdempotencyCache& idempotency_cache() noexcept { return cache_; }
    [[nodiscard]] const std::shared_ptr<AdaptiveTimeout>& adaptive_timeout() const noexcept {
        return timeout_;
    }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const RetryConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] bool should_retry(const std::exception& error,
                                    const std::vector<uint16_t>& retry_on_status) const;

    /// Fail fast when the budget is already exhausted before the first attempt
    void check_budget_before_first_attempt();

    /// Reserve budget for the next retry or throw RetryBudgetExceededError
    void acquire_retry(uint32_t attempt, std::chrono::milliseconds delay,
                       std::string_view error);

    void report(RetryAttempt attempt);
    void log_giving_up(uint32_t attempts, std::string_view error, bool retryable);

    std::string name_;
    RetryConfig config_;
    std::shared_ptr<AdaptiveTimeout> timeout_;
    RetryClassifier classifier_;
    AttemptObserver observer_;

    RetryBudget budget_;
    IdempotencyCache cache_;

    std::atomic<uint64_t> total_executions_{0};
    std::atomic<uint64_t> total_attempts_{0};
    std::atomic<uint64_t> total_retries_{0};
    std::atomic<uint64_t> successful_executions_{0};
    std::atomic<uint64_t> failed_executions_{0};
    std::atomic<uint64_t> idempotent_hits_{0};
    std::atomic<uint64_t> budget_rejections_{0};
};

template <typename Fn>
core::call_result_t<Fn> RetryManager::execute_with_retry(
    Fn fn, std::optional<std::string> idempotency_key,
    std::optional<std::vector<uint16_t>> retry_on_status) {
    using Result = core::call_result_t<Fn>;
    using Clock = std::chrono::steady_clock;

    total_executions_.fetch_add(1, std::memory_order_relaxed);

    if (idempotency_key) {
        if constexpr (std::is_void_v<Result>) {
            if (cache_.get<bool>(*idempotency_key)) {
                idempotent_hits_.fetch_add(1, std::memory_order_relaxed);
                successful_executions_.fetch_add(1, std::memory_order_relaxed);
                return;
            }
        } else {
            if (auto cached = cache_.get<Result>(*idempotency_key)) {
                idempotent_hits_.fetch_add(1, std::memory_order_relaxed);
                successful_executions_.fetch_add(1, std::memory_order_relaxed);
                return std::move(*cached);
            }
        }
    }

    const std::vector<uint16_t>& statuses =
        retry_on_status ? *retry_on_status : config_.retry_on_status;

    check_budget_before_first_attempt();

    // Shared so an abandoned attempt never outlives the callable
    auto work = std::make_shared<Fn>(std::move(fn));
    auto attempt_fn = [work](std::stop_token token) -> Result {
        return core::invoke_with_token(*work, std::move(token));
    };

    std::chrono::milliseconds delay{0};
    for (uint32_t attempt = 0;; ++attempt) {
        if (attempt == 0) {
            budget_.record_attempt(false);
        }
        total_attempts_.fetch_add(1, std::memory_order_relaxed);

        auto deadline = timeout_ ? timeout_->timeout() : std::chrono::milliseconds(0);
        auto start = Clock::now();
        auto elapsed = [start] {
            return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
        };

        try {
            if constexpr (std::is_void_v<Result>) {
                core::run_with_deadline(attempt_fn, deadline, name_);
                if (timeout_) timeout_->record_latency(static_cast<double>(elapsed().count()));
                report(RetryAttempt{attempt, delay, true, elapsed(), true, {}});
                if (idempotency_key) {
                    cache_.put(*idempotency_key, true);
                }
                successful_executions_.fetch_add(1, std::memory_order_relaxed);
                return;
            } else {
                Result result = core::run_with_deadline(attempt_fn, deadline, name_);
                if (timeout_) timeout_->record_latency(static_cast<double>(elapsed().count()));
                report(RetryAttempt{attempt, delay, true, elapsed(), true, {}});
                if constexpr (std::is_copy_constructible_v<Result>) {
                    if (idempotency_key) {
                        cache_.put(*idempotency_key, result);
                    }
                }
                successful_executions_.fetch_add(1, std::memory_order_relaxed);
                return result;
            }
        } catch (const std::exception& e) {
            auto latency = elapsed();
            if (timeout_) timeout_->record_latency(static_cast<double>(latency.count()));
            report(RetryAttempt{attempt, delay, true, latency, false, e.what()});

            bool retryable = should_retry(e, statuses);
            if (!retryable || attempt >= config_.max_retries) {
                failed_executions_.fetch_add(1, std::memory_order_relaxed);
                log_giving_up(attempt + 1, e.what(), retryable);
                throw;
            }

            delay = compute_delay(attempt + 1);
            acquire_retry(attempt + 1, delay, e.what());
        }

        std::this_thread::sleep_for(delay);
    }
}

[[nodiscard]] constexpr std::string_view to_string(BackoffStrategy strategy) noexcept {
    switch (strategy) {
        case BackoffStrategy::EXPONENTIAL:
            return "exponential";
        case BackoffStrategy::LINEAR:
            return "linear";
        case BackoffStrategy::FIBONACCI:
            return "fibonacci";
        case BackoffStrategy::CONSTANT:
            return "constant";
    }
    return "unknown";
}

/// Parse a strategy name; nullopt when unrecognised
[[nodiscard]] std::optional<BackoffStrategy> parse_backoff_strategy(std::string_view name) noexcept;

}  // namespace bulwark::resilience
