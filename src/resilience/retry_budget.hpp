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

// Bulwark Retry Budget - Header
// Caps the fraction of traffic to a dependency that may be retries

#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>

namespace bulwark::resilience {

struct RetryBudgetStats {
    uint64_t total_calls = 0;
    uint64_t total_retries = 0;
    double retry_rate_percent = 0.0;
    double budget_percent = 0.0;
    uint32_t window_seconds = 0;
};

/// Sliding time window of attempts and retries.
///
/// Every attempt (first or retry) counts as a call; retries are also counted
/// as retries. A retry is permitted only when (retries + 1) / (calls + 1)
/// stays within the ceiling, so the measured ratio never exceeds it. While the
/// window holds fewer than min_calls_before_budget calls the ceiling is not
/// enforced, so a fresh dependency can retry its first failures.
class RetryBudget {
public:
    using Clock = std::chrono::steady_clock;

    /// @param min_calls_before_budget Calls in the window before the ceiling is
    ///        enforced (0 = always enforced)
    explicit RetryBudget(double budget_percent = 10.0,
                         std::chrono::seconds window = std::chrono::seconds(60),
                         uint32_t min_calls_before_budget = 10);

    RetryBudget(const RetryBudget&) = delete;
    RetryBudget& operator=(const RetryBudget&) = delete;

    /// Whether one more retry keeps the ratio within the ceiling
    [[nodiscard]] bool can_retry();

    /// Whether the ratio is already above the ceiling (fail before first attempt)
    [[nodiscard]] bool is_exhausted();

    /// Count an attempt; retries are counted both as a call and as a retry
    void record_attempt(bool is_retry);

    /// Atomically check and count a retry attempt
    [[nodiscard]] bool try_acquire_retry();

    [[nodiscard]] double retry_rate_percent();

    /// Ratio the window would hold after one more retry
    [[nodiscard]] double projected_retry_rate_percent();
    [[nodiscard]] RetryBudgetStats stats();

    [[nodiscard]] double budget_percent() const noexcept { return budget_percent_; }

    void reset();

private:
    struct Entry {
        Clock::time_point at;
        bool is_retry;
    };

    /// Drop entries older than the window; caller holds mutex_
    void evict(Clock::time_point now);
    [[nodiscard]] bool warming_up() const;
    [[nodiscard]] bool within_budget(uint64_t calls, uint64_t retries) const;

    double budget_percent_;
    std::chrono::seconds window_;
    uint32_t min_calls_before_budget_;

    std::mutex mutex_;
    std::deque<Entry> entries_;
    uint64_t calls_ = 0;
    uint64_t retries_ = 0;
};

}  // namespace bulwark::resilience
