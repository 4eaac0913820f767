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

// Bulwark Retry Budget - Implementation

#include "retry_budget.hpp"

#include <stdexcept>

namespace bulwark::resilience {

RetryBudget::RetryBudget(double budget_percent, std::chrono::seconds window,
                         uint32_t min_calls_before_budget)
    : budget_percent_(budget_percent)
    , window_(window)
    , min_calls_before_budget_(min_calls_before_budget) {
    if (budget_percent_ <= 0.0 || budget_percent_ > 100.0) {
        throw std::invalid_argument("retry budget percent must be in (0, 100]");
    }
    if (window_.count() <= 0) {
        throw std::invalid_argument("retry budget window must be > 0");
    }
}

void RetryBudget::evict(Clock::time_point now) {
    auto cutoff = now - window_;
    while (!entries_.empty() && entries_.front().at < cutoff) {
        --calls_;
        if (entries_.front().is_retry) {
            --retries_;
        }
        entries_.pop_front();
    }
}

bool RetryBudget::warming_up() const {
    return calls_ < min_calls_before_budget_;
}

bool RetryBudget::within_budget(uint64_t calls, uint64_t retries) const {
    if (calls == 0) {
        return retries == 0;
    }
    // retries / calls <= budget_percent / 100
    return static_cast<double>(retries) * 100.0 <=
           budget_percent_ * static_cast<double>(calls);
}

bool RetryBudget::can_retry() {
    std::lock_guard lock(mutex_);
    evict(Clock::now());
    return warming_up() || within_budget(calls_ + 1, retries_ + 1);
}

bool RetryBudget::is_exhausted() {
    std::lock_guard lock(mutex_);
    evict(Clock::now());
    return !warming_up() && !within_budget(calls_, retries_);
}

void RetryBudget::record_attempt(bool is_retry) {
    auto now = Clock::now();
    std::lock_guard lock(mutex_);
    evict(now);
    entries_.push_back(Entry{now, is_retry});
    ++calls_;
    if (is_retry) {
        ++retries_;
    }
}

bool RetryBudget::try_acquire_retry() {
    auto now = Clock::now();
    std::lock_guard lock(mutex_);
    evict(now);
    if (!warming_up() && !within_budget(calls_ + 1, retries_ + 1)) {
        return false;
    }
    entries_.push_back(Entry{now, true});
    ++calls_;
    ++retries_;
    return true;
}

double RetryBudget::retry_rate_percent() {
    std::lock_guard lock(mutex_);
    evict(Clock::now());
    if (calls_ == 0) {
        return 0.0;
    }
    return static_cast<double>(retries_) * 100.0 / static_cast<double>(calls_);
}

double RetryBudget::projected_retry_rate_percent() {
    std::lock_guard lock(mutex_);
    evict(Clock::now());
    return static_cast<double>(retries_ + 1) * 100.0 / static_cast<double>(calls_ + 1);
}

RetryBudgetStats RetryBudget::stats() {
    std::lock_guard lock(mutex_);
    evict(Clock::now());

    RetryBudgetStats s;
    s.total_calls = calls_;
    s.total_retries = retries_;
    s.retry_rate_percent =
        calls_ == 0 ? 0.0 : static_cast<double>(retries_) * 100.0 / static_cast<double>(calls_);
    s.budget_percent = budget_percent_;
    s.window_seconds = static_cast<uint32_t>(window_.count());
    return s;
}

void RetryBudget::reset() {
    std::lock_guard lock(mutex_);
    entries_.clear();
    calls_ = 0;
    retries_ = 0;
}

}  // namespace bulwark::resilience
