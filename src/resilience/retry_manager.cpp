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

// Bulwark Retry Manager - Implementation

#include "retry_manager.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

#include "../core/errors.hpp"
#include "../core/logging.hpp"

namespace bulwark::resilience {

namespace {

double fibonacci(uint32_t n) {
    double a = 0.0;
    double b = 1.0;
    for (uint32_t i = 0; i < n; ++i) {
        double next = a + b;
        a = b;
        b = next;
    }
    return a;
}

double jitter_factor(double jitter) {
    if (jitter <= 0.0) {
        return 1.0;
    }
    thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_real_distribution<double> dist(-1.0, 1.0);
    return 1.0 + jitter * dist(rng);
}

}  // namespace

bool default_retry_classifier(const std::exception& error,
                              const std::vector<uint16_t>& retry_on_status) {
    if (const auto* status = dynamic_cast<const core::StatusError*>(&error)) {
        return std::find(retry_on_status.begin(), retry_on_status.end(), status->status()) !=
               retry_on_status.end();
    }
    if (const auto* policy = dynamic_cast<const core::ResilienceError*>(&error)) {
        return policy->errc() == core::ResilienceErrc::call_timeout;
    }
    return true;
}

std::optional<BackoffStrategy> parse_backoff_strategy(std::string_view name) noexcept {
    if (name == "exponential") return BackoffStrategy::EXPONENTIAL;
    if (name == "linear") return BackoffStrategy::LINEAR;
    if (name == "fibonacci") return BackoffStrategy::FIBONACCI;
    if (name == "constant") return BackoffStrategy::CONSTANT;
    return std::nullopt;
}

RetryManager::RetryManager(std::string name, RetryConfig config,
                           std::shared_ptr<AdaptiveTimeout> timeout)
    : name_(std::move(name))
    , config_(std::move(config))
    , timeout_(std::move(timeout))
    , budget_(config_.retry_budget_percent,
              std::chrono::seconds(config_.retry_budget_window_seconds),
              config_.min_calls_before_budget)
    , cache_(std::chrono::seconds(config_.idempotency_ttl_seconds)) {
    if (config_.jitter_percent < 0.0 || config_.jitter_percent > 1.0) {
        throw std::invalid_argument("retry jitter_percent must be in [0, 1]");
    }
    if (config_.base_delay_ms > config_.max_delay_ms) {
        throw std::invalid_argument("retry base_delay_ms must not exceed max_delay_ms");
    }
    if (config_.multiplier < 1.0) {
        throw std::invalid_argument("retry multiplier must be >= 1");
    }
}

std::chrono::milliseconds RetryManager::base_delay(uint32_t attempt) const {
    // attempt 1 is the first retry; growth is indexed from zero
    uint32_t k = attempt == 0 ? 0 : attempt - 1;
    double base = static_cast<double>(config_.base_delay_ms);

    double delay = base;
    switch (config_.strategy) {
        case BackoffStrategy::EXPONENTIAL:
            delay = base * std::pow(config_.multiplier, static_cast<double>(k));
            break;
        case BackoffStrategy::LINEAR:
            delay = base * static_cast<double>(k + 1);
            break;
        case BackoffStrategy::FIBONACCI:
            delay = base * fibonacci(k + 2);
            break;
        case BackoffStrategy::CONSTANT:
            break;
    }

    delay = std::min(delay, static_cast<double>(config_.max_delay_ms));
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

std::chrono::milliseconds RetryManager::compute_delay(uint32_t attempt) const {
    double capped = static_cast<double>(base_delay(attempt).count());
    double jittered = capped * jitter_factor(config_.jitter_percent);
    jittered = std::clamp(jittered, 0.0, static_cast<double>(config_.max_delay_ms));
    return std::chrono::milliseconds(static_cast<int64_t>(jittered));
}

bool RetryManager::should_retry(const std::exception& error,
                                const std::vector<uint16_t>& retry_on_status) const {
    if (classifier_) {
        return classifier_(error, retry_on_status);
    }
    return default_retry_classifier(error, retry_on_status);
}

void RetryManager::check_budget_before_first_attempt() {
    if (!budget_.is_exhausted()) {
        return;
    }

    budget_rejections_.fetch_add(1, std::memory_order_relaxed);
    failed_executions_.fetch_add(1, std::memory_order_relaxed);

    double rate = budget_.retry_rate_percent();
    auto* logger = logging::get_logger();
    LOG_WARNING(logger, "Retry budget exhausted, failing fast: dependency={}, retry_rate={:.1f}%, "
                        "budget={:.1f}%",
                name_, rate, config_.retry_budget_percent);

    throw core::RetryBudgetExceededError(name_, rate, config_.retry_budget_percent);
}

void RetryManager::acquire_retry(uint32_t attempt, std::chrono::milliseconds delay,
                                 std::string_view error) {
    auto* logger = logging::get_logger();

    if (!budget_.try_acquire_retry()) {
        budget_rejections_.fetch_add(1, std::memory_order_relaxed);
        failed_executions_.fetch_add(1, std::memory_order_relaxed);

        double rate = budget_.projected_retry_rate_percent();
        LOG_WARNING(logger, "Retry budget exceeded: dependency={}, attempt={}, retry_rate={:.1f}%, "
                            "budget={:.1f}%, last_error={}",
                    name_, attempt, rate, config_.retry_budget_percent, error);
        report(RetryAttempt{attempt, delay, false, std::chrono::milliseconds(0), false,
                            std::string(error)});

        throw core::RetryBudgetExceededError(name_, rate, config_.retry_budget_percent);
    }

    total_retries_.fetch_add(1, std::memory_order_relaxed);
    LOG_DEBUG(logger, "Retry scheduled: dependency={}, attempt={}/{}, delay_ms={}, error={}",
              name_, attempt, config_.max_retries, delay.count(), error);
}

void RetryManager::report(RetryAttempt attempt) {
    if (observer_) {
        observer_(attempt);
    }
}

void RetryManager::log_giving_up(uint32_t attempts, std::string_view error, bool retryable) {
    if (attempts <= 1 && !retryable) {
        return;
    }
    auto* logger = logging::get_logger();
    LOG_INFO(logger, "Retries exhausted: dependency={}, attempts={}, retryable={}, error={}", name_,
             attempts, retryable, error);
}

RetryManagerStats RetryManager::stats() {
    RetryManagerStats s;
    s.total_executions = total_executions_.load(std::memory_order_relaxed);
    s.total_attempts = total_attempts_.load(std::memory_order_relaxed);
    s.total_retries = total_retries_.load(std::memory_order_relaxed);
    s.successful_executions = successful_executions_.load(std::memory_order_relaxed);
    s.failed_executions = failed_executions_.load(std::memory_order_relaxed);
    s.idempotent_hits = idempotent_hits_.load(std::memory_order_relaxed);
    s.budget_rejections = budget_rejections_.load(std::memory_order_relaxed);
    s.budget = budget_.stats();
    s.idempotency_entries = cache_.size();
    return s;
}

}  // namespace bulwark::resilience
