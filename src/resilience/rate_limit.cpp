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

// Bulwark Rate Limiting - Implementation

#include "rate_limit.hpp"

#include <algorithm>
#include <stdexcept>

#include "../core/errors.hpp"
#include "../core/logging.hpp"

namespace bulwark::resilience {

namespace {

double elapsed_seconds(std::chrono::steady_clock::time_point from,
                       std::chrono::steady_clock::time_point to) {
    return std::chrono::duration<double>(to - from).count();
}

}  // namespace

// RateLimiter

bool RateLimiter::allow() {
    if (try_admit()) {
        allowed_.fetch_add(1, std::memory_order_relaxed);
        return true;
    }

    denied_.fetch_add(1, std::memory_order_relaxed);
    auto* logger = logging::get_logger();
    LOG_DEBUG(logger, "Rate limit denied: limiter={}, algorithm={}", name_, to_string(algorithm_));
    return false;
}

void RateLimiter::enforce() {
    if (!allow()) {
        throw core::RateLimitExceededError(name_);
    }
}

RateLimiterStats RateLimiter::stats() const {
    RateLimiterStats s;
    s.name = name_;
    s.algorithm = algorithm_;
    s.allowed = allowed_.load(std::memory_order_relaxed);
    s.denied = denied_.load(std::memory_order_relaxed);
    s.level = level();
    s.capacity = capacity_value();
    return s;
}

// TokenBucket

TokenBucket::TokenBucket(std::string name, double capacity, double refill_rate)
    : RateLimiter(std::move(name), RateLimitAlgorithm::TOKEN_BUCKET)
    , capacity_(capacity)
    , refill_rate_(refill_rate)
    , tokens_(capacity)
    , last_refill_(std::chrono::steady_clock::now()) {
    if (capacity_ <= 0.0) {
        throw std::invalid_argument("token bucket capacity must be > 0");
    }
    if (refill_rate_ < 0.0) {
        throw std::invalid_argument("token bucket refill_rate must be >= 0");
    }
}

void TokenBucket::refill(std::chrono::steady_clock::time_point now) const {
    double elapsed = elapsed_seconds(last_refill_, now);
    if (elapsed <= 0.0) {
        return;
    }
    tokens_ = std::min(capacity_, tokens_ + elapsed * refill_rate_);
    last_refill_ = now;
}

bool TokenBucket::consume(double tokens) {
    std::lock_guard lock(mutex_);
    refill(std::chrono::steady_clock::now());

    if (tokens_ >= tokens) {
        tokens_ -= tokens;
        return true;
    }
    return false;
}

double TokenBucket::available() const {
    std::lock_guard lock(mutex_);
    refill(std::chrono::steady_clock::now());
    return tokens_;
}

void TokenBucket::reset() {
    std::lock_guard lock(mutex_);
    tokens_ = capacity_;
    last_refill_ = std::chrono::steady_clock::now();
}

// SlidingWindowCounter

SlidingWindowCounter::SlidingWindowCounter(std::string name, uint32_t limit,
                                           std::chrono::nanoseconds window)
    : RateLimiter(std::move(name), RateLimitAlgorithm::SLIDING_WINDOW)
    , limit_(limit)
    , window_(window) {
    if (limit_ == 0) {
        throw std::invalid_argument("sliding window limit must be > 0");
    }
    if (window_.count() <= 0) {
        throw std::invalid_argument("sliding window length must be > 0");
    }
}

void SlidingWindowCounter::evict(std::chrono::steady_clock::time_point now) const {
    auto cutoff = now - window_;
    while (!timestamps_.empty() && timestamps_.front() <= cutoff) {
        timestamps_.pop_front();
    }
}

bool SlidingWindowCounter::try_admit() {
    auto now = std::chrono::steady_clock::now();
    std::lock_guard lock(mutex_);
    evict(now);

    if (timestamps_.size() < limit_) {
        timestamps_.push_back(now);
        return true;
    }
    return false;
}

size_t SlidingWindowCounter::count() const {
    std::lock_guard lock(mutex_);
    evict(std::chrono::steady_clock::now());
    return timestamps_.size();
}

void SlidingWindowCounter::reset() {
    std::lock_guard lock(mutex_);
    timestamps_.clear();
}

// LeakyBucket

LeakyBucket::LeakyBucket(std::string name, double capacity, double leak_rate)
    : RateLimiter(std::move(name), RateLimitAlgorithm::LEAKY_BUCKET)
    , capacity_(capacity)
    , leak_rate_(leak_rate)
    , last_leak_(std::chrono::steady_clock::now()) {
    if (capacity_ <= 0.0) {
        throw std::invalid_argument("leaky bucket capacity must be > 0");
    }
    if (leak_rate_ < 0.0) {
        throw std::invalid_argument("leaky bucket leak_rate must be >= 0");
    }
}

void LeakyBucket::leak(std::chrono::steady_clock::time_point now) const {
    double elapsed = elapsed_seconds(last_leak_, now);
    if (elapsed <= 0.0) {
        return;
    }
    level_ = std::max(0.0, level_ - elapsed * leak_rate_);
    last_leak_ = now;
}

bool LeakyBucket::try_admit() {
    std::lock_guard lock(mutex_);
    leak(std::chrono::steady_clock::now());

    if (level_ < capacity_) {
        level_ += 1.0;
        return true;
    }
    return false;
}

double LeakyBucket::queue_level() const {
    std::lock_guard lock(mutex_);
    leak(std::chrono::steady_clock::now());
    return level_;
}

void LeakyBucket::reset() {
    std::lock_guard lock(mutex_);
    level_ = 0.0;
    last_leak_ = std::chrono::steady_clock::now();
}

// Factory

std::unique_ptr<RateLimiter> make_rate_limiter(const RateLimiterConfig& config) {
    switch (config.algorithm) {
        case RateLimitAlgorithm::TOKEN_BUCKET:
            return std::make_unique<TokenBucket>(config.name, config.capacity, config.refill_rate);

        case RateLimitAlgorithm::SLIDING_WINDOW: {
            if (config.window_seconds <= 0.0) {
                throw std::invalid_argument("sliding window length must be > 0");
            }
            auto window = std::chrono::duration_cast<std::chrono::nanoseconds>(
                std::chrono::duration<double>(config.window_seconds));
            return std::make_unique<SlidingWindowCounter>(config.name, config.limit, window);
        }

        case RateLimitAlgorithm::LEAKY_BUCKET:
            return std::make_unique<LeakyBucket>(config.name, config.capacity, config.leak_rate);
    }
    throw std::invalid_argument("unknown rate limit algorithm");
}

std::optional<RateLimitAlgorithm> parse_rate_limit_algorithm(std::string_view name) noexcept {
    if (name == "token_bucket") return RateLimitAlgorithm::TOKEN_BUCKET;
    if (name == "sliding_window") return RateLimitAlgorithm::SLIDING_WINDOW;
    if (name == "leaky_bucket") return RateLimitAlgorithm::LEAKY_BUCKET;
    return std::nullopt;
}

// KeyedRateLimiter

KeyedRateLimiter::KeyedRateLimiter(RateLimiterConfig config) : config_(std::move(config)) {
    // Validates the config
    (void)make_rate_limiter(config_);
}

bool KeyedRateLimiter::allow(std::string_view key) {
    std::string key_str{key};

    std::lock_guard lock(mutex_);
    auto it = limiters_.find(key_str);
    if (it == limiters_.end()) {
        RateLimiterConfig per_key = config_;
        per_key.name = config_.name.empty() ? key_str : config_.name + ":" + key_str;
        it = limiters_.emplace(std::move(key_str), make_rate_limiter(per_key)).first;
    }
    return it->second->allow();
}

void KeyedRateLimiter::reset(std::string_view key) {
    std::lock_guard lock(mutex_);
    auto it = limiters_.find(std::string(key));
    if (it != limiters_.end()) {
        it->second->reset();
    }
}

void KeyedRateLimiter::clear() {
    std::lock_guard lock(mutex_);
    limiters_.clear();
}

size_t KeyedRateLimiter::key_count() const {
    std::lock_guard lock(mutex_);
    return limiters_.size();
}

}  // namespace bulwark::resilience
