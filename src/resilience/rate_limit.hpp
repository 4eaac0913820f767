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

// Bulwark Rate Limiting - Header
// Token bucket, sliding window counter and leaky bucket behind one interface

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "../core/containers.hpp"

namespace bulwark::resilience {

enum class RateLimitAlgorithm : uint8_t { TOKEN_BUCKET, SLIDING_WINDOW, LEAKY_BUCKET };

/// Rate limiter configuration (fields apply per algorithm)
struct RateLimiterConfig {
    std::string name;
    RateLimitAlgorithm algorithm = RateLimitAlgorithm::TOKEN_BUCKET;

    double capacity = 100.0;       // token bucket burst size / leaky bucket depth
    double refill_rate = 10.0;     // token bucket: tokens per second
    uint32_t limit = 100;          // sliding window: calls per window
    double window_seconds = 60.0;  // sliding window length
    double leak_rate = 10.0;       // leaky bucket: drained per second
};

struct RateLimiterStats {
    std::string name;
    RateLimitAlgorithm algorithm = RateLimitAlgorithm::TOKEN_BUCKET;
    uint64_t allowed = 0;
    uint64_t denied = 0;

    /// Tokens available (token bucket), calls in window (sliding window)
    /// or queue level (leaky bucket)
    double level = 0.0;
    double capacity = 0.0;
};

/// Common shape of the admission-control algorithms
class RateLimiter {
public:
    RateLimiter(std::string name, RateLimitAlgorithm algorithm)
        : name_(std::move(name)), algorithm_(algorithm) {}
    virtual ~RateLimiter() = default;

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /// Admit one call?
    [[nodiscard]] bool allow();

    /// Admit one call or throw RateLimitExceededError
    void enforce();

    [[nodiscard]] RateLimiterStats stats() const;

    /// Return to the initial (fully available) state
    virtual void reset() = 0;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] RateLimitAlgorithm algorithm() const noexcept { return algorithm_; }

protected:
    /// Algorithm-specific admission decision (thread-safe)
    virtual bool try_admit() = 0;
    [[nodiscard]] virtual double level() const = 0;
    [[nodiscard]] virtual double capacity_value() const = 0;

private:
    std::string name_;
    RateLimitAlgorithm algorithm_;
    std::atomic<uint64_t> allowed_{0};
    std::atomic<uint64_t> denied_{0};
};

/// Token bucket: refilled lazily on every call, bursts up to capacity
class TokenBucket final : public RateLimiter {
public:
    /// @param capacity Maximum number of tokens (burst size); bucket starts full
    /// @param refill_rate Tokens added per second
    TokenBucket(std::string name, double capacity, double refill_rate);

    /// Try to consume N tokens without touching the allow/deny counters
    [[nodiscard]] bool consume(double tokens = 1.0);

    /// Currently available tokens (after refill)
    [[nodiscard]] double available() const;

    [[nodiscard]] double refill_rate() const noexcept { return refill_rate_; }

    void reset() override;

protected:
    bool try_admit() override { return consume(1.0); }
    [[nodiscard]] double level() const override { return available(); }
    [[nodiscard]] double capacity_value() const override { return capacity_; }

private:
    /// Refill based on elapsed time; caller holds mutex_
    void refill(std::chrono::steady_clock::time_point now) const;

    const double capacity_;
    const double refill_rate_;

    mutable std::mutex mutex_;
    mutable double tokens_;
    mutable std::chrono::steady_clock::time_point last_refill_;
};

/// Sliding window: timestamps of admitted calls within the trailing window
class SlidingWindowCounter final : public RateLimiter {
public:
    SlidingWindowCounter(std::string name, uint32_t limit, std::chrono::nanoseconds window);

    /// Admitted calls still inside the window
    [[nodiscard]] size_t count() const;

    [[nodiscard]] uint32_t limit() const noexcept { return limit_; }

    void reset() override;

protected:
    bool try_admit() override;
    [[nodiscard]] double level() const override { return static_cast<double>(count()); }
    [[nodiscard]] double capacity_value() const override { return limit_; }

private:
    /// Drop timestamps older than the window; caller holds mutex_
    void evict(std::chrono::steady_clock::time_point now) const;

    const uint32_t limit_;
    const std::chrono::nanoseconds window_;

    mutable std::mutex mutex_;
    mutable std::deque<std::chrono::steady_clock::time_point> timestamps_;
};

/// Leaky bucket: queue level drains at a constant rate, smoothing admission.
/// A request is admitted while the level is below capacity and adds one unit.
/// A leak rate of 0 never drains, so at most `capacity` requests are admitted.
class LeakyBucket final : public RateLimiter {
public:
    LeakyBucket(std::string name, double capacity, double leak_rate);

    /// Queue level after draining
    [[nodiscard]] double queue_level() const;

    void reset() override;

protected:
    bool try_admit() override;
    [[nodiscard]] double level() const override { return queue_level(); }
    [[nodiscard]] double capacity_value() const override { return capacity_; }

private:
    /// Drain based on elapsed time; caller holds mutex_
    void leak(std::chrono::steady_clock::time_point now) const;

    const double capacity_;
    const double leak_rate_;

    mutable std::mutex mutex_;
    mutable double level_ = 0.0;
    mutable std::chrono::steady_clock::time_point last_leak_;
};

/// Build the limiter selected by config.algorithm.
/// Throws std::invalid_argument for non-positive capacity, limit or window, and
/// for a negative refill or leak rate.
[[nodiscard]] std::unique_ptr<RateLimiter> make_rate_limiter(const RateLimiterConfig& config);

/// Independent limiter per caller key (e.g. client IP), all built from one config
class KeyedRateLimiter {
public:
    explicit KeyedRateLimiter(RateLimiterConfig config);

    KeyedRateLimiter(const KeyedRateLimiter&) = delete;
    KeyedRateLimiter& operator=(const KeyedRateLimiter&) = delete;

    /// Check if a call should be admitted for a key
    [[nodiscard]] bool allow(std::string_view key);

    /// Reset the limiter for a specific key
    void reset(std::string_view key);

    /// Forget all keys
    void clear();

    [[nodiscard]] size_t key_count() const;

    [[nodiscard]] const RateLimiterConfig& config() const noexcept { return config_; }

private:
    RateLimiterConfig config_;

    mutable std::mutex mutex_;
    core::fast_map<std::string, std::unique_ptr<RateLimiter>> limiters_;
};

[[nodiscard]] constexpr std::string_view to_string(RateLimitAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case RateLimitAlgorithm::TOKEN_BUCKET:
            return "token_bucket";
        case RateLimitAlgorithm::SLIDING_WINDOW:
            return "sliding_window";
        case RateLimitAlgorithm::LEAKY_BUCKET:
            return "leaky_bucket";
    }
    return "unknown";
}

[[nodiscard]] std::optional<RateLimitAlgorithm> parse_rate_limit_algorithm(
    std::string_view name) noexcept;

}  // namespace bulwark::resilience
