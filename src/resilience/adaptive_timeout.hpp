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

// Bulwark Adaptive Timeout - Header
// Call timeout derived from observed tail latency

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "percentile_tracker.hpp"

namespace bulwark::resilience {

/// Adaptive timeout configuration
struct TimeoutConfig {
    /// Derive the timeout from P95 (false = always default_timeout_ms)
    bool adaptive_enabled = true;

    /// Static timeout used until enough samples exist
    uint32_t default_timeout_ms = 30000;

    uint32_t min_timeout_ms = 10;
    uint32_t max_timeout_ms = 120000;

    size_t percentile_window = 1000;
    size_t min_samples = 20;

    /// Headroom applied to P95
    double multiplier = 1.5;
};

struct AdaptiveTimeoutStats {
    PercentileSnapshot latency;
    uint32_t current_timeout_ms = 0;
    bool adaptive = true;
};

/// timeout = clamp(P95 × multiplier, min_timeout_ms, max_timeout_ms)
class AdaptiveTimeout {
public:
    explicit AdaptiveTimeout(std::string name, TimeoutConfig config = {});

    AdaptiveTimeout(const AdaptiveTimeout&) = delete;
    AdaptiveTimeout& operator=(const AdaptiveTimeout&) = delete;

    /// Feed the wall-clock latency of a completed call (success or failure)
    void record_latency(double latency_ms);

    [[nodiscard]] uint32_t get_timeout_ms() const;

    [[nodiscard]] std::chrono::milliseconds timeout() const {
        return std::chrono::milliseconds(get_timeout_ms());
    }

    [[nodiscard]] AdaptiveTimeoutStats stats() const;

    void reset() { tracker_.reset(); }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const TimeoutConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] uint32_t compute(const PercentileSnapshot& snapshot) const;

    std::string name_;
    TimeoutConfig config_;
    PercentileTracker tracker_;
};

}  // namespace bulwark::resilience
