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

#include "adaptive_timeout.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace bulwark::resilience {

AdaptiveTimeout::AdaptiveTimeout(std::string name, TimeoutConfig config)
    : name_(std::move(name))
    , config_(config)
    , tracker_(config.percentile_window) {
    if (config_.min_timeout_ms > config_.max_timeout_ms) {
        throw std::invalid_argument("min_timeout_ms must not exceed max_timeout_ms");
    }
    if (config_.multiplier <= 0.0) {
        throw std::invalid_argument("timeout multiplier must be > 0");
    }
}

void AdaptiveTimeout::record_latency(double latency_ms) {
    tracker_.record(latency_ms);
}

uint32_t AdaptiveTimeout::compute(const PercentileSnapshot& snapshot) const {
    if (!config_.adaptive_enabled || snapshot.sample_count < config_.min_samples) {
        return config_.default_timeout_ms;
    }

    double derived = std::ceil(snapshot.p95 * config_.multiplier);
    derived = std::clamp(derived, static_cast<double>(config_.min_timeout_ms),
                         static_cast<double>(config_.max_timeout_ms));
    return static_cast<uint32_t>(derived);
}

uint32_t AdaptiveTimeout::get_timeout_ms() const {
    return compute(tracker_.snapshot());
}

AdaptiveTimeoutStats AdaptiveTimeout::stats() const {
    AdaptiveTimeoutStats s;
    s.latency = tracker_.snapshot();
    s.current_timeout_ms = compute(s.latency);
    s.adaptive = config_.adaptive_enabled;
    return s;
}

}  // namespace bulwark::resilience
