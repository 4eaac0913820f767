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

// Bulwark Percentile Tracker - Header
// Bounded ring buffer of latency samples

#pragma once

#include <cstddef>
#include <mutex>
#include <vector>

namespace bulwark::resilience {

/// Summary of the current sample window (milliseconds)
struct PercentileSnapshot {
    size_t sample_count = 0;
    double p50 = 0.0;
    double p95 = 0.0;
    double p99 = 0.0;
    double p999 = 0.0;
    double min = 0.0;
    double max = 0.0;
    double mean = 0.0;
};

/// Keeps the last `window_size` latency measurements.
/// Percentiles are recomputed on demand from a sorted copy (nearest-rank).
class PercentileTracker {
public:
    explicit PercentileTracker(size_t window_size = 1000);

    PercentileTracker(const PercentileTracker&) = delete;
    PercentileTracker& operator=(const PercentileTracker&) = delete;

    /// Record one sample; overwrites the oldest once the window is full
    void record(double latency_ms);

    /// Percentile in [0, 100]; 0.0 when no samples exist
    [[nodiscard]] double percentile(double p) const;

    [[nodiscard]] PercentileSnapshot snapshot() const;

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t window_size() const noexcept { return window_size_; }

    void reset();

private:
    [[nodiscard]] std::vector<double> sorted_copy() const;

    size_t window_size_;

    mutable std::mutex mutex_;
    std::vector<double> samples_;
    size_t next_ = 0;
};

}  // namespace bulwark::resilience
