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

// Bulwark Percentile Tracker - Implementation

#include "percentile_tracker.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace bulwark::resilience {

namespace {

// Nearest-rank percentile over an already sorted window
double nearest_rank(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) {
        return 0.0;
    }
    p = std::clamp(p, 0.0, 100.0);
    auto rank = static_cast<size_t>(std::ceil(p / 100.0 * static_cast<double>(sorted.size())));
    if (rank == 0) {
        rank = 1;
    }
    return sorted[std::min(rank, sorted.size()) - 1];
}

}  // namespace

PercentileTracker::PercentileTracker(size_t window_size) : window_size_(window_size) {
    if (window_size_ == 0) {
        throw std::invalid_argument("percentile window must be > 0");
    }
    samples_.reserve(window_size_);
}

void PercentileTracker::record(double latency_ms) {
    if (latency_ms < 0.0 || std::isnan(latency_ms)) {
        latency_ms = 0.0;
    }

    std::lock_guard lock(mutex_);
    if (samples_.size() < window_size_) {
        samples_.push_back(latency_ms);
    } else {
        samples_[next_] = latency_ms;
    }
    next_ = (next_ + 1) % window_size_;
}

std::vector<double> PercentileTracker::sorted_copy() const {
    std::vector<double> copy;
    {
        std::lock_guard lock(mutex_);
        copy = samples_;
    }
    std::sort(copy.begin(), copy.end());
    return copy;
}

double PercentileTracker::percentile(double p) const {
    return nearest_rank(sorted_copy(), p);
}

PercentileSnapshot PercentileTracker::snapshot() const {
    auto sorted = sorted_copy();

    PercentileSnapshot s;
    s.sample_count = sorted.size();
    if (sorted.empty()) {
        return s;
    }

    s.p50 = nearest_rank(sorted, 50.0);
    s.p95 = nearest_rank(sorted, 95.0);
    s.p99 = nearest_rank(sorted, 99.0);
    s.p999 = nearest_rank(sorted, 99.9);
    s.min = sorted.front();
    s.max = sorted.back();
    s.mean = std::accumulate(sorted.begin(), sorted.end(), 0.0) / static_cast<double>(sorted.size());
    return s;
}

size_t PercentileTracker::size() const {
    std::lock_guard lock(mutex_);
    return samples_.size();
}

void PercentileTracker::reset() {
    std::lock_guard lock(mutex_);
    samples_.clear();
    next_ = 0;
}

}  // namespace bulwark::resilience
