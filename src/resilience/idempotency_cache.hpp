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

// Bulwark Idempotency Cache - Header
// Short-TTL map from caller-supplied key to a previously produced result

#pragma once

#include <any>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "../core/containers.hpp"

namespace bulwark::resilience {

/// Records live for `ttl`. Expired records are dropped when looked up, and
/// put() sweeps the whole map at most once per tenth of the TTL, so the map
/// holds no more than about 1.1 x ttl worth of writes.
class IdempotencyCache {
public:
    using Clock = std::chrono::steady_clock;

    explicit IdempotencyCache(std::chrono::seconds ttl = std::chrono::seconds(3600));

    IdempotencyCache(const IdempotencyCache&) = delete;
    IdempotencyCache& operator=(const IdempotencyCache&) = delete;

    /// Cached result for key, or nullopt when absent, expired or of another type.
    /// Expired records are removed on lookup.
    template <typename T>
    [[nodiscard]] std::optional<T> get(std::string_view key);

    /// Store (or replace) the result for key with a fresh expiry
    template <typename T>
    void put(std::string_view key, T value) {
        put_any(key, std::any(std::move(value)));
    }

    void put_any(std::string_view key, std::any value);

    /// Remove a record; returns whether one existed
    bool erase(std::string_view key);

    /// Remove every expired record; returns how many were dropped
    size_t purge_expired();

    [[nodiscard]] size_t size() const;

    void clear();

    [[nodiscard]] std::chrono::seconds ttl() const noexcept { return ttl_; }

private:
    struct Record {
        std::any value;
        Clock::time_point expires_at;
    };

    /// Live value for key (removing it when expired); caller holds mutex_
    const std::any* find_live(std::string_view key);

    /// Drop expired records; caller holds mutex_
    size_t purge_locked(Clock::time_point now);

    std::chrono::seconds ttl_;
    Clock::duration sweep_interval_;
    Clock::time_point next_sweep_;

    mutable std::mutex mutex_;
    core::fast_map<std::string, Record> records_;
};

template <typename T>
std::optional<T> IdempotencyCache::get(std::string_view key) {
    std::lock_guard lock(mutex_);
    const std::any* value = find_live(key);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (const T* typed = std::any_cast<T>(value)) {
        return *typed;
    }
    return std::nullopt;
}

}  // namespace bulwark::resilience
