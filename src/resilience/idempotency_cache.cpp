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

#include "idempotency_cache.hpp"

#include <stdexcept>

namespace bulwark::resilience {

IdempotencyCache::IdempotencyCache(std::chrono::seconds ttl)
    : ttl_(ttl)
    , sweep_interval_(std::chrono::duration_cast<Clock::duration>(ttl) / 10)
    , next_sweep_(Clock::now() + sweep_interval_) {
    if (ttl_.count() <= 0) {
        throw std::invalid_argument("idempotency ttl must be > 0");
    }
}

const std::any* IdempotencyCache::find_live(std::string_view key) {
    auto it = records_.find(std::string(key));
    if (it == records_.end()) {
        return nullptr;
    }
    if (Clock::now() >= it->second.expires_at) {
        records_.erase(it);
        return nullptr;
    }
    return &it->second.value;
}

void IdempotencyCache::put_any(std::string_view key, std::any value) {
    auto now = Clock::now();
    std::lock_guard lock(mutex_);
    if (now >= next_sweep_) {
        purge_locked(now);
        next_sweep_ = now + sweep_interval_;
    }
    records_.insert_or_assign(std::string(key), Record{std::move(value), now + ttl_});
}

bool IdempotencyCache::erase(std::string_view key) {
    std::lock_guard lock(mutex_);
    return records_.erase(std::string(key)) > 0;
}

size_t IdempotencyCache::purge_locked(Clock::time_point now) {
    return ankerl::unordered_dense::erase_if(
        records_, [now](const auto& entry) { return now >= entry.second.expires_at; });
}

size_t IdempotencyCache::purge_expired() {
    std::lock_guard lock(mutex_);
    return purge_locked(Clock::now());
}

size_t IdempotencyCache::size() const {
    std::lock_guard lock(mutex_);
    return records_.size();
}

void IdempotencyCache::clear() {
    std::lock_guard lock(mutex_);
    records_.clear();
}

}  // namespace bulwark::resilience
