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

// Bulwark Bulkhead - Implementation

#include "bulkhead.hpp"

#include <chrono>
#include <stdexcept>

#include "../core/errors.hpp"
#include "../core/logging.hpp"

namespace bulwark::resilience {

Bulkhead::Bulkhead(std::string name, BulkheadConfig config)
    : name_(std::move(name))
    , config_(config)
    , available_(config.max_concurrent_calls) {
    if (config_.max_concurrent_calls == 0) {
        throw std::invalid_argument("bulkhead max_concurrent_calls must be > 0");
    }
}

void Bulkhead::on_granted() {
    ++active_;
    if (active_ > peak_active_) {
        peak_active_ = active_;
    }
    accepted_calls_.fetch_add(1, std::memory_order_relaxed);
}

Bulkhead::Permit Bulkhead::acquire(Priority priority) {
    auto start = std::chrono::steady_clock::now();
    std::unique_lock lock(mutex_);

    // Fast path: free slot and nobody ahead of us
    if (available_ > 0 && waiters_.empty()) {
        --available_;
        on_granted();
        return Permit(this);
    }

    if (waiters_.size() >= config_.max_queue_size) {
        uint32_t active = active_;
        size_t queued = waiters_.size();
        lock.unlock();
        rejected_calls_.fetch_add(1, std::memory_order_relaxed);
        auto* logger = logging::get_logger();
        LOG_WARNING(logger, "Bulkhead full: dependency={}, active={}, queued={}, max_concurrent={}, "
                            "max_queue={}",
                    name_, active, queued, config_.max_concurrent_calls, config_.max_queue_size);
        throw core::BulkheadFullError(name_, config_.max_concurrent_calls, config_.max_queue_size);
    }

    Waiter waiter{config_.priority_enabled ? static_cast<int>(priority) : 0, next_seq_++};
    waiters_.insert(&waiter);

    if (config_.timeout_ms == 0) {
        cv_.wait(lock, [&waiter] { return waiter.granted; });
    } else {
        auto deadline = start + std::chrono::milliseconds(config_.timeout_ms);
        cv_.wait_until(lock, deadline, [&waiter] { return waiter.granted; });
    }

    if (!waiter.granted) {
        waiters_.erase(&waiter);
        lock.unlock();

        timed_out_calls_.fetch_add(1, std::memory_order_relaxed);
        auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        auto* logger = logging::get_logger();
        LOG_WARNING(logger, "Bulkhead queue timeout: dependency={}, waited_ms={}, priority={}",
                    name_, waited.count(), to_string(priority));
        throw core::BulkheadTimeoutError(name_, waited);
    }

    // release_permit() already removed us from the queue and counted the slot
    return Permit(this);
}

std::optional<Bulkhead::Permit> Bulkhead::try_acquire() {
    std::lock_guard lock(mutex_);
    if (available_ > 0 && waiters_.empty()) {
        --available_;
        on_granted();
        return Permit(this);
    }
    return std::nullopt;
}

void Bulkhead::release_permit() noexcept {
    std::lock_guard lock(mutex_);
    --active_;

    if (waiters_.empty()) {
        ++available_;
        return;
    }

    // Hand the slot to the head of the queue
    Waiter* next = *waiters_.begin();
    waiters_.erase(waiters_.begin());
    next->granted = true;
    on_granted();
    cv_.notify_all();
}

BulkheadStats Bulkhead::stats() const {
    BulkheadStats s;
    {
        std::lock_guard lock(mutex_);
        s.active_calls = active_;
        s.queued_calls = static_cast<uint32_t>(waiters_.size());
        s.peak_active_calls = peak_active_;
    }
    s.max_concurrent = config_.max_concurrent_calls;
    s.max_queue_size = config_.max_queue_size;
    s.accepted_calls = accepted_calls_.load(std::memory_order_relaxed);
    s.rejected_calls = rejected_calls_.load(std::memory_order_relaxed);
    s.timed_out_calls = timed_out_calls_.load(std::memory_order_relaxed);
    s.successful_calls = successful_calls_.load(std::memory_order_relaxed);
    s.failed_calls = failed_calls_.load(std::memory_order_relaxed);
    return s;
}

uint32_t Bulkhead::active_calls() const {
    std::lock_guard lock(mutex_);
    return active_;
}

uint32_t Bulkhead::queued_calls() const {
    std::lock_guard lock(mutex_);
    return static_cast<uint32_t>(waiters_.size());
}

}  // namespace bulwark::resilience
