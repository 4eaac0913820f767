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

// Bulwark Bulkhead - Header
// Bounded concurrency plus bounded, optionally priority-ordered, wait queue

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>

namespace bulwark::resilience {

/// Queue priority (served highest first when priority_enabled)
enum class Priority : uint8_t { LOW = 0, NORMAL = 1, HIGH = 2, CRITICAL = 3 };

/// Bulkhead configuration
struct BulkheadConfig {
    uint32_t max_concurrent_calls = 100;
    uint32_t max_queue_size = 200;

    /// Maximum time a call waits in the queue (0 = wait until served)
    uint32_t timeout_ms = 30000;

    /// Order the queue by priority (ties stay FIFO); FIFO otherwise
    bool priority_enabled = false;
};

struct BulkheadStats {
    uint32_t active_calls = 0;
    uint32_t queued_calls = 0;
    uint32_t max_concurrent = 0;
    uint32_t max_queue_size = 0;
    uint64_t accepted_calls = 0;
    uint64_t rejected_calls = 0;
    uint64_t timed_out_calls = 0;
    uint64_t successful_calls = 0;
    uint64_t failed_calls = 0;
    uint32_t peak_active_calls = 0;
};

/// Concurrency isolation unit for one dependency.
///
/// Invariants: active_calls <= max_concurrent_calls and
/// queued_calls <= max_queue_size at all times. A released permit is handed
/// directly to the head of the queue, so queue order is also service order.
class Bulkhead {
public:
    /// RAII permit; releases its slot on destruction
    class Permit {
    public:
        Permit() = default;
        ~Permit() { release(); }

        Permit(Permit&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
        Permit& operator=(Permit&& other) noexcept {
            if (this != &other) {
                release();
                owner_ = other.owner_;
                other.owner_ = nullptr;
            }
            return *this;
        }

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

        [[nodiscard]] bool valid() const noexcept { return owner_ != nullptr; }

        void release() noexcept {
            if (owner_ != nullptr) {
                owner_->release_permit();
                owner_ = nullptr;
            }
        }

    private:
        friend class Bulkhead;
        explicit Permit(Bulkhead* owner) noexcept : owner_(owner) {}

        Bulkhead* owner_ = nullptr;
    };

    explicit Bulkhead(std::string name, BulkheadConfig config = {});
    ~Bulkhead() = default;

    Bulkhead(const Bulkhead&) = delete;
    Bulkhead& operator=(const Bulkhead&) = delete;

    /// Acquire a slot, queueing if necessary.
    /// Throws BulkheadFullError when the queue is full and
    /// BulkheadTimeoutError when not served within timeout_ms.
    [[nodiscard]] Permit acquire(Priority priority = Priority::NORMAL);

    /// Acquire a slot only if one is free right now
    [[nodiscard]] std::optional<Permit> try_acquire();

    /// Run fn inside a slot; the slot is released however fn completes
    template <typename Fn>
    std::invoke_result_t<Fn&> execute(Fn&& fn, Priority priority = Priority::NORMAL);

    [[nodiscard]] BulkheadStats stats() const;

    [[nodiscard]] uint32_t active_calls() const;
    [[nodiscard]] uint32_t queued_calls() const;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const BulkheadConfig& config() const noexcept { return config_; }

private:
    struct Waiter {
        int rank;        // higher served first
        uint64_t seq;    // FIFO within rank
        bool granted = false;
    };

    struct WaiterOrder {
        bool operator()(const Waiter* a, const Waiter* b) const noexcept {
            if (a->rank != b->rank) return a->rank > b->rank;
            return a->seq < b->seq;
        }
    };

    void release_permit() noexcept;

    /// Count a newly granted slot; caller holds mutex_
    void on_granted();

    std::string name_;
    BulkheadConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    uint32_t available_;
    uint32_t active_ = 0;
    uint32_t peak_active_ = 0;
    uint64_t next_seq_ = 0;
    std::set<Waiter*, WaiterOrder> waiters_;

    std::atomic<uint64_t> accepted_calls_{0};
    std::atomic<uint64_t> rejected_calls_{0};
    std::atomic<uint64_t> timed_out_calls_{0};
    std::atomic<uint64_t> successful_calls_{0};
    std::atomic<uint64_t> failed_calls_{0};
};

template <typename Fn>
std::invoke_result_t<Fn&> Bulkhead::execute(Fn&& fn, Priority priority) {
    Permit permit = acquire(priority);

    try {
        if constexpr (std::is_void_v<std::invoke_result_t<Fn&>>) {
            fn();
            successful_calls_.fetch_add(1, std::memory_order_relaxed);
        } else {
            auto result = fn();
            successful_calls_.fetch_add(1, std::memory_order_relaxed);
            return result;
        }
    } catch (...) {
        failed_calls_.fetch_add(1, std::memory_order_relaxed);
        throw;
    }
}

[[nodiscard]] constexpr std::string_view to_string(Priority priority) noexcept {
    switch (priority) {
        case Priority::LOW:
            return "LOW";
        case Priority::NORMAL:
            return "NORMAL";
        case Priority::HIGH:
            return "HIGH";
        case Priority::CRITICAL:
            return "CRITICAL";
    }
    return "UNKNOWN";
}

}  // namespace bulwark::resilience
