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

// Bulwark Fallback Chain
// Ordered alternative data sources, tried top-down until one succeeds

#pragma once

#include <fmt/format.h>

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../core/errors.hpp"
#include "../core/logging.hpp"

namespace bulwark::resilience {

/// Fallback levels in ascending severity order
enum class FallbackLevel : uint8_t {
    PRIMARY = 0,
    REPLICA,
    DISTRIBUTED_CACHE,
    LOCAL_CACHE,
    DEFAULT
};

inline constexpr size_t kFallbackLevelCount = 5;

[[nodiscard]] constexpr std::string_view to_string(FallbackLevel level) noexcept {
    switch (level) {
        case FallbackLevel::PRIMARY:
            return "PRIMARY";
        case FallbackLevel::REPLICA:
            return "REPLICA";
        case FallbackLevel::DISTRIBUTED_CACHE:
            return "DISTRIBUTED_CACHE";
        case FallbackLevel::LOCAL_CACHE:
            return "LOCAL_CACHE";
        case FallbackLevel::DEFAULT:
            return "DEFAULT";
    }
    return "UNKNOWN";
}

/// Outcome of a chain execution
template <typename T>
struct FallbackResult {
    T value;
    FallbackLevel level = FallbackLevel::PRIMARY;

    /// True whenever a level other than PRIMARY produced the value
    bool is_degraded = false;
};

/// Per-level usage counters
struct FallbackStats {
    std::array<uint64_t, kFallbackLevelCount> served{};
    std::array<uint64_t, kFallbackLevelCount> failed{};
    uint64_t exhausted = 0;
};

/// Multi-level fallback with one optional handler per level.
///
/// Handlers should be registered before the chain is shared between threads;
/// execute() itself is safe to call concurrently. A DEFAULT handler is
/// expected never to fail; if it does, the chain is exhausted.
template <typename T>
class FallbackChain {
public:
    using Handler = std::function<T()>;

    explicit FallbackChain(std::string name = "fallback") : name_(std::move(name)) {}

    FallbackChain(const FallbackChain&) = delete;
    FallbackChain& operator=(const FallbackChain&) = delete;

    /// Register (or replace) the handler for a level
    FallbackChain& register_handler(FallbackLevel level, Handler handler) {
        std::lock_guard lock(mutex_);
        handlers_[index(level)] = std::move(handler);
        return *this;
    }

    [[nodiscard]] bool has_handler(FallbackLevel level) const {
        std::lock_guard lock(mutex_);
        return static_cast<bool>(handlers_[index(level)]);
    }

    void clear() {
        std::lock_guard lock(mutex_);
        for (auto& handler : handlers_) {
            handler = nullptr;
        }
    }

    /// Try registered handlers in level order.
    /// Throws AllFallbacksExhaustedError when none succeeds.
    FallbackResult<T> execute() { return run(nullptr); }

    /// Like execute(), with primary standing in for the PRIMARY handler
    FallbackResult<T> execute_with_primary(const Handler& primary) { return run(&primary); }

    [[nodiscard]] FallbackStats stats() const {
        FallbackStats s;
        for (size_t i = 0; i < kFallbackLevelCount; ++i) {
            s.served[i] = served_[i].load(std::memory_order_relaxed);
            s.failed[i] = failed_[i].load(std::memory_order_relaxed);
        }
        s.exhausted = exhausted_.load(std::memory_order_relaxed);
        return s;
    }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    static constexpr size_t index(FallbackLevel level) noexcept {
        return static_cast<size_t>(level);
    }

    FallbackResult<T> run(const Handler* primary) {
        std::array<Handler, kFallbackLevelCount> handlers;
        {
            std::lock_guard lock(mutex_);
            handlers = handlers_;
        }
        if (primary != nullptr) {
            handlers[index(FallbackLevel::PRIMARY)] = *primary;
        }

        auto* logger = logging::get_logger();
        std::vector<std::string> failures;

        for (size_t i = 0; i < kFallbackLevelCount; ++i) {
            if (!handlers[i]) {
                continue;
            }
            auto level = static_cast<FallbackLevel>(i);

            try {
                FallbackResult<T> result{handlers[i](), level, level != FallbackLevel::PRIMARY};
                served_[i].fetch_add(1, std::memory_order_relaxed);
                if (result.is_degraded) {
                    LOG_WARNING(logger, "Serving degraded response: chain={}, level={}, failures={}",
                                name_, to_string(level), failures.size());
                }
                return result;
            } catch (const std::exception& e) {
                failed_[i].fetch_add(1, std::memory_order_relaxed);
                failures.push_back(fmt::format("{}: {}", to_string(level), e.what()));
                LOG_DEBUG(logger, "Fallback level failed: chain={}, level={}, error={}", name_,
                          to_string(level), e.what());
            }
        }

        exhausted_.fetch_add(1, std::memory_order_relaxed);
        LOG_ERROR(logger, "All fallbacks exhausted: chain={}, levels_tried={}", name_,
                  failures.size());
        throw core::AllFallbacksExhaustedError(name_, std::move(failures));
    }

    std::string name_;

    mutable std::mutex mutex_;
    std::array<Handler, kFallbackLevelCount> handlers_;

    std::array<std::atomic<uint64_t>, kFallbackLevelCount> served_{};
    std::array<std::atomic<uint64_t>, kFallbackLevelCount> failed_{};
    std::atomic<uint64_t> exhausted_{0};
};

}  // namespace bulwark::resilience
