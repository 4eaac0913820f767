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

// Bulwark Health Checks - Header
// Periodic probes with a consecutive-failure grace period

#pragma once

#include <array>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace bulwark::control {

/// Health status levels
enum class HealthStatus {
    Healthy,    // Last probe succeeded
    Degraded,   // Failing, but still inside the grace period
    Unhealthy   // grace_period_failures consecutive failures
};

/// Check kinds, each configured independently
enum class CheckKind : uint8_t { LIVENESS = 0, READINESS, DEEP };

inline constexpr size_t kCheckKindCount = 3;

/// Per-kind probe configuration
struct HealthCheckConfig {
    double interval_seconds = 30.0;
    double timeout_seconds = 5.0;

    /// Consecutive failures before the status flips to Unhealthy
    uint32_t grace_period_failures = 3;
};

struct HealthCheckSettings {
    HealthCheckConfig liveness;
    HealthCheckConfig readiness;
    HealthCheckConfig deep;

    [[nodiscard]] const HealthCheckConfig& for_kind(CheckKind kind) const noexcept;
};

/// Latest outcome for one check kind
struct HealthCheckResult {
    CheckKind kind = CheckKind::LIVENESS;
    HealthStatus status = HealthStatus::Healthy;
    std::chrono::milliseconds latency{0};
    uint32_t consecutive_failures = 0;
    std::optional<std::chrono::system_clock::time_point> last_check_time;
    std::string last_error;
    uint64_t total_checks = 0;
    uint64_t failed_checks = 0;
};

struct HealthReport {
    HealthStatus overall = HealthStatus::Healthy;
    std::vector<HealthCheckResult> checks;
};

/// A probe fails by returning false, throwing, or exceeding its timeout.
/// It runs on a separate thread when a timeout applies, so it must own its state.
using Probe = std::function<bool()>;

/// Runs liveness/readiness/deep probes.
///
/// Slow to condemn, fast to recover: status becomes Unhealthy only after
/// grace_period_failures consecutive failures, and any success restores
/// Healthy immediately.
class HealthChecker {
public:
    explicit HealthChecker(HealthCheckSettings settings = {});
    ~HealthChecker();

    // Non-copyable, non-movable
    HealthChecker(const HealthChecker&) = delete;
    HealthChecker& operator=(const HealthChecker&) = delete;

    /// Run one probe for a kind under that kind's timeout and update its status
    HealthCheckResult check(CheckKind kind, const Probe& probe);

    /// Register the probe run periodically for a kind
    void register_probe(CheckKind kind, Probe probe);

    /// Run the registered probe for a kind now (no-op result when none registered)
    HealthCheckResult run_registered(CheckKind kind);

    /// Start periodic checking on a background thread
    void start();

    /// Stop periodic checking and join the background thread
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return worker_.joinable(); }

    [[nodiscard]] HealthCheckResult status(CheckKind kind) const;

    /// Unhealthy if any kind is unhealthy, Degraded if any is degraded
    [[nodiscard]] HealthStatus overall() const;

    [[nodiscard]] HealthReport report() const;

    /// Callback for status flips (invoked outside the lock)
    void set_on_status_change(std::function<void(CheckKind, HealthStatus)> cb);

    [[nodiscard]] const HealthCheckSettings& settings() const noexcept { return settings_; }

private:
    struct ProbeState {
        Probe probe;
        HealthCheckResult result;
        std::chrono::steady_clock::time_point next_due;
    };

    void run_loop(std::stop_token token);

    HealthCheckSettings settings_;

    mutable std::mutex mutex_;
    std::condition_variable_any wake_;
    bool wake_requested_ = false;  // guarded by mutex_
    std::array<ProbeState, kCheckKindCount> probes_;
    std::function<void(CheckKind, HealthStatus)> on_status_change_;

    std::jthread worker_;
};

/// Health check response builder for an external HTTP layer
class HealthResponse {
public:
    /// Build JSON health response
    [[nodiscard]] static std::string to_json(const HealthReport& report);

    /// Determine HTTP status code based on health
    [[nodiscard]] static uint16_t to_http_status(HealthStatus status) noexcept {
        switch (status) {
            case HealthStatus::Healthy:
                return 200;  // OK
            case HealthStatus::Degraded:
                return 200;  // Still OK, inside the grace period
            case HealthStatus::Unhealthy:
                return 503;  // Service Unavailable
        }
        return 500;  // Internal Server Error
    }
};

[[nodiscard]] constexpr std::string_view to_string(HealthStatus status) noexcept {
    switch (status) {
        case HealthStatus::Healthy:
            return "healthy";
        case HealthStatus::Degraded:
            return "degraded";
        case HealthStatus::Unhealthy:
            return "unhealthy";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(CheckKind kind) noexcept {
    switch (kind) {
        case CheckKind::LIVENESS:
            return "liveness";
        case CheckKind::READINESS:
            return "readiness";
        case CheckKind::DEEP:
            return "deep";
    }
    return "unknown";
}

}  // namespace bulwark::control
