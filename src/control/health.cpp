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

// Bulwark Health Checks - Implementation

#include "health.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>

#include "../core/deadline.hpp"
#include "../core/logging.hpp"
#include "stats.hpp"

namespace bulwark::control {

namespace {

constexpr size_t index(CheckKind kind) noexcept {
    return static_cast<size_t>(kind);
}

std::chrono::milliseconds to_millis(double seconds) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::duration<double>(seconds));
}

void validate(const HealthCheckConfig& config, std::string_view kind) {
    if (config.grace_period_failures == 0) {
        throw std::invalid_argument(std::string(kind) + " grace_period_failures must be > 0");
    }
    if (config.interval_seconds <= 0.0) {
        throw std::invalid_argument(std::string(kind) + " interval_seconds must be > 0");
    }
    if (config.timeout_seconds < 0.0) {
        throw std::invalid_argument(std::string(kind) + " timeout_seconds must be >= 0");
    }
}

}  // namespace

const HealthCheckConfig& HealthCheckSettings::for_kind(CheckKind kind) const noexcept {
    switch (kind) {
        case CheckKind::LIVENESS:
            return liveness;
        case CheckKind::READINESS:
            return readiness;
        case CheckKind::DEEP:
            return deep;
    }
    return liveness;
}

HealthChecker::HealthChecker(HealthCheckSettings settings) : settings_(std::move(settings)) {
    validate(settings_.liveness, "liveness");
    validate(settings_.readiness, "readiness");
    validate(settings_.deep, "deep");

    for (size_t i = 0; i < kCheckKindCount; ++i) {
        probes_[i].result.kind = static_cast<CheckKind>(i);
    }
}

HealthChecker::~HealthChecker() {
    stop();
}

HealthCheckResult HealthChecker::check(CheckKind kind, const Probe& probe) {
    const auto& config = settings_.for_kind(kind);

    auto start = std::chrono::steady_clock::now();
    bool ok = false;
    std::string error;

    try {
        ok = core::run_with_deadline(probe, to_millis(config.timeout_seconds), to_string(kind));
        if (!ok) {
            error = "probe reported failure";
        }
    } catch (const std::exception& e) {
        error = e.what();
    }

    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    HealthCheckResult result;
    HealthStatus previous;
    std::function<void(CheckKind, HealthStatus)> cb;
    {
        std::lock_guard lock(mutex_);
        auto& current = probes_[index(kind)].result;
        previous = current.status;

        ++current.total_checks;
        current.latency = latency;
        current.last_check_time = std::chrono::system_clock::now();

        if (ok) {
            current.consecutive_failures = 0;
            current.status = HealthStatus::Healthy;
            current.last_error.clear();
        } else {
            ++current.failed_checks;
            ++current.consecutive_failures;
            current.last_error = error;
            current.status = current.consecutive_failures >= config.grace_period_failures
                                 ? HealthStatus::Unhealthy
                                 : HealthStatus::Degraded;
        }

        result = current;
        cb = on_status_change_;
    }

    if (result.status != previous) {
        auto* logger = logging::get_logger();
        if (result.status == HealthStatus::Unhealthy) {
            LOG_WARNING(logger, "Health check unhealthy: kind={}, consecutive_failures={}, error={}",
                        to_string(kind), result.consecutive_failures, result.last_error);
        } else if (previous == HealthStatus::Unhealthy) {
            LOG_INFO(logger, "Health check recovered: kind={}, latency_ms={}", to_string(kind),
                     result.latency.count());
        } else {
            LOG_DEBUG(logger, "Health check {} -> {}: kind={}", to_string(previous),
                      to_string(result.status), to_string(kind));
        }

        if (cb) {
            cb(kind, result.status);
        }
    }

    return result;
}

void HealthChecker::register_probe(CheckKind kind, Probe probe) {
    {
        std::lock_guard lock(mutex_);
        auto& state = probes_[index(kind)];
        state.probe = std::move(probe);
        state.next_due = std::chrono::steady_clock::now();
        wake_requested_ = true;
    }
    wake_.notify_all();
}

HealthCheckResult HealthChecker::run_registered(CheckKind kind) {
    Probe probe;
    {
        std::lock_guard lock(mutex_);
        probe = probes_[index(kind)].probe;
        if (!probe) {
            return probes_[index(kind)].result;
        }
    }
    return check(kind, probe);
}

void HealthChecker::start() {
    if (worker_.joinable()) {
        return;
    }
    worker_ = std::jthread([this](std::stop_token token) { run_loop(token); });

    auto* logger = logging::get_logger();
    LOG_INFO(logger, "Health checker started: liveness_interval_s={}, readiness_interval_s={}, "
                     "deep_interval_s={}",
             settings_.liveness.interval_seconds, settings_.readiness.interval_seconds,
             settings_.deep.interval_seconds);
}

void HealthChecker::stop() {
    if (!worker_.joinable()) {
        return;
    }
    worker_.request_stop();
    wake_.notify_all();
    worker_.join();
    worker_ = std::jthread();
}

void HealthChecker::run_loop(std::stop_token token) {
    while (!token.stop_requested()) {
        auto now = std::chrono::steady_clock::now();
        auto next_wake = now + std::chrono::seconds(1);
        std::vector<CheckKind> due;

        {
            std::lock_guard lock(mutex_);
            for (size_t i = 0; i < kCheckKindCount; ++i) {
                auto& state = probes_[i];
                if (!state.probe) {
                    continue;
                }
                if (state.next_due <= now) {
                    due.push_back(static_cast<CheckKind>(i));
                    state.next_due =
                        now + to_millis(settings_.for_kind(static_cast<CheckKind>(i)).interval_seconds);
                }
                next_wake = std::min(next_wake, state.next_due);
            }
        }

        for (auto kind : due) {
            if (token.stop_requested()) {
                return;
            }
            run_registered(kind);
        }

        std::unique_lock lock(mutex_);
        wake_.wait_until(lock, token, next_wake, [this] { return wake_requested_; });
        wake_requested_ = false;
    }
}

HealthCheckResult HealthChecker::status(CheckKind kind) const {
    std::lock_guard lock(mutex_);
    return probes_[index(kind)].result;
}

HealthStatus HealthChecker::overall() const {
    std::lock_guard lock(mutex_);
    HealthStatus worst = HealthStatus::Healthy;
    for (const auto& state : probes_) {
        if (state.result.status == HealthStatus::Unhealthy) {
            return HealthStatus::Unhealthy;
        }
        if (state.result.status == HealthStatus::Degraded) {
            worst = HealthStatus::Degraded;
        }
    }
    return worst;
}

HealthReport HealthChecker::report() const {
    HealthReport report;
    report.overall = overall();

    std::lock_guard lock(mutex_);
    for (const auto& state : probes_) {
        report.checks.push_back(state.result);
    }
    return report;
}

void HealthChecker::set_on_status_change(std::function<void(CheckKind, HealthStatus)> cb) {
    std::lock_guard lock(mutex_);
    on_status_change_ = std::move(cb);
}

// HealthResponse implementation

std::string HealthResponse::to_json(const HealthReport& report) {
    return health_to_json(report).dump(2);
}

}  // namespace bulwark::control
