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

// Bulwark Stats Export - Header
// JSON rendering of component statistics for the inspection tool and health endpoints

#pragma once

#include <nlohmann/json.hpp>

#include "../resilience/fallback_chain.hpp"
#include "../resilience/registry.hpp"
#include "health.hpp"

namespace bulwark::control {

/// Time points are rendered as milliseconds since the Unix epoch
[[nodiscard]] nlohmann::json health_to_json(const HealthReport& report);

[[nodiscard]] nlohmann::json circuit_breaker_to_json(const resilience::CircuitBreakerStats& stats);
[[nodiscard]] nlohmann::json retry_manager_to_json(const resilience::RetryManagerStats& stats);
[[nodiscard]] nlohmann::json bulkhead_to_json(const resilience::BulkheadStats& stats);
[[nodiscard]] nlohmann::json adaptive_timeout_to_json(const resilience::AdaptiveTimeoutStats& stats);
[[nodiscard]] nlohmann::json rate_limiter_to_json(const resilience::RateLimiterStats& stats);
[[nodiscard]] nlohmann::json fallback_to_json(const resilience::FallbackStats& stats);

/// Full registry snapshot; "health" is null when no checker is installed
[[nodiscard]] nlohmann::json stats_to_json(const resilience::ResilienceStats& stats);

}  // namespace bulwark::control
