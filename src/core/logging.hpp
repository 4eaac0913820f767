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

#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <string>
#include <string_view>

// Forward declaration to avoid circular dependency
namespace bulwark::control {
struct LogConfig;
}

namespace bulwark::logging {

// Initialize Quill logging backend (idempotent, called once at startup)
void init_logging_system();

// Initialize the library logger with config-driven sink, level and rotation
// Replaces the logger returned by get_logger()
quill::Logger* init_logger(const bulwark::control::LogConfig& config);

// Shutdown logging system (called at exit)
void shutdown_logging();

// UUID v4 based correlation IDs: {uuid}#{counter}
std::string generate_correlation_id();

// Validate correlation ID format
bool is_valid_uuid(std::string_view uuid);

// Get the library logger. Never null: falls back to a console logger
// (starting the backend) when init_logger() was not called.
quill::Logger* get_logger();

// Circuit breaker transition logging
#define LOG_TRANSITION(logger, dependency, from, to, reason)                         \
    LOG_INFO(logger, "Circuit breaker {} -> {}: dependency={}, reason={}", from, to, \
             dependency, reason)

// Protective rejection logging
#define LOG_REJECTION(logger, component, dependency, error_code, correlation_id)    \
    LOG_WARNING(logger, "{} rejected call: dependency={}, error_code={}, "          \
                        "correlation_id={}",                                        \
                component, dependency, error_code, correlation_id)

}  // namespace bulwark::logging
