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

#include "logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <random>

#include "../control/config.hpp"

namespace bulwark::logging {

static std::atomic<quill::Logger*> g_logger{nullptr};
static std::once_flag g_backend_started;
static std::mutex g_logger_mutex;

static quill::LogLevel parse_level(std::string level) {
  std::transform(level.begin(), level.end(), level.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (level == "debug") {
    return quill::LogLevel::Debug;
  } else if (level == "warning" || level == "warn") {
    return quill::LogLevel::Warning;
  } else if (level == "error") {
    return quill::LogLevel::Error;
  }
  return quill::LogLevel::Info;
}

void init_logging_system() {
  std::call_once(g_backend_started, [] { quill::Backend::start(); });
}

quill::Logger* init_logger(const control::LogConfig& log_config) {
  init_logging_system();

  std::lock_guard lock(g_logger_mutex);

  quill::Logger* logger = nullptr;

  if (log_config.output.empty() || log_config.output == "console") {
    auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("bulwark_console");
    logger = quill::Frontend::create_or_get_logger("bulwark_console", std::move(console_sink));
  } else {
    std::filesystem::create_directories(log_config.output);

    quill::RotatingFileSinkConfig config;
    config.set_rotation_max_file_size(log_config.rotation.max_size_mb * 1'000'000);
    config.set_max_backup_files(log_config.rotation.max_files);
    config.set_open_mode('a');

    std::string log_path = fmt::format("{}/bulwark.log", log_config.output);

    if (log_config.format == "json") {
      auto json_sink = quill::Frontend::create_or_get_sink<quill::RotatingJsonFileSink>(
          log_path, config);
      logger = quill::Frontend::create_or_get_logger("bulwark", std::move(json_sink));
    } else {
      auto file_sink = quill::Frontend::create_or_get_sink<quill::RotatingFileSink>(
          log_path, config);
      logger = quill::Frontend::create_or_get_logger("bulwark", std::move(file_sink));
    }
  }

  logger->set_log_level(parse_level(log_config.level));

  g_logger.store(logger, std::memory_order_release);
  return logger;
}

void shutdown_logging() {
  if (auto* logger = g_logger.load(std::memory_order_acquire)) {
    logger->flush_log();
  }
  quill::Backend::stop();
}

quill::Logger* get_logger() {
  auto* logger = g_logger.load(std::memory_order_acquire);
  if (logger) {
    return logger;
  }

  init_logging_system();

  std::lock_guard lock(g_logger_mutex);
  logger = g_logger.load(std::memory_order_relaxed);
  if (!logger) {
    auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("bulwark_console");
    logger = quill::Frontend::create_or_get_logger("bulwark_console", std::move(console_sink));
    g_logger.store(logger, std::memory_order_release);
  }
  return logger;
}

namespace {

constexpr std::array<size_t, 4> kDashPositions = {8, 13, 18, 23};

// Random UUID v4, drawn once per thread
std::string make_thread_uuid() {
  std::random_device device;
  std::mt19937_64 rng((static_cast<uint64_t>(device()) << 32) ^ device() ^
                      static_cast<uint64_t>(
                          std::chrono::steady_clock::now().time_since_epoch().count()));
  uint64_t hi = rng();
  uint64_t lo = rng();

  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x4000ULL;               // version 4
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // RFC 4122 variant

  return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}", hi >> 32, (hi >> 16) & 0xFFFF,
                     hi & 0xFFFF, lo >> 48, lo & 0xFFFFFFFFFFFFULL);
}

}  // namespace

std::string generate_correlation_id() {
  static thread_local const std::string thread_uuid = make_thread_uuid();
  static thread_local uint64_t sequence = 0;

  return fmt::format("{}#{}", thread_uuid, sequence++);
}

bool is_valid_uuid(std::string_view id) {
  // {uuid}#{counter}
  if (id.rfind('#') != 36) {
    return false;
  }

  std::string_view uuid = id.substr(0, 36);
  std::string_view counter = id.substr(37);

  for (size_t i = 0; i < uuid.size(); ++i) {
    bool dash = std::find(kDashPositions.begin(), kDashPositions.end(), i) != kDashPositions.end();
    if (dash ? uuid[i] != '-' : std::isxdigit(static_cast<unsigned char>(uuid[i])) == 0) {
      return false;
    }
  }

  if (uuid[14] != '4' || std::string_view("89abAB").find(uuid[19]) == std::string_view::npos) {
    return false;
  }

  return !counter.empty() &&
         std::all_of(counter.begin(), counter.end(), [](char c) { return c >= '0' && c <= '9'; });
}

}  // namespace bulwark::logging
