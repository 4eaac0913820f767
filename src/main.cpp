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

// Bulwark Inspect - Main Entry Point
// Validates a resilience config and prints the registry it produces
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>

#include "control/config.hpp"
#include "control/stats.hpp"
#include "core/logging.hpp"
#include "resilience/registry.hpp"

namespace {

constexpr int kExitInvalidConfig = 1;
constexpr int kExitUsage = 2;

void print_usage(const char* program) {
    fprintf(stderr, "Usage: %s --config <config.json> [--validate-only] [--dump-config]\n",
            program);
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 3 || std::string(argv[1]) != "--config") {
        print_usage(argv[0]);
        return kExitUsage;
    }

    std::string config_path = argv[2];
    bool validate_only = false;
    bool dump_config = false;

    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--validate-only") {
            validate_only = true;
        } else if (arg == "--dump-config") {
            dump_config = true;
        } else {
            fprintf(stderr, "Unknown option: %s\n", arg.c_str());
            print_usage(argv[0]);
            return kExitUsage;
        }
    }

    bulwark::logging::init_logging_system();

    auto config = bulwark::control::ConfigLoader::load_from_file(config_path);
    if (!config) {
        fprintf(stderr, "Failed to load configuration from %s\n", config_path.c_str());
        bulwark::logging::shutdown_logging();
        return kExitInvalidConfig;
    }

    auto validation = bulwark::control::ConfigLoader::validate(*config);
    if (!validation.warnings.empty()) {
        fprintf(stderr, "Configuration warnings:\n");
        for (const auto& warning : validation.warnings) {
            fprintf(stderr, "  - %s\n", warning.c_str());
        }
    }

    if (validate_only) {
        printf("Configuration OK: %zu dependencies, %zu rate limiters\n",
               config->dependencies.size(), config->rate_limiters.size());
        bulwark::logging::shutdown_logging();
        return EXIT_SUCCESS;
    }

    bulwark::logging::init_logger(config->logging);

    if (dump_config) {
        printf("%s\n", bulwark::control::ConfigLoader::to_json(*config).c_str());
        bulwark::logging::shutdown_logging();
        return EXIT_SUCCESS;
    }

    try {
        bulwark::resilience::ResilienceRegistry registry;
        bulwark::control::configure_registry(registry, *config);

        auto stats = bulwark::control::stats_to_json(registry.get_comprehensive_stats());
        printf("%s\n", stats.dump(2).c_str());
    } catch (const std::exception& e) {
        fprintf(stderr, "Failed to build registry: %s\n", e.what());
        bulwark::logging::shutdown_logging();
        return kExitInvalidConfig;
    }

    bulwark::logging::shutdown_logging();
    return EXIT_SUCCESS;
}
