/*
 * Copyright 2025 Portico Contributors
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

// Portico Host Registry - Main Entry Point
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <quill/core/QuillError.h>

#include "control/config.hpp"
#include "core/logging.hpp"
#include "runtime/sync_cycle.hpp"

namespace {

void print_validation(const portico::control::ValidationResult& validation) {
    if (!validation.errors.empty()) {
        fprintf(stderr, "Configuration validation errors:\n");
        for (const auto& error : validation.errors) {
            fprintf(stderr, "  - %s\n", error.c_str());
        }
    }
    if (!validation.warnings.empty()) {
        printf("Warnings:\n");
        for (const auto& warning : validation.warnings) {
            printf("  - %s\n", warning.c_str());
        }
    }
}

void print_hostnames(const char* label, const std::vector<std::string>& hostnames) {
    printf("  %s (%zu):", label, hostnames.size());
    for (const auto& hostname : hostnames) {
        printf(" %s", hostname.c_str());
    }
    printf("\n");
}

}  // namespace

int main(int argc, char* argv[]) {
    printf("Portico Host Registry v0.1.0\n\n");

    std::vector<std::string> config_paths;
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--config" && i + 1 < argc) {
            config_paths.emplace_back(argv[++i]);
        } else {
            config_paths.clear();
            break;
        }
    }

    if (config_paths.empty()) {
        fprintf(stderr, "Usage: %s --config <state.json> [--config <state.json> ...]\n", argv[0]);
        return EXIT_FAILURE;
    }

    auto config_manager = std::make_unique<portico::control::ConfigManager>();
    portico::runtime::SyncCycle cycle;
    bool logging_ready = false;
    int exit_code = EXIT_SUCCESS;

    for (const auto& path : config_paths) {
        printf("Loading desired state from %s...\n", path.c_str());

        if (!config_manager->load(path)) {
            fprintf(stderr, "Failed to load desired state\n");
            print_validation(config_manager->last_validation());
            exit_code = EXIT_FAILURE;
            break;
        }
        print_validation(config_manager->last_validation());

        auto config_ptr = config_manager->get();

        // Logging settings come from the first document
        if (!logging_ready) {
            portico::logging::init_logging_system();
            logging_ready = true;
            try {
                portico::logging::init_logger(config_ptr->logging);
            } catch (const std::filesystem::filesystem_error& e) {
                fprintf(stderr, "Cannot create log directory: %s\n", e.what());
                exit_code = EXIT_FAILURE;
                break;
            } catch (const quill::QuillError& e) {
                fprintf(stderr, "Cannot initialize logger: %s\n", e.what());
                exit_code = EXIT_FAILURE;
                break;
            }
        }

        auto report = cycle.apply(*config_ptr);
        if (!report.has_value()) {
            fprintf(stderr, "Desired state rejected\n");
            exit_code = EXIT_FAILURE;
            break;
        }

        printf("Cycle %s: reload=%s hosts=%zu ssl_passthrough=%s\n",
               report->correlation_id.c_str(),
               std::string(portico::runtime::to_string(report->reload)).c_str(),
               report->host_count, report->has_ssl_passthrough ? "yes" : "no");
        print_hostnames("added", report->added);
        print_hostnames("removed", report->removed);
    }

    if (logging_ready) {
        portico::logging::shutdown_logging();
    }

    return exit_code;
}
