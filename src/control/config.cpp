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

// Portico Configuration - Implementation

#include "config.hpp"

#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

#include "../core/containers.hpp"
#include "../core/logging.hpp"
#include "../registry/host.hpp"

namespace portico::control {

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        fprintf(stderr, "Cannot open configuration file: %s\n", path_str.c_str());
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    return load_from_json(json);
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json) {
    Config config;

    try {
        auto j = nlohmann::json::parse(json);
        config = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON parsing error: %s\n", e.what());
        if (auto* logger = logging::get_current_logger()) {
            LOG_ERROR(logger, "JSON parsing error: {}", e.what());
        }
        return std::nullopt;
    }

    return config;
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    // Validate backends
    core::fast_map<std::string, const BackendConfig*> backend_ids;
    for (const auto& backend : config.backends) {
        if (backend.namespace_name.empty()) {
            result.add_error("Backend '" + backend.name + "' has no namespace");
        }
        if (backend.name.empty()) {
            result.add_error("Backend name cannot be empty in namespace '" +
                             backend.namespace_name + "'");
        }
        if (backend.port.empty()) {
            result.add_error("Backend '" + backend.name + "' has no port");
        }

        auto id = registry::build_backend_id(backend.namespace_name, backend.name, backend.port);
        auto [it, inserted] = backend_ids.try_emplace(id, &backend);
        if (!inserted) {
            const auto& first = *it->second;
            if (first.namespace_name == backend.namespace_name && first.name == backend.name &&
                first.port == backend.port) {
                result.add_warning("Backend '" + id + "' is declared more than once");
            } else {
                // '_' inside namespace or name makes the joined id ambiguous
                result.add_error("Backend id '" + id + "' of '" + backend.namespace_name + "/" +
                                 backend.name + ":" + backend.port + "' collides with '" +
                                 first.namespace_name + "/" + first.name + ":" + first.port +
                                 "'");
            }
        }
    }

    // Validate hosts
    if (config.hosts.empty()) {
        result.add_warning("No hosts configured");
    }

    core::fast_set<std::string> hostnames;
    core::fast_set<std::string> referenced_backends;
    for (const auto& host : config.hosts) {
        if (host.hostname.empty()) {
            result.add_error("Host hostname cannot be empty");
            continue;
        }

        if (!hostnames.insert(host.hostname).second) {
            result.add_error("Host '" + host.hostname + "' is declared more than once");
        }

        if (host.paths.empty()) {
            result.add_warning("Host '" + host.hostname + "' has no paths");
        }

        core::fast_set<std::string> paths;
        for (const auto& path : host.paths) {
            if (path.path.empty()) {
                result.add_error("Host '" + host.hostname + "' has a path with no value");
                continue;
            }

            if (!paths.insert(path.path).second) {
                result.add_error("Path '" + path.path + "' is declared more than once in host '" +
                                 host.hostname + "'");
            }

            if (!registry::parse_match_type(path.match).has_value()) {
                result.add_error("Unknown match type '" + path.match + "' in path '" +
                                 path.path + "' of host '" + host.hostname + "'");
            }

            if (!path.backend.empty()) {
                referenced_backends.insert(path.backend);
                if (!backend_ids.contains(path.backend)) {
                    result.add_error("Path '" + path.path + "' of host '" + host.hostname +
                                     "' references non-existent backend '" + path.backend + "'");
                }
            }
        }
    }

    for (const auto& [id, backend] : backend_ids) {
        if (!referenced_backends.contains(id)) {
            result.add_warning("Backend '" + id + "' is not referenced by any path");
        }
    }

    // Validate logging level
    if (config.logging.level != "debug" && config.logging.level != "info" &&
        config.logging.level != "warning" && config.logging.level != "error") {
        result.add_error("Unknown logging level '" + config.logging.level + "'");
    }

    // Validate logging format
    if (config.logging.format != "json" && config.logging.format != "text") {
        result.add_error("Unknown logging format '" + config.logging.format + "'");
    }

    // Validate log rotation
    const auto& rotation = config.logging.rotation;
    if (rotation.max_size_mb < MIN_LOG_FILE_SIZE_MB || rotation.max_size_mb > MAX_LOG_FILE_SIZE_MB) {
        result.add_error("Log rotation max_size_mb must be between " +
                         std::to_string(MIN_LOG_FILE_SIZE_MB) + " and " +
                         std::to_string(MAX_LOG_FILE_SIZE_MB) + ", got " +
                         std::to_string(rotation.max_size_mb));
    }
    if (rotation.max_files > MAX_LOG_BACKUP_FILES) {
        result.add_error("Log rotation max_files must not exceed " +
                         std::to_string(MAX_LOG_BACKUP_FILES) + ", got " +
                         std::to_string(rotation.max_files));
    }

    return result;
}

bool ConfigLoader::save_to_file(const Config& config, std::string_view path) {
    std::string json = to_json(config);
    if (json.empty()) {
        return false;
    }

    std::string path_str{path};
    std::ofstream file{path_str};
    if (!file.is_open()) {
        return false;
    }

    file << json;
    return file.good();
}

std::string ConfigLoader::to_json(const Config& config) {
    try {
        nlohmann::json j = config;
        return j.dump(2);
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON serialization error: %s\n", e.what());
        return "";
    }
}

// ConfigManager implementation

bool ConfigManager::load(std::string_view path) {
    config_path_ = path;
    return load_current();
}

bool ConfigManager::reload() {
    if (config_path_.empty()) {
        return false;
    }
    return load_current();
}

bool ConfigManager::load_current() {
    last_validation_ = ValidationResult{};

    auto maybe_config = ConfigLoader::load_from_file(config_path_);
    if (!maybe_config.has_value()) {
        last_validation_.add_error("Cannot load configuration from '" + config_path_ + "'");
        return false;
    }

    last_validation_ = ConfigLoader::validate(*maybe_config);
    if (last_validation_.has_errors()) {
        return false;
    }

    current_config_ = std::make_shared<const Config>(std::move(*maybe_config));
    return true;
}

}  // namespace portico::control
