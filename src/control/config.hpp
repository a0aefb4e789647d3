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

// Portico Configuration - Header
// Desired-state document schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace portico::control {

/// Backend declaration (id is <namespace>_<name>_<port>)
struct BackendConfig {
    std::string namespace_name;  // "namespace" in JSON
    std::string name;
    std::string port;
};

/// Routing rule of a host
struct PathConfig {
    std::string path;
    std::string match = "begin";  // begin, exact, prefix, regex
    std::string backend;          // Backend id, empty = 404
};

/// Host TLS settings
struct TLSConfig {
    std::string tls_filename;
    std::string tls_hash;
    std::string ca_filename;
    std::string ca_hash;
    bool ca_verify_optional = false;
    std::string crl_filename;
    std::string crl_hash;
    std::string ca_error_page;
};

/// Host alias settings
struct AliasConfig {
    std::string name;
    std::string regex;
};

/// Virtual host declaration
struct HostConfig {
    std::string hostname;
    bool ssl_passthrough = false;
    bool var_namespace = false;
    std::string root_redirect;
    AliasConfig alias;
    TLSConfig tls;
    std::vector<PathConfig> paths;
};

/// Log rotation bounds accepted by validation
inline constexpr uint32_t MIN_LOG_FILE_SIZE_MB = 1;
inline constexpr uint32_t MAX_LOG_FILE_SIZE_MB = 100'000;
inline constexpr uint32_t MAX_LOG_BACKUP_FILES = 10'000;

/// Logging configuration
struct LogConfig {
    std::string level = "info";               // debug, info, warning, error
    std::string format = "json";              // json, text
    std::string output = "/var/log/portico";  // Log directory (portico.log appended)

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Full desired-state document
struct Config {
    std::vector<BackendConfig> backends;
    std::vector<HostConfig> hosts;

    // Observability
    LogConfig logging;

    // Metadata
    std::string version = "1.0";
    std::optional<std::string> description;
};

// Custom from_json functions to handle missing fields with defaults

inline void from_json(const nlohmann::json& j, BackendConfig& b) {
    j.at("namespace").get_to(b.namespace_name);  // namespace is required
    j.at("name").get_to(b.name);                 // name is required

    // port is required, numeric ports are accepted as well
    const auto& port = j.at("port");
    if (port.is_number_integer()) {
        b.port = std::to_string(port.get<int64_t>());
    } else {
        port.get_to(b.port);
    }
}

inline void from_json(const nlohmann::json& j, PathConfig& p) {
    j.at("path").get_to(p.path);  // path is required
    p.match = j.value("match", std::string("begin"));
    p.backend = j.value("backend", std::string());
}

inline void from_json(const nlohmann::json& j, TLSConfig& t) {
    t.tls_filename = j.value("tls_filename", std::string());
    t.tls_hash = j.value("tls_hash", std::string());
    t.ca_filename = j.value("ca_filename", std::string());
    t.ca_hash = j.value("ca_hash", std::string());
    t.ca_verify_optional = j.value("ca_verify_optional", false);
    t.crl_filename = j.value("crl_filename", std::string());
    t.crl_hash = j.value("crl_hash", std::string());
    t.ca_error_page = j.value("ca_error_page", std::string());
}

inline void from_json(const nlohmann::json& j, AliasConfig& a) {
    a.name = j.value("name", std::string());
    a.regex = j.value("regex", std::string());
}

inline void from_json(const nlohmann::json& j, HostConfig& h) {
    j.at("hostname").get_to(h.hostname);  // hostname is required
    h.ssl_passthrough = j.value("ssl_passthrough", false);
    h.var_namespace = j.value("var_namespace", false);
    h.root_redirect = j.value("root_redirect", std::string());

    // Use contains() for custom struct types to avoid infinite recursion
    if (j.contains("alias")) {
        j.at("alias").get_to(h.alias);
    }
    if (j.contains("tls")) {
        j.at("tls").get_to(h.tls);
    }
    if (j.contains("paths")) {
        j.at("paths").get_to(h.paths);
    }
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("json"));
    l.output = j.value("output", std::string("/var/log/portico"));
    if (j.contains("rotation")) {
        j.at("rotation").get_to(l.rotation);
    }
}

inline void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("backends")) {
        j.at("backends").get_to(c.backends);
    }
    if (j.contains("hosts")) {
        j.at("hosts").get_to(c.hosts);
    }
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
    if (j.contains("version")) {
        j.at("version").get_to(c.version);
    }
    if (j.contains("description")) {
        j.at("description").get_to(c.description);
    }
}

// ============================================================================
// to_json functions for all config types
// ============================================================================

inline void to_json(nlohmann::json& j, const BackendConfig& b) {
    j = nlohmann::json{{"namespace", b.namespace_name}, {"name", b.name}, {"port", b.port}};
}

inline void to_json(nlohmann::json& j, const PathConfig& p) {
    j = nlohmann::json{{"path", p.path}, {"match", p.match}, {"backend", p.backend}};
}

inline void to_json(nlohmann::json& j, const TLSConfig& t) {
    j = nlohmann::json{{"tls_filename", t.tls_filename},
                       {"tls_hash", t.tls_hash},
                       {"ca_filename", t.ca_filename},
                       {"ca_hash", t.ca_hash},
                       {"ca_verify_optional", t.ca_verify_optional},
                       {"crl_filename", t.crl_filename},
                       {"crl_hash", t.crl_hash},
                       {"ca_error_page", t.ca_error_page}};
}

inline void to_json(nlohmann::json& j, const AliasConfig& a) {
    j = nlohmann::json{{"name", a.name}, {"regex", a.regex}};
}

inline void to_json(nlohmann::json& j, const HostConfig& h) {
    j["hostname"] = h.hostname;
    j["ssl_passthrough"] = h.ssl_passthrough;
    j["var_namespace"] = h.var_namespace;
    j["root_redirect"] = h.root_redirect;
    j["alias"] = h.alias;
    j["tls"] = h.tls;
    j["paths"] = h.paths;
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{
        {"level", l.level}, {"format", l.format}, {"output", l.output}, {"rotation", l.rotation}};
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j["backends"] = c.backends;
    j["hosts"] = c.hosts;
    j["logging"] = c.logging;
    j["version"] = c.version;
    if (c.description.has_value()) {
        j["description"] = *c.description;
    }
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file (parse only)
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path);

    /// Load configuration from JSON string (parse only)
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Save configuration to JSON file
    [[nodiscard]] static bool save_to_file(const Config& config, std::string_view path);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);
};

/// Configuration manager. Keeps the last valid document of a file.
class ConfigManager {
public:
    ConfigManager() = default;
    ~ConfigManager() = default;

    // Non-copyable, non-movable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /// Load configuration from path
    [[nodiscard]] bool load(std::string_view path);

    /// Reload configuration from the last loaded path.
    /// On failure the previous document stays current.
    [[nodiscard]] bool reload();

    /// Get current configuration
    [[nodiscard]] std::shared_ptr<const Config> get() const noexcept { return current_config_; }

    /// Get configuration file path
    [[nodiscard]] std::string_view config_path() const noexcept { return config_path_; }

    /// Check if configuration is loaded
    [[nodiscard]] bool is_loaded() const noexcept { return current_config_ != nullptr; }

    /// Get last validation result
    [[nodiscard]] const ValidationResult& last_validation() const noexcept {
        return last_validation_;
    }

private:
    [[nodiscard]] bool load_current();

    std::string config_path_;
    std::shared_ptr<const Config> current_config_;
    ValidationResult last_validation_;
};

}  // namespace portico::control
