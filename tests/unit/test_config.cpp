// Portico Configuration Layer Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>

#include "../../src/control/config.hpp"

using namespace portico::control;

namespace {

bool contains_message(const std::vector<std::string>& messages, const std::string& needle) {
    return std::any_of(messages.begin(), messages.end(), [&needle](const std::string& message) {
        return message.find(needle) != std::string::npos;
    });
}

Config make_valid_config() {
    Config config;
    config.backends.push_back(BackendConfig{"default", "app", "8080"});

    HostConfig host;
    host.hostname = "a.com";
    host.paths.push_back(PathConfig{"/", "prefix", "default_app_8080"});
    config.hosts.push_back(host);
    return config;
}

}  // namespace

TEST_CASE("Config JSON deserialization", "[control][config]") {
    const char* json = R"({
        "version": "1.0",
        "logging": {"level": "debug", "format": "text", "output": "/tmp/portico"},
        "backends": [
            {"namespace": "default", "name": "app", "port": "8080"},
            {"namespace": "default", "name": "api", "port": 9090}
        ],
        "hosts": [
            {
                "hostname": "a.com",
                "ssl_passthrough": true,
                "tls": {"tls_filename": "/certs/a.pem", "ca_hash": "abc"},
                "alias": {"name": "www.a.com"},
                "paths": [
                    {"path": "/", "backend": "default_app_8080"},
                    {"path": "/api", "match": "prefix", "backend": "default_api_9090"}
                ]
            },
            {"hostname": "b.com"}
        ]
    })";

    auto maybe_config = ConfigLoader::load_from_json(json);
    REQUIRE(maybe_config.has_value());

    const auto& config = *maybe_config;
    REQUIRE(config.version == "1.0");
    REQUIRE(config.logging.level == "debug");
    REQUIRE(config.logging.format == "text");
    REQUIRE(config.logging.output == "/tmp/portico");
    REQUIRE(config.logging.rotation.max_files == 10);

    REQUIRE(config.backends.size() == 2);
    REQUIRE(config.backends[0].namespace_name == "default");
    REQUIRE(config.backends[1].port == "9090");

    REQUIRE(config.hosts.size() == 2);
    const auto& a = config.hosts[0];
    REQUIRE(a.hostname == "a.com");
    REQUIRE(a.ssl_passthrough);
    REQUIRE_FALSE(a.var_namespace);
    REQUIRE(a.tls.tls_filename == "/certs/a.pem");
    REQUIRE(a.tls.ca_hash == "abc");
    REQUIRE(a.tls.crl_hash.empty());
    REQUIRE(a.alias.name == "www.a.com");
    REQUIRE(a.paths.size() == 2);
    REQUIRE(a.paths[0].match == "begin");
    REQUIRE(a.paths[1].match == "prefix");
    REQUIRE(a.paths[1].backend == "default_api_9090");

    const auto& b = config.hosts[1];
    REQUIRE(b.paths.empty());
    REQUIRE_FALSE(b.ssl_passthrough);
}

TEST_CASE("Config JSON parse errors", "[control][config]") {
    SECTION("Malformed JSON") {
        REQUIRE_FALSE(ConfigLoader::load_from_json("{ invalid json }").has_value());
    }

    SECTION("Missing hostname") {
        REQUIRE_FALSE(ConfigLoader::load_from_json(R"({"hosts": [{"paths": []}]})").has_value());
    }

    SECTION("Missing backend port") {
        REQUIRE_FALSE(ConfigLoader::load_from_json(
                          R"({"backends": [{"namespace": "default", "name": "app"}]})")
                          .has_value());
    }

    SECTION("Missing file") {
        REQUIRE_FALSE(ConfigLoader::load_from_file("/nonexistent/portico.json").has_value());
    }
}

TEST_CASE("Config validation - valid config", "[control][config]") {
    auto result = ConfigLoader::validate(make_valid_config());
    REQUIRE(result.valid);
    REQUIRE_FALSE(result.has_errors());
    REQUIRE(result.warnings.empty());
}

TEST_CASE("Config validation - errors", "[control][config]") {
    auto config = make_valid_config();

    SECTION("Empty hostname") {
        config.hosts.push_back(HostConfig{});
        auto result = ConfigLoader::validate(config);
        REQUIRE(result.has_errors());
        REQUIRE(contains_message(result.errors, "hostname cannot be empty"));
    }

    SECTION("Duplicate hostname") {
        config.hosts.push_back(config.hosts[0]);
        auto result = ConfigLoader::validate(config);
        REQUIRE(result.has_errors());
        REQUIRE(contains_message(result.errors, "'a.com' is declared more than once"));
    }

    SECTION("Empty path") {
        config.hosts[0].paths.push_back(PathConfig{"", "begin", ""});
        auto result = ConfigLoader::validate(config);
        REQUIRE(contains_message(result.errors, "has a path with no value"));
    }

    SECTION("Duplicate path") {
        config.hosts[0].paths.push_back(PathConfig{"/", "begin", ""});
        auto result = ConfigLoader::validate(config);
        REQUIRE(contains_message(result.errors, "Path '/' is declared more than once"));
    }

    SECTION("Unknown match type") {
        config.hosts[0].paths[0].match = "glob";
        auto result = ConfigLoader::validate(config);
        REQUIRE(contains_message(result.errors, "Unknown match type 'glob'"));
    }

    SECTION("Undeclared backend") {
        config.hosts[0].paths[0].backend = "default_other_8080";
        auto result = ConfigLoader::validate(config);
        REQUIRE(contains_message(result.errors, "non-existent backend 'default_other_8080'"));
    }

    SECTION("Incomplete backend") {
        config.backends.push_back(BackendConfig{"", "svc", ""});
        auto result = ConfigLoader::validate(config);
        REQUIRE(contains_message(result.errors, "Backend 'svc' has no namespace"));
        REQUIRE(contains_message(result.errors, "Backend 'svc' has no port"));
    }

    SECTION("Backend ids colliding across namespace and name") {
        config.backends.push_back(BackendConfig{"team_a", "web", "80"});
        config.backends.push_back(BackendConfig{"team", "a_web", "80"});
        auto result = ConfigLoader::validate(config);
        REQUIRE(result.has_errors());
        REQUIRE(contains_message(result.errors, "Backend id 'team_a_web_80'"));
        REQUIRE(contains_message(result.errors, "collides with 'team_a/web:80'"));
    }

    SECTION("Log rotation size of zero") {
        config.logging.rotation.max_size_mb = 0;
        auto result = ConfigLoader::validate(config);
        REQUIRE(result.has_errors());
        REQUIRE(contains_message(result.errors, "max_size_mb must be between"));
    }

    SECTION("Log rotation size too large") {
        config.logging.rotation.max_size_mb = MAX_LOG_FILE_SIZE_MB + 1;
        auto result = ConfigLoader::validate(config);
        REQUIRE(result.has_errors());
        REQUIRE(contains_message(result.errors, "max_size_mb must be between"));
    }

    SECTION("Too many rotated files") {
        config.logging.rotation.max_files = MAX_LOG_BACKUP_FILES + 1;
        auto result = ConfigLoader::validate(config);
        REQUIRE(contains_message(result.errors, "max_files must not exceed"));
    }

    SECTION("Unknown logging level") {
        config.logging.level = "verbose";
        auto result = ConfigLoader::validate(config);
        REQUIRE(contains_message(result.errors, "Unknown logging level 'verbose'"));
    }

    SECTION("Unknown logging format") {
        config.logging.format = "xml";
        auto result = ConfigLoader::validate(config);
        REQUIRE(contains_message(result.errors, "Unknown logging format 'xml'"));
    }
}

TEST_CASE("Config validation - warnings", "[control][config]") {
    auto config = make_valid_config();

    SECTION("Host without paths") {
        HostConfig host;
        host.hostname = "b.com";
        config.hosts.push_back(host);
        auto result = ConfigLoader::validate(config);
        REQUIRE_FALSE(result.has_errors());
        REQUIRE(contains_message(result.warnings, "'b.com' has no paths"));
    }

    SECTION("Same backend declared twice") {
        config.backends.push_back(BackendConfig{"default", "app", "8080"});
        auto result = ConfigLoader::validate(config);
        REQUIRE_FALSE(result.has_errors());
        REQUIRE(contains_message(result.warnings, "'default_app_8080' is declared more than once"));
    }

    SECTION("Rotation bounds are inclusive") {
        config.logging.rotation.max_size_mb = MAX_LOG_FILE_SIZE_MB;
        config.logging.rotation.max_files = 0;
        auto result = ConfigLoader::validate(config);
        REQUIRE_FALSE(result.has_errors());
    }

    SECTION("Unreferenced backend") {
        config.backends.push_back(BackendConfig{"default", "idle", "80"});
        auto result = ConfigLoader::validate(config);
        REQUIRE_FALSE(result.has_errors());
        REQUIRE(contains_message(result.warnings, "'default_idle_80' is not referenced"));
    }

    SECTION("Path without backend is allowed") {
        config.hosts[0].paths.push_back(PathConfig{"/missing", "begin", ""});
        auto result = ConfigLoader::validate(config);
        REQUIRE_FALSE(result.has_errors());
    }

    SECTION("No hosts") {
        Config empty;
        auto result = ConfigLoader::validate(empty);
        REQUIRE_FALSE(result.has_errors());
        REQUIRE(contains_message(result.warnings, "No hosts configured"));
    }
}

TEST_CASE("Config file round trip", "[control][config]") {
    auto temp_file = std::filesystem::temp_directory_path() / "portico_config_roundtrip.json";

    auto config = make_valid_config();
    config.description = "round trip";
    config.hosts[0].tls.ca_verify_optional = true;
    REQUIRE(ConfigLoader::save_to_file(config, temp_file.string()));

    auto loaded = ConfigLoader::load_from_file(temp_file.string());
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->description == "round trip");
    REQUIRE(loaded->hosts.size() == 1);
    REQUIRE(loaded->hosts[0].tls.ca_verify_optional);
    REQUIRE(loaded->hosts[0].paths[0].backend == "default_app_8080");

    std::filesystem::remove(temp_file);
}

TEST_CASE("Config manager load and reload", "[control][config]") {
    auto temp_file = std::filesystem::temp_directory_path() / "portico_config_manager.json";

    ConfigManager manager;
    REQUIRE_FALSE(manager.is_loaded());
    REQUIRE_FALSE(manager.reload());

    REQUIRE(ConfigLoader::save_to_file(make_valid_config(), temp_file.string()));
    REQUIRE(manager.load(temp_file.string()));
    REQUIRE(manager.is_loaded());
    REQUIRE(manager.config_path() == temp_file.string());
    REQUIRE(manager.get()->hosts.size() == 1);

    SECTION("Reload picks up the new document") {
        auto config = make_valid_config();
        HostConfig host;
        host.hostname = "b.com";
        host.paths.push_back(PathConfig{"/", "begin", "default_app_8080"});
        config.hosts.push_back(host);
        REQUIRE(ConfigLoader::save_to_file(config, temp_file.string()));

        REQUIRE(manager.reload());
        REQUIRE(manager.get()->hosts.size() == 2);
    }

    SECTION("Invalid document keeps the previous one") {
        auto config = make_valid_config();
        config.hosts[0].paths[0].match = "glob";
        REQUIRE(ConfigLoader::save_to_file(config, temp_file.string()));

        REQUIRE_FALSE(manager.reload());
        REQUIRE(manager.last_validation().has_errors());
        REQUIRE(manager.get()->hosts[0].paths[0].match == "prefix");
    }

    SECTION("Unreadable document") {
        {
            std::ofstream file(temp_file);
            file << "{ not json";
        }
        REQUIRE_FALSE(manager.reload());
        REQUIRE(manager.last_validation().has_errors());
        REQUIRE(manager.is_loaded());
    }

    std::filesystem::remove(temp_file);
}
