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

// Portico Host Registry - Header
// Virtual hosts, their ordered routing rules and the per-cycle change tracker

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../core/containers.hpp"
#include "backend.hpp"
#include "path_link.hpp"

namespace portico::registry {

/// Hostname of the catch-all host
inline constexpr std::string_view DEFAULT_HOST = "<default>";

/// Backend id bound to paths that have no backend
inline constexpr std::string_view ERROR_404_BACKEND_ID = "_error404";

/// Path match semantics
enum class MatchType : uint8_t {
    Begin,
    Exact,
    Prefix,
    Regex
};

[[nodiscard]] std::string_view to_string(MatchType match) noexcept;

/// Parse lowercase match name ("begin", "exact", "prefix", "regex")
[[nodiscard]] std::optional<MatchType> parse_match_type(std::string_view str) noexcept;

/// Snapshot of a backend identity taken when a path is bound
struct HostBackend {
    std::string id;
    std::string namespace_name;
    std::string name;
    std::string port;

    /// Sentinel for paths without a backend
    [[nodiscard]] bool is_error_404() const noexcept { return id == ERROR_404_BACKEND_ID; }

    bool operator==(const HostBackend&) const = default;
};

/// TLS settings of a host. Certificate material lives elsewhere,
/// only file names and hashes are tracked here.
struct HostTLSConfig {
    std::string tls_filename;
    std::string tls_hash;
    std::string ca_filename;
    std::string ca_hash;
    bool ca_verify_optional = false;
    std::string crl_filename;
    std::string crl_hash;
    std::string ca_error_page;

    [[nodiscard]] bool has_tls() const noexcept { return !tls_filename.empty(); }

    bool operator==(const HostTLSConfig&) const = default;
};

/// Alternative names answered by a host
struct HostAliasConfig {
    std::string alias_name;
    std::string alias_regex;

    bool operator==(const HostAliasConfig&) const = default;
};

/// One routing rule of a host
struct HostPath {
    std::string path;
    PathLink link;
    MatchType match = MatchType::Begin;
    HostBackend backend;

    bool operator==(const HostPath&) const = default;
};

class Hosts;

/// Virtual host
class Host {
public:
    // Non-copyable, non-movable (registry hands out raw pointers)
    Host(const Host&) = delete;
    Host& operator=(const Host&) = delete;

    [[nodiscard]] const std::string& hostname() const noexcept { return hostname_; }

    /// Paths sorted descending by path string
    [[nodiscard]] const std::vector<std::unique_ptr<HostPath>>& paths() const noexcept {
        return paths_;
    }

    /// First path with an exact string match (nullptr if not found)
    [[nodiscard]] HostPath* find_path(std::string_view path) const noexcept;

    /// Bind path to backend. A null backend binds the 404 sentinel.
    /// The same path added twice is kept twice.
    void add_path(Backend* backend, std::string_view path, MatchType match);

    [[nodiscard]] bool ssl_passthrough() const noexcept { return ssl_passthrough_; }

    /// Only mutation path for the flag; keeps the registry counter in step
    void set_ssl_passthrough(bool value) noexcept;

    /// Client certificate authentication is configured
    [[nodiscard]] bool has_tls_auth() const noexcept { return !tls.ca_hash.empty(); }

    /// One-line dump for debug logging
    [[nodiscard]] std::string to_string() const;

    /// Deep value comparison. The registry back-reference does not take part.
    [[nodiscard]] bool operator==(const Host& other) const;

    HostTLSConfig tls;
    HostAliasConfig alias;
    std::string root_redirect;
    bool var_namespace = false;

private:
    friend class Hosts;

    Host(std::string hostname, Hosts* hosts);

    std::string hostname_;
    std::vector<std::unique_ptr<HostPath>> paths_;
    bool ssl_passthrough_ = false;
    Hosts* hosts_;  // Owning registry, never null
};

/// Host registry with per-cycle change tracking
///
/// A cycle is: acquire_host()/remove_all() -> shrink() -> changed()/items_add()/items_del()
/// -> commit(). Not thread-safe; one cycle driver mutates a registry at a time.
class Hosts {
public:
    using HostMap = core::fast_map<std::string, std::unique_ptr<Host>>;
    using HostRefMap = core::fast_map<std::string, Host*>;

    Hosts() = default;
    ~Hosts() = default;

    // Non-copyable, non-movable (hosts keep a pointer to their registry)
    Hosts(const Hosts&) = delete;
    Hosts& operator=(const Hosts&) = delete;

    /// Find or create host; a created host is recorded as added
    Host* acquire_host(std::string_view hostname);

    /// Get host by hostname (nullptr if not found)
    [[nodiscard]] Host* find_host(std::string_view hostname) const;

    /// Remove hosts; unknown hostnames are ignored
    void remove_all(const std::vector<std::string>& hostnames);

    /// Cancel added+removed pairs with the same content
    void shrink();

    /// Close the cycle
    void commit();

    [[nodiscard]] bool has_commit() const noexcept { return has_commit_; }

    /// Meaningful only after shrink()
    [[nodiscard]] bool changed() const noexcept {
        return !items_add_.empty() || !items_del_.empty();
    }

    /// All hosts except the default host, ascending by hostname
    [[nodiscard]] std::vector<Host*> build_sorted_items() const;

    [[nodiscard]] Host* default_host() const { return find_host(DEFAULT_HOST); }

    [[nodiscard]] bool has_ssl_passthrough() const noexcept { return ssl_passthrough_count_ > 0; }

    [[nodiscard]] int ssl_passthrough_count() const noexcept { return ssl_passthrough_count_; }

    /// Linear scan over current hosts
    [[nodiscard]] bool has_var_namespace() const noexcept;

    [[nodiscard]] const HostMap& items() const noexcept { return items_; }
    [[nodiscard]] const HostRefMap& items_add() const noexcept { return items_add_; }
    [[nodiscard]] const HostMap& items_del() const noexcept { return items_del_; }

    [[nodiscard]] size_t size() const noexcept { return items_.size(); }

private:
    friend class Host;

    // Reverse update of the aggregates for a host leaving items_
    void release_host(const Host& host) noexcept;

    HostMap items_;        // Current hosts, owning
    HostRefMap items_add_;  // Created since last commit, always also in items_
    HostMap items_del_;    // Removed since last commit, owning the last committed snapshot
    int ssl_passthrough_count_ = 0;
    bool has_commit_ = false;
};

}  // namespace portico::registry
