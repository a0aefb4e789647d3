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

// Portico Backend - Header
// Backend entities and the reverse index of paths routed to them

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "../core/containers.hpp"
#include "path_link.hpp"

namespace portico::registry {

/// Build the backend identifier: <namespace>_<name>_<port>
[[nodiscard]] std::string build_backend_id(std::string_view namespace_name,
                                           std::string_view name, std::string_view port);

/// Backend entity. Hosts never point at it; they keep a HostBackend snapshot.
class Backend {
public:
    Backend(std::string namespace_name, std::string name, std::string port);

    // Non-copyable, movable
    Backend(const Backend&) = delete;
    Backend& operator=(const Backend&) = delete;
    Backend(Backend&&) noexcept = default;
    Backend& operator=(Backend&&) noexcept = default;

    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] const std::string& namespace_name() const noexcept { return namespace_name_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::string& port() const noexcept { return port_; }

    /// Register a path routed to this backend; a link already present is kept once
    void add_backend_path(const PathLink& link);

    /// Drop every link that belongs to hostname, returns how many were dropped
    size_t remove_host_paths(std::string_view hostname);

    /// Check if link is registered
    [[nodiscard]] bool has_path(const PathLink& link) const noexcept;

    /// Links in registration order
    [[nodiscard]] const std::vector<PathLink>& paths() const noexcept { return paths_; }

    /// Links sorted with PathLink::less
    [[nodiscard]] std::vector<PathLink> sorted_paths(bool reverse_path) const;

private:
    std::string id_;
    std::string namespace_name_;
    std::string name_;
    std::string port_;
    std::vector<PathLink> paths_;
};

/// Backend store keyed by backend id
class Backends {
public:
    Backends() = default;
    ~Backends() = default;

    // Non-copyable, non-movable (hosts and drivers keep raw pointers)
    Backends(const Backends&) = delete;
    Backends& operator=(const Backends&) = delete;

    /// Find or create the backend for namespace/name/port.
    /// Returns nullptr when the id is already taken by a backend with other fields.
    Backend* acquire_backend(std::string_view namespace_name, std::string_view name,
                             std::string_view port);

    /// Get backend by id (nullptr if not found)
    [[nodiscard]] Backend* find_backend(std::string_view id) const;

    /// Drop the links of hostname from every backend
    void remove_host_paths(std::string_view hostname);

    /// Drop every backend whose id is not in ids, returns how many were dropped
    size_t retain(const core::fast_set<std::string>& ids);

    [[nodiscard]] const core::fast_map<std::string, std::unique_ptr<Backend>>& items()
        const noexcept {
        return items_;
    }

    [[nodiscard]] size_t size() const noexcept { return items_.size(); }

private:
    core::fast_map<std::string, std::unique_ptr<Backend>> items_;
};

}  // namespace portico::registry
