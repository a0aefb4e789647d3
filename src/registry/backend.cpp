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


// Portico Backend - Implementation

#include "backend.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>

namespace portico::registry {

std::string build_backend_id(std::string_view namespace_name, std::string_view name,
                             std::string_view port) {
    return fmt::format("{}_{}_{}", namespace_name, name, port);
}

// Backend implementation

Backend::Backend(std::string namespace_name, std::string name, std::string port)
    : id_(build_backend_id(namespace_name, name, port)),
      namespace_name_(std::move(namespace_name)),
      name_(std::move(name)),
      port_(std::move(port)) {}

void Backend::add_backend_path(const PathLink& link) {
    if (has_path(link)) {
        return;
    }
    paths_.push_back(link);
}

size_t Backend::remove_host_paths(std::string_view hostname) {
    auto first = std::remove_if(paths_.begin(), paths_.end(), [hostname](const PathLink& link) {
        return link.hostname() == hostname;
    });
    auto removed = static_cast<size_t>(std::distance(first, paths_.end()));
    paths_.erase(first, paths_.end());
    return removed;
}

bool Backend::has_path(const PathLink& link) const noexcept {
    return std::find(paths_.begin(), paths_.end(), link) != paths_.end();
}

std::vector<PathLink> Backend::sorted_paths(bool reverse_path) const {
    std::vector<PathLink> sorted = paths_;
    std::sort(sorted.begin(), sorted.end(), [reverse_path](const PathLink& a, const PathLink& b) {
        return a.less(b, reverse_path);
    });
    return sorted;
}

// Backends implementation

Backend* Backends::acquire_backend(std::string_view namespace_name, std::string_view name,
                                   std::string_view port) {
    std::string id = build_backend_id(namespace_name, name, port);
    if (auto* backend = find_backend(id)) {
        if (backend->namespace_name() != namespace_name || backend->name() != name ||
            backend->port() != port) {
            return nullptr;
        }
        return backend;
    }
    auto backend = std::make_unique<Backend>(std::string(namespace_name), std::string(name),
                                             std::string(port));
    Backend* raw = backend.get();
    items_.emplace(std::move(id), std::move(backend));
    return raw;
}

Backend* Backends::find_backend(std::string_view id) const {
    auto it = items_.find(std::string(id));
    if (it == items_.end()) {
        return nullptr;
    }
    return it->second.get();
}

void Backends::remove_host_paths(std::string_view hostname) {
    for (auto& [id, backend] : items_) {
        backend->remove_host_paths(hostname);
    }
}

size_t Backends::retain(const core::fast_set<std::string>& ids) {
    std::vector<std::string> dropped;
    for (const auto& [id, backend] : items_) {
        if (!ids.contains(id)) {
            dropped.push_back(id);
        }
    }
    for (const auto& id : dropped) {
        items_.erase(id);
    }
    return dropped.size();
}

}  // namespace portico::registry
