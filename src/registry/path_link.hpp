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

// Portico Path Link - Header
// (hostname, path) identity of a routing rule

#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace portico::registry {

/// Identity of one routing rule inside the registry
class PathLink {
public:
    PathLink() = default;
    PathLink(std::string hostname, std::string path)
        : hostname_(std::move(hostname)), path_(std::move(path)) {}

    [[nodiscard]] std::string_view hostname() const noexcept { return hostname_; }
    [[nodiscard]] std::string_view path() const noexcept { return path_; }

    /// Both fields empty: the "no link" sentinel
    [[nodiscard]] bool is_empty() const noexcept { return hostname_.empty() && path_.empty(); }

    /// Hostname always ascending; path descending when reverse_path is set.
    /// Route matching wants descending paths so longer paths come first.
    [[nodiscard]] bool less(const PathLink& other, bool reverse_path) const noexcept {
        if (hostname_ == other.hostname_) {
            if (reverse_path) {
                return path_ > other.path_;
            }
            return path_ < other.path_;
        }
        return hostname_ < other.hostname_;
    }

    bool operator==(const PathLink&) const = default;

private:
    std::string hostname_;
    std::string path_;
};

/// Create a link for the given hostname and path
[[nodiscard]] inline PathLink create_path_link(std::string hostname, std::string path) {
    return PathLink{std::move(hostname), std::move(path)};
}

}  // namespace portico::registry
