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

// Portico Sync Cycle - Header
// Applies desired-state documents to a persistent host registry, one cycle each

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../control/config.hpp"
#include "../registry/backend.hpp"
#include "../registry/host.hpp"

namespace portico::runtime {

/// How the proxy has to be reloaded after a cycle
enum class ReloadKind : uint8_t {
    None,         // Nothing changed
    Incremental,  // Apply the added/removed delta
    Full          // No committed state to diff against
};

[[nodiscard]] std::string_view to_string(ReloadKind kind) noexcept;

/// Outcome of one cycle
struct CycleReport {
    std::string correlation_id;
    ReloadKind reload = ReloadKind::None;
    std::vector<std::string> added;    // Sorted hostnames
    std::vector<std::string> removed;  // Sorted hostnames
    size_t host_count = 0;
    bool has_ssl_passthrough = false;
};

/// Rebuild-cycle driver. Owns the registry and the backend store for the
/// lifetime of the process. Single writer: apply() must not run concurrently.
class SyncCycle {
public:
    SyncCycle() = default;
    ~SyncCycle() = default;

    // Non-copyable, non-movable
    SyncCycle(const SyncCycle&) = delete;
    SyncCycle& operator=(const SyncCycle&) = delete;

    /// Run one cycle. Returns std::nullopt (registry untouched) when the
    /// document does not validate.
    [[nodiscard]] std::optional<CycleReport> apply(const control::Config& config);

    [[nodiscard]] const registry::Hosts& hosts() const noexcept { return hosts_; }
    [[nodiscard]] const registry::Backends& backends() const noexcept { return backends_; }

    /// Number of committed cycles
    [[nodiscard]] uint64_t cycles() const noexcept { return cycles_; }

private:
    // Every current host is re-parsed; shrink() cancels the unchanged ones
    void remove_reparsed();

    // Populate one host from its declaration
    void build_host(const control::HostConfig& host_config);

    registry::Hosts hosts_;
    registry::Backends backends_;
    uint64_t cycles_ = 0;
};

}  // namespace portico::runtime
