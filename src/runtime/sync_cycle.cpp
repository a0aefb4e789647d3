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

// Portico Sync Cycle - Implementation

#include "sync_cycle.hpp"

#include <algorithm>

#include "../core/containers.hpp"
#include "../core/logging.hpp"

namespace portico::runtime {

std::string_view to_string(ReloadKind kind) noexcept {
    switch (kind) {
        case ReloadKind::None:
            return "none";
        case ReloadKind::Incremental:
            return "incremental";
        case ReloadKind::Full:
            return "full";
    }
    return "none";
}

std::optional<CycleReport> SyncCycle::apply(const control::Config& config) {
    CycleReport report;
    report.correlation_id = logging::generate_correlation_id();

    auto* logger = logging::get_current_logger();

    auto validation = control::ConfigLoader::validate(config);
    if (validation.has_errors()) {
        if (logger) {
            for (const auto& error : validation.errors) {
                LOG_ERROR_CTX(logger, "Rejected desired state", report.correlation_id, error);
            }
        }
        return std::nullopt;
    }
    if (logger) {
        for (const auto& warning : validation.warnings) {
            LOG_WARNING(logger, "Desired state warning: correlation_id={}, detail={}",
                        report.correlation_id, warning);
        }
    }

    remove_reparsed();

    core::fast_set<std::string> declared;
    for (const auto& backend : config.backends) {
        auto* acquired =
            backends_.acquire_backend(backend.namespace_name, backend.name, backend.port);
        if (acquired) {
            declared.insert(acquired->id());
        }
    }

    // Hosts hold backend snapshots, never pointers
    auto dropped = backends_.retain(declared);
    if (logger && dropped > 0) {
        LOG_DEBUG(logger, "Dropped undeclared backends: count={}", dropped);
    }

    for (const auto& host_config : config.hosts) {
        build_host(host_config);
    }

    hosts_.shrink();

    if (!hosts_.has_commit()) {
        report.reload = ReloadKind::Full;
    } else if (hosts_.changed()) {
        report.reload = ReloadKind::Incremental;
    } else {
        report.reload = ReloadKind::None;
    }

    for (const auto& [hostname, host] : hosts_.items_add()) {
        report.added.push_back(hostname);
    }
    for (const auto& [hostname, host] : hosts_.items_del()) {
        report.removed.push_back(hostname);
    }
    std::sort(report.added.begin(), report.added.end());
    std::sort(report.removed.begin(), report.removed.end());
    report.host_count = hosts_.size();
    report.has_ssl_passthrough = hosts_.has_ssl_passthrough();

    hosts_.commit();
    ++cycles_;

    if (logger) {
        LOG_CYCLE(logger, report.correlation_id, to_string(report.reload), report.added.size(),
                  report.removed.size());
    }

    return report;
}

void SyncCycle::remove_reparsed() {
    std::vector<std::string> hostnames;
    hostnames.reserve(hosts_.size());
    for (const auto& [hostname, host] : hosts_.items()) {
        hostnames.push_back(hostname);
    }

    for (const auto& hostname : hostnames) {
        backends_.remove_host_paths(hostname);
    }
    hosts_.remove_all(hostnames);
}

void SyncCycle::build_host(const control::HostConfig& host_config) {
    auto* host = hosts_.acquire_host(host_config.hostname);

    host->tls.tls_filename = host_config.tls.tls_filename;
    host->tls.tls_hash = host_config.tls.tls_hash;
    host->tls.ca_filename = host_config.tls.ca_filename;
    host->tls.ca_hash = host_config.tls.ca_hash;
    host->tls.ca_verify_optional = host_config.tls.ca_verify_optional;
    host->tls.crl_filename = host_config.tls.crl_filename;
    host->tls.crl_hash = host_config.tls.crl_hash;
    host->tls.ca_error_page = host_config.tls.ca_error_page;
    host->alias.alias_name = host_config.alias.name;
    host->alias.alias_regex = host_config.alias.regex;
    host->root_redirect = host_config.root_redirect;
    host->var_namespace = host_config.var_namespace;
    host->set_ssl_passthrough(host_config.ssl_passthrough);

    for (const auto& path : host_config.paths) {
        // An empty backend binds the 404 sentinel
        registry::Backend* backend = nullptr;
        if (!path.backend.empty()) {
            backend = backends_.find_backend(path.backend);
        }
        auto match = registry::parse_match_type(path.match).value_or(registry::MatchType::Begin);
        host->add_path(backend, path.path, match);
    }

    if (auto* logger = logging::get_current_logger()) {
        LOG_DEBUG(logger, "Host parsed: {}", host->to_string());
    }
}

}  // namespace portico::runtime
