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


// Portico Host Registry - Implementation

#include "host.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>

#include "../core/logging.hpp"

namespace portico::registry {

// MatchType helpers

std::string_view to_string(MatchType match) noexcept {
    switch (match) {
        case MatchType::Begin:
            return "begin";
        case MatchType::Exact:
            return "exact";
        case MatchType::Prefix:
            return "prefix";
        case MatchType::Regex:
            return "regex";
    }
    return "begin";
}

std::optional<MatchType> parse_match_type(std::string_view str) noexcept {
    if (str == "begin")
        return MatchType::Begin;
    if (str == "exact")
        return MatchType::Exact;
    if (str == "prefix")
        return MatchType::Prefix;
    if (str == "regex")
        return MatchType::Regex;
    return std::nullopt;
}

// Host implementation

Host::Host(std::string hostname, Hosts* hosts) : hostname_(std::move(hostname)), hosts_(hosts) {}

HostPath* Host::find_path(std::string_view path) const noexcept {
    for (const auto& p : paths_) {
        if (p->path == path) {
            return p.get();
        }
    }
    return nullptr;
}

void Host::add_path(Backend* backend, std::string_view path, MatchType match) {
    auto link = create_path_link(hostname_, std::string(path));

    HostBackend hback;
    if (backend) {
        hback.id = backend->id();
        hback.namespace_name = backend->namespace_name();
        hback.name = backend->name();
        hback.port = backend->port();
        backend->add_backend_path(link);
    } else {
        hback.id = std::string(ERROR_404_BACKEND_ID);
    }

    auto host_path = std::make_unique<HostPath>();
    host_path->path = std::string(path);
    host_path->link = std::move(link);
    host_path->match = match;
    host_path->backend = std::move(hback);
    paths_.push_back(std::move(host_path));

    // Descending order so a sub-path never shadows a longer sibling.
    // Stable to keep duplicate paths in insertion order.
    std::stable_sort(paths_.begin(), paths_.end(),
                     [](const std::unique_ptr<HostPath>& a, const std::unique_ptr<HostPath>& b) {
                         return a->path > b->path;
                     });
}

void Host::set_ssl_passthrough(bool value) noexcept {
    if (ssl_passthrough_ == value) {
        return;
    }
    if (value) {
        hosts_->ssl_passthrough_count_++;
    } else {
        hosts_->ssl_passthrough_count_--;
    }
    ssl_passthrough_ = value;
}

std::string Host::to_string() const {
    std::string out;
    auto it = std::back_inserter(out);
    fmt::format_to(it, "{{Hostname:{} Paths:[", hostname_);
    for (size_t i = 0; i < paths_.size(); ++i) {
        const auto& p = *paths_[i];
        fmt::format_to(it, "{}{{Path:{} Match:{} Backend:{}}}", i == 0 ? "" : " ", p.path,
                       registry::to_string(p.match), p.backend.id);
    }
    fmt::format_to(it,
                   "] Alias:{{AliasName:{} AliasRegex:{}}} RootRedirect:{} TLS:{{TLSFilename:{} "
                   "TLSHash:{} CAFilename:{} CAHash:{} CAVerifyOptional:{} CRLFilename:{} "
                   "CRLHash:{} CAErrorPage:{}}} VarNamespace:{} SSLPassthrough:{}}}",
                   alias.alias_name, alias.alias_regex, root_redirect, tls.tls_filename,
                   tls.tls_hash, tls.ca_filename, tls.ca_hash, tls.ca_verify_optional,
                   tls.crl_filename, tls.crl_hash, tls.ca_error_page, var_namespace,
                   ssl_passthrough_);
    return out;
}

bool Host::operator==(const Host& other) const {
    if (hostname_ != other.hostname_ || ssl_passthrough_ != other.ssl_passthrough_ ||
        var_namespace != other.var_namespace || root_redirect != other.root_redirect ||
        !(tls == other.tls) || !(alias == other.alias)) {
        return false;
    }
    return std::equal(paths_.begin(), paths_.end(), other.paths_.begin(), other.paths_.end(),
                      [](const std::unique_ptr<HostPath>& a, const std::unique_ptr<HostPath>& b) {
                          return *a == *b;
                      });
}

// Hosts implementation

Host* Hosts::acquire_host(std::string_view hostname) {
    if (auto* host = find_host(hostname)) {
        return host;
    }
    // Host constructor is private to the registry, std::make_unique cannot reach it
    auto host = std::unique_ptr<Host>(new Host(std::string(hostname), this));
    Host* raw = host.get();
    items_.emplace(std::string(hostname), std::move(host));
    items_add_.insert_or_assign(std::string(hostname), raw);
    return raw;
}

Host* Hosts::find_host(std::string_view hostname) const {
    auto it = items_.find(std::string(hostname));
    if (it == items_.end()) {
        return nullptr;
    }
    return it->second.get();
}

void Hosts::remove_all(const std::vector<std::string>& hostnames) {
    for (const auto& hostname : hostnames) {
        auto it = items_.find(hostname);
        if (it == items_.end()) {
            continue;
        }
        std::unique_ptr<Host> host = std::move(it->second);
        items_.erase(it);
        release_host(*host);

        // Created and removed within the same cycle: no net change
        auto add = items_add_.find(hostname);
        if (add != items_add_.end() && add->second == host.get()) {
            items_add_.erase(add);
            continue;
        }

        // Keep the earliest snapshot, it is the one the last commit saw
        items_del_.try_emplace(hostname, std::move(host));
    }
}

void Hosts::shrink() {
    std::vector<std::string> reparsed;
    for (const auto& [name, del] : items_del_) {
        auto add = items_add_.find(name);
        if (add != items_add_.end() && *add->second == *del) {
            reparsed.push_back(name);
        }
    }

    auto* logger = logging::get_current_logger();
    for (const auto& name : reparsed) {
        auto del = items_del_.find(name);
        // Restores the committed instance, the reparsed copy is released.
        // Both carry the same passthrough flag so the counter stays as is.
        items_[name] = std::move(del->second);
        items_del_.erase(del);
        items_add_.erase(name);
        if (logger) {
            LOG_DEBUG(logger, "Host reparsed without changes: hostname={}", name);
        }
    }
}

void Hosts::commit() {
    if (auto* logger = logging::get_current_logger()) {
        LOG_DEBUG(logger, "Committing host registry: hosts={}, added={}, removed={}",
                  items_.size(), items_add_.size(), items_del_.size());
    }
    items_add_ = HostRefMap{};
    items_del_ = HostMap{};
    has_commit_ = true;
}

std::vector<Host*> Hosts::build_sorted_items() const {
    std::vector<Host*> sorted;
    sorted.reserve(items_.size());
    for (const auto& [hostname, host] : items_) {
        if (hostname != DEFAULT_HOST) {
            sorted.push_back(host.get());
        }
    }
    std::sort(sorted.begin(), sorted.end(),
              [](const Host* a, const Host* b) { return a->hostname() < b->hostname(); });
    return sorted;
}

bool Hosts::has_var_namespace() const noexcept {
    for (const auto& [hostname, host] : items_) {
        if (host->var_namespace) {
            return true;
        }
    }
    return false;
}

void Hosts::release_host(const Host& host) noexcept {
    if (host.ssl_passthrough_) {
        ssl_passthrough_count_--;
    }
}

}  // namespace portico::registry
