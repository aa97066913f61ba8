#pragma once

/// @file registry.hpp
/// @brief Immutable registry of named endpoints

#include <accord/contract/endpoint.hpp>
#include <accord/contract/errors.hpp>
#include <accord/contract/path_matcher.hpp>

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace accord::contract {

/// Result of resolving an inbound request against the contract
struct route_match {
    const endpoint_definition* endpoint = nullptr;
    path_params params;
};

/// Ordered, name-unique collection of endpoint definitions
///
/// Every path pattern is compiled once here. Lookups walk endpoints in
/// registration order, so when two endpoints share a method and pattern the
/// first one registered always wins.
class registry {
public:
    struct entry {
        endpoint_definition definition;
        path_matcher matcher;
    };

    registry(std::initializer_list<endpoint_definition> endpoints)
        : registry(std::vector<endpoint_definition>(endpoints)) {}

    explicit registry(std::vector<endpoint_definition> endpoints) {
        entries_.reserve(endpoints.size());
        for (auto& def : endpoints) {
            if (def.name.empty()) {
                throw contract_error("Endpoint name must not be empty");
            }
            if (def.path.empty() || def.path.front() != '/') {
                throw contract_error("Endpoint '" + def.name + "' path must start with '/'");
            }
            if (def.kind() == transport_kind::message && def.method != http::method::GET) {
                throw contract_error("Message endpoint '" + def.name + "' must use GET");
            }
            if (by_name_.contains(def.name)) {
                throw contract_error("Duplicate endpoint name: " + def.name);
            }
            by_name_.emplace(def.name, entries_.size());
            path_matcher matcher(def.path);
            entries_.push_back(entry{std::move(def), std::move(matcher)});
        }
    }

    size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    auto begin() const noexcept { return entries_.begin(); }
    auto end() const noexcept { return entries_.end(); }

    /// Endpoint by name, or nullptr
    const endpoint_definition* find(std::string_view name) const {
        auto it = by_name_.find(std::string(name));
        return it == by_name_.end() ? nullptr : &entries_[it->second].definition;
    }

    /// Endpoint by name, or contract_error
    const endpoint_definition& at(std::string_view name) const {
        if (auto* def = find(name)) {
            return *def;
        }
        throw contract_error("Unknown endpoint: " + std::string(name));
    }

    /// First endpoint in registration order matching method and path
    std::optional<route_match> match(http::method m, std::string_view path) const {
        for (const auto& e : entries_) {
            if (e.definition.method != m) {
                continue;
            }
            if (auto params = e.matcher.match(path)) {
                return route_match{&e.definition, std::move(*params)};
            }
        }
        return std::nullopt;
    }

private:
    std::vector<entry> entries_;
    std::unordered_map<std::string, size_t> by_name_;
};

} // namespace accord::contract
