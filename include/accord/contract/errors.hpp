#pragma once

#include <accord/contract/schema.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace accord::contract {

/// Base of every contract-level failure
class contract_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// No endpoint matches the method and path
class route_not_found : public contract_error {
public:
    route_not_found(std::string method, std::string path)
        : contract_error("Route not found: " + method + " " + path)
        , method_(std::move(method)), path_(std::move(path)) {}

    const std::string& method() const noexcept { return method_; }
    const std::string& path() const noexcept { return path_; }

private:
    std::string method_;
    std::string path_;
};

/// Request shape rejected before any handler runs
///
/// field is one of params, query, headers, body (or data for the
/// per-connection context of the message transport).
class request_validation_error : public contract_error {
public:
    request_validation_error(std::string field, contract::issues list)
        : contract_error("Validation failed for " + field)
        , field_(std::move(field)), issues_(std::move(list)) {}

    const std::string& field() const noexcept { return field_; }
    const contract::issues& issues() const noexcept { return issues_; }

private:
    std::string field_;
    contract::issues issues_;
};

/// Handler produced a body that disagrees with its declared response schema
class response_contract_violation : public contract_error {
public:
    response_contract_violation(uint16_t status, contract::issues list)
        : contract_error("Response for status " + std::to_string(status) + " violates its schema")
        , status_(status), issues_(std::move(list)) {}

    uint16_t status() const noexcept { return status_; }
    const contract::issues& issues() const noexcept { return issues_; }

private:
    uint16_t status_;
    contract::issues issues_;
};

/// Inbound envelope with an unknown type or an invalid payload
class message_validation_error : public contract_error {
public:
    message_validation_error(std::string message_type, contract::issues list)
        : contract_error("Validation failed for WebSocket message type: " + message_type)
        , message_type_(std::move(message_type)), issues_(std::move(list)) {}

    const std::string& message_type() const noexcept { return message_type_; }
    const contract::issues& issues() const noexcept { return issues_; }

private:
    std::string message_type_;
    contract::issues issues_;
};

} // namespace accord::contract
