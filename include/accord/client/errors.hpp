#pragma once

/// @file errors.hpp
/// @brief Failures reported by the client dispatchers

#include <accord/contract/schema.hpp>

#include <json/json.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace accord::client {

/// Base class for every client-side failure
class client_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Outgoing data or a received response did not satisfy the contract
///
/// `field` is one of params, query, headers, body, `response[<status>]`
/// or `message[<type>]`.
class client_validation_error : public client_error {
public:
    client_validation_error(std::string field, contract::issues issues)
        : client_error("Validation failed for " + field)
        , field_(std::move(field))
        , issues_(std::move(issues)) {}

    const std::string& field() const noexcept { return field_; }
    const contract::issues& issues() const noexcept { return issues_; }

private:
    std::string field_;
    contract::issues issues_;
};

/// Non-2xx status the endpoint does not declare
class http_error : public client_error {
public:
    http_error(uint16_t status, std::string status_text, Json::Value body)
        : client_error("HTTP Error " + std::to_string(status) + ": " + status_text)
        , status_(status)
        , status_text_(std::move(status_text))
        , body_(std::move(body)) {}

    uint16_t status() const noexcept { return status_; }
    const std::string& status_text() const noexcept { return status_text_; }
    const Json::Value& body() const noexcept { return body_; }

private:
    uint16_t status_;
    std::string status_text_;
    Json::Value body_;
};

} // namespace accord::client
