#pragma once

/// @file request_validator.hpp
/// @brief Request-shape validation ahead of any handler
///
/// Fields are checked in a fixed order (params, query, headers, body) and the
/// first failure wins. A field without a schema passes its raw value through.

#include <accord/contract/endpoint.hpp>
#include <accord/contract/errors.hpp>
#include <accord/contract/path_matcher.hpp>
#include <accord/http/content.hpp>
#include <accord/http/http_message.hpp>
#include <accord/json/codec.hpp>

#include <json/json.h>

#include <expected>
#include <optional>
#include <string>
#include <utility>

namespace accord::server {

/// Validated request bundle handed to handlers
struct validated_request {
    Json::Value params{Json::objectValue};
    Json::Value query{Json::objectValue};
    Json::Value headers{Json::objectValue};
    Json::Value body;            ///< null unless the endpoint declares a body
};

using validation_result = std::expected<validated_request, contract::request_validation_error>;

inline Json::Value params_to_json(const contract::path_params& params) {
    Json::Value out(Json::objectValue);
    for (const auto& [name, value] : params) {
        out[name] = value;
    }
    return out;
}

/// Header names are lowercased; repeated headers were already comma-joined
inline Json::Value headers_to_json(const http::headers& hdrs) {
    Json::Value out(Json::objectValue);
    for (const auto& [name, value] : hdrs) {
        out[http::to_lower(name)] = value;
    }
    return out;
}

/// Decode a request body according to its content type
///
/// JSON is parsed, form and multipart bodies become objects of fields and
/// anything else reaches the schema as text.
inline std::expected<Json::Value, contract::issues> decode_body(const http::request& req) {
    auto type = req.content_type();
    if (http::contains_token(type, http::mime::application_json)) {
        auto parsed = json::parse(req.body());
        if (!parsed) {
            return std::unexpected(contract::issues{
                {"invalid_json", {}, "Malformed JSON body: " + parsed.error()}});
        }
        return std::move(*parsed);
    }
    if (http::contains_token(type, http::mime::application_form_urlencoded)) {
        return http::decode_form(req.body());
    }
    if (http::contains_token(type, http::mime::multipart_form_data)) {
        auto fields = http::decode_multipart(req.body(), type);
        if (!fields) {
            return std::unexpected(contract::issues{
                {"invalid_multipart", {}, "Malformed multipart body"}});
        }
        return std::move(*fields);
    }
    return Json::Value(std::string(req.body()));
}

namespace detail {

inline bool check_field(const char* field, const contract::schema_ptr& schema,
                        Json::Value raw, Json::Value& out,
                        std::optional<contract::request_validation_error>& failure) {
    auto result = contract::apply(schema, raw);
    if (!result) {
        failure.emplace(field, std::move(result.error()));
        return false;
    }
    out = std::move(*result);
    return true;
}

} // namespace detail

/// Validate params, query and headers, then the body when @p body_schema is set
inline validation_result validate_request(const contract::endpoint_definition& endpoint,
                                          const http::request& req,
                                          const contract::path_params& params,
                                          const contract::schema_ptr& body_schema = nullptr) {
    validated_request out;
    std::optional<contract::request_validation_error> failure;

    if (!detail::check_field("params", endpoint.params, params_to_json(params), out.params, failure) ||
        !detail::check_field("query", endpoint.query, http::parse_query(req.query()), out.query, failure) ||
        !detail::check_field("headers", endpoint.headers, headers_to_json(req.get_headers()), out.headers, failure)) {
        return std::unexpected(std::move(*failure));
    }

    if (body_schema) {
        auto decoded = decode_body(req);
        if (!decoded) {
            return std::unexpected(contract::request_validation_error("body", std::move(decoded.error())));
        }
        if (!detail::check_field("body", body_schema, std::move(*decoded), out.body, failure)) {
            return std::unexpected(std::move(*failure));
        }
    }
    return out;
}

/// Body schema declared by the endpoint's transport, if any
inline contract::schema_ptr body_schema_of(const contract::endpoint_definition& endpoint) {
    if (auto* standard = endpoint.get_if<contract::standard_payload>()) {
        return standard->body;
    }
    if (auto* chunked = endpoint.get_if<contract::chunk_stream_payload>()) {
        return chunked->body;
    }
    return nullptr;
}

} // namespace accord::server
