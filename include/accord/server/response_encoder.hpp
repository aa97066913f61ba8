#pragma once

/// @file response_encoder.hpp
/// @brief Handler results and error bodies as HTTP responses

#include <accord/contract/endpoint.hpp>
#include <accord/contract/errors.hpp>
#include <accord/http/http_message.hpp>
#include <accord/json/codec.hpp>

#include <json/json.h>

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace accord::server {

/// What a standard handler returns
struct handler_response {
    uint16_t status = 200;
    Json::Value body;
    http::headers headers;
};

/// Validate @p result against responses[status] and serialise it
///
/// A status without a declared schema is passed through unvalidated. 204
/// never carries a body. The content type defaults to application/json; a
/// string body under an explicit text/* type is written verbatim.
inline std::expected<http::response, contract::response_contract_violation>
encode_response(const contract::standard_payload& endpoint, handler_response result) {
    Json::Value body = std::move(result.body);
    if (auto it = endpoint.responses.find(result.status); it != endpoint.responses.end() && it->second) {
        auto checked = it->second->parse(body);
        if (!checked) {
            return std::unexpected(contract::response_contract_violation(result.status, std::move(checked.error())));
        }
        body = std::move(*checked);
    }

    http::response resp(result.status);
    resp.get_headers().merge(result.headers);
    if (result.status == 204) {
        return resp;
    }

    if (!resp.get_headers().contains("Content-Type")) {
        resp.get_headers().set_content_type(http::mime::application_json);
    }
    auto type = resp.content_type();
    if (body.isString() && type.starts_with("text/")) {
        resp.set_body(body.asString());
    } else {
        resp.set_body(json::to_string(body));
    }
    return resp;
}

inline http::response json_response(uint16_t status, const Json::Value& body) {
    return http::response(status, json::to_string(body), http::mime::application_json);
}

inline http::response validation_error_response(const contract::request_validation_error& e) {
    Json::Value body(Json::objectValue);
    body["error"] = "Validation Error";
    body["field"] = e.field();
    body["issues"] = contract::to_json(e.issues());
    return json_response(400, body);
}

inline http::response not_found_response(const contract::route_not_found& e) {
    Json::Value body(Json::objectValue);
    body["error"] = "Not Found";
    body["message"] = e.what();
    return json_response(404, body);
}

inline http::response internal_error_response() {
    Json::Value body(Json::objectValue);
    body["error"] = "Internal Server Error";
    return json_response(500, body);
}

inline http::response upgrade_required_response(std::string_view message) {
    Json::Value body(Json::objectValue);
    body["error"] = "Upgrade Required";
    body["message"] = std::string(message);
    return json_response(426, body);
}

inline http::response bad_request_response(std::string_view message) {
    Json::Value body(Json::objectValue);
    body["error"] = "Bad Request";
    body["message"] = std::string(message);
    return json_response(400, body);
}

} // namespace accord::server
