#pragma once

/// @file content.hpp
/// @brief Query strings and request bodies as JSON values

#include <accord/http/http_common.hpp>

#include <json/json.h>

#include <optional>
#include <string>
#include <string_view>

namespace accord::http {

/// Decoded query object; a repeated key turns its value into an array
inline Json::Value parse_query(std::string_view query) {
    Json::Value out(Json::objectValue);
    for (auto& [key, value] : parse_query_string(query)) {
        if (!out.isMember(key)) {
            out[key] = value;
            continue;
        }
        Json::Value& slot = out[key];
        if (!slot.isArray()) {
            Json::Value first = slot;
            slot = Json::Value(Json::arrayValue);
            slot.append(first);
        }
        slot.append(value);
    }
    return out;
}

/// Text form of a scalar for query strings and path segments
inline std::string value_text(const Json::Value& v) {
    if (v.isString()) return v.asString();
    if (v.isBool()) return v.asBool() ? "true" : "false";
    if (v.isIntegral()) return v.isUInt64() ? std::to_string(v.asUInt64()) : std::to_string(v.asInt64());
    if (v.isNull()) return "";
    Json::StreamWriterBuilder b;
    b["indentation"] = "";
    return Json::writeString(b, v);
}

/// Encode a JSON object as a query string; arrays become repeated keys
inline std::string build_query(const Json::Value& query) {
    query_pairs pairs;
    if (!query.isObject()) {
        return {};
    }
    for (const auto& key : query.getMemberNames()) {
        const auto& value = query[key];
        if (value.isNull()) {
            continue;
        }
        if (value.isArray()) {
            for (const auto& item : value) {
                pairs.emplace_back(key, value_text(item));
            }
        } else {
            pairs.emplace_back(key, value_text(value));
        }
    }
    return build_query_string(pairs);
}

/// application/x-www-form-urlencoded body
inline Json::Value decode_form(std::string_view body) {
    return parse_query(body);
}

/// Parameter of a header value such as `multipart/form-data; boundary=xyz`
inline std::optional<std::string> header_parameter(std::string_view value, std::string_view name) {
    auto lower = to_lower(value);
    auto key = to_lower(name) + "=";
    size_t pos = 0;
    while ((pos = lower.find(key, pos)) != std::string::npos) {
        if (pos == 0 || lower[pos - 1] == ';' || lower[pos - 1] == ' ') {
            auto start = pos + key.size();
            auto end = value.find(';', start);
            auto raw = value.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
            while (!raw.empty() && raw.back() == ' ') raw.remove_suffix(1);
            if (raw.size() >= 2 && raw.front() == '"' && raw.back() == '"') {
                raw = raw.substr(1, raw.size() - 2);
            }
            return std::string(raw);
        }
        pos += key.size();
    }
    return std::nullopt;
}

/// multipart/form-data body as a field -> text object
///
/// File parts contribute their content as text. Returns nullopt when the
/// content type carries no boundary or the body is not delimited by it.
inline std::optional<Json::Value> decode_multipart(std::string_view body, std::string_view content_type) {
    auto boundary = header_parameter(content_type, "boundary");
    if (!boundary || boundary->empty()) {
        return std::nullopt;
    }
    const std::string delimiter = "--" + *boundary;

    Json::Value out(Json::objectValue);
    size_t pos = body.find(delimiter);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    for (;;) {
        pos += delimiter.size();
        if (body.substr(pos, 2) == "--") {
            break;
        }
        if (body.substr(pos, 2) == "\r\n") {
            pos += 2;
        }
        auto head_end = body.find("\r\n\r\n", pos);
        auto next = body.find(delimiter, pos);
        if (head_end == std::string_view::npos || next == std::string_view::npos || head_end > next) {
            return std::nullopt;
        }

        std::optional<std::string> name;
        auto head = body.substr(pos, head_end - pos);
        while (!head.empty()) {
            auto eol = head.find("\r\n");
            auto line = head.substr(0, eol);
            auto colon = line.find(':');
            if (colon != std::string_view::npos &&
                to_lower(line.substr(0, colon)) == "content-disposition") {
                name = header_parameter(line.substr(colon + 1), "name");
            }
            if (eol == std::string_view::npos) break;
            head.remove_prefix(eol + 2);
        }

        auto content_start = head_end + 4;
        auto content_end = next;
        if (content_end >= content_start + 2 && body.substr(content_end - 2, 2) == "\r\n") {
            content_end -= 2;
        }
        if (name) {
            out[*name] = std::string(body.substr(content_start, content_end - content_start));
        }
        pos = next;
    }
    return out;
}

} // namespace accord::http
