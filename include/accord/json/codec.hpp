#pragma once

#include <json/json.h>

#include <expected>
#include <initializer_list>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace accord::json {

/// Single-line JSON text (no indentation, UTF-8 passed through)
///
/// Every wire format of the engine (NDJSON lines, SSE data fields, message
/// envelopes) relies on the output containing no raw newline.
inline std::string to_string(const Json::Value& value) {
    static const auto writer = [] {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "";
        builder["emitUTF8"] = true;
        return std::unique_ptr<Json::StreamWriter>(builder.newStreamWriter());
    }();
    std::ostringstream out;
    writer->write(value, &out);
    return out.str();
}

/// Parse strict JSON text; the error string comes from the parser
inline std::expected<Json::Value, std::string> parse(std::string_view text) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["failIfExtra"] = true;
    builder["rejectDupKeys"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value value;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &value, &errors)) {
        return std::unexpected(errors.empty() ? std::string("invalid JSON") : errors);
    }
    return value;
}

/// Build an object from key/value pairs: object({{"id", 1}, {"name", "x"}})
inline Json::Value object(std::initializer_list<std::pair<const char*, Json::Value>> members) {
    Json::Value out(Json::objectValue);
    for (const auto& [key, value] : members) {
        out[key] = value;
    }
    return out;
}

/// Build an array from values
inline Json::Value array(std::initializer_list<Json::Value> items) {
    Json::Value out(Json::arrayValue);
    for (const auto& item : items) {
        out.append(item);
    }
    return out;
}

} // namespace accord::json
