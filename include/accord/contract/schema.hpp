#pragma once

#include <json/json.h>

#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace accord::contract {

/// One problem reported by a schema
struct issue {
    std::string code;                 ///< Machine-readable kind, e.g. "invalid_type"
    std::vector<std::string> path;    ///< Location inside the validated value
    std::string message;
};

using issues = std::vector<issue>;

inline Json::Value to_json(const issue& i) {
    Json::Value out(Json::objectValue);
    out["code"] = i.code;
    Json::Value path(Json::arrayValue);
    for (const auto& segment : i.path) {
        path.append(segment);
    }
    out["path"] = path;
    out["message"] = i.message;
    return out;
}

inline Json::Value to_json(const issues& list) {
    Json::Value out(Json::arrayValue);
    for (const auto& i : list) {
        out.append(to_json(i));
    }
    return out;
}

/// Inverse of to_json for issue arrays received over the wire
inline issues issues_from_json(const Json::Value& value) {
    issues out;
    if (!value.isArray()) {
        return out;
    }
    for (const auto& item : value) {
        issue i;
        i.code = item.get("code", "").asString();
        i.message = item.get("message", "").asString();
        for (const auto& segment : item["path"]) {
            i.path.push_back(segment.isString() ? segment.asString() : segment.toStyledString());
        }
        out.push_back(std::move(i));
    }
    return out;
}

/// Validation capability supplied by the application
///
/// parse() either returns the accepted (possibly coerced) value or the list
/// of issues explaining the rejection. Implementations must be stateless
/// with respect to the engine: the same schema object is shared by every
/// connection for the process lifetime.
class schema {
public:
    virtual ~schema() = default;

    [[nodiscard]] virtual std::expected<Json::Value, issues> parse(const Json::Value& input) const = 0;
};

using schema_ptr = std::shared_ptr<const schema>;

/// Adapter turning a callable into a schema
class function_schema final : public schema {
public:
    using parse_fn = std::function<std::expected<Json::Value, issues>(const Json::Value&)>;

    explicit function_schema(parse_fn fn) : fn_(std::move(fn)) {}

    std::expected<Json::Value, issues> parse(const Json::Value& input) const override {
        return fn_(input);
    }

private:
    parse_fn fn_;
};

template<typename F>
schema_ptr make_schema(F&& fn) {
    return std::make_shared<function_schema>(function_schema::parse_fn(std::forward<F>(fn)));
}

/// Run @p s over @p input; a null schema accepts the input unchanged
inline std::expected<Json::Value, issues> apply(const schema_ptr& s, const Json::Value& input) {
    if (!s) {
        return input;
    }
    return s->parse(input);
}

} // namespace accord::contract
