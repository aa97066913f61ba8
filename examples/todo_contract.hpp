#pragma once

/// Todo contract shared by crud_server and crud_client

#include <accord/contract/registry.hpp>
#include <accord/contract/schema.hpp>

#include <json/json.h>

#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace examples {

using accord::contract::issues;
using accord::contract::make_schema;
using accord::contract::schema_ptr;

/// {"id": "<digits>"} -> {"id": <integer>}
inline schema_ptr id_params() {
    return make_schema([](const Json::Value& input) -> std::expected<Json::Value, issues> {
        const auto& id = input["id"];
        if (!id.isString() || id.asString().empty() ||
            id.asString().find_first_not_of("0123456789") != std::string::npos) {
            return std::unexpected(issues{{"invalid_type", {"id"}, "Expected a numeric id"}});
        }
        Json::Value out = input;
        out["id"] = static_cast<Json::Int64>(std::stoll(id.asString()));
        return out;
    });
}

/// Optional done=true|false filter
inline schema_ptr list_query() {
    return make_schema([](const Json::Value& input) -> std::expected<Json::Value, issues> {
        Json::Value out(Json::objectValue);
        if (input.isMember("done")) {
            auto text = input["done"].asString();
            if (text != "true" && text != "false") {
                return std::unexpected(issues{{"invalid_enum_value", {"done"}, "Expected true or false"}});
            }
            out["done"] = text == "true";
        }
        return out;
    });
}

inline schema_ptr new_todo() {
    return make_schema([](const Json::Value& input) -> std::expected<Json::Value, issues> {
        if (!input.isObject() || !input["title"].isString()) {
            return std::unexpected(issues{{"invalid_type", {"title"}, "Required"}});
        }
        if (input["title"].asString().empty()) {
            return std::unexpected(issues{{"too_small", {"title"}, "Title must not be empty"}});
        }
        return input;
    });
}

inline schema_ptr todo() {
    return make_schema([](const Json::Value& input) -> std::expected<Json::Value, issues> {
        issues found;
        if (!input["id"].isIntegral()) {
            found.push_back({"invalid_type", {"id"}, "Expected integer"});
        }
        if (!input["title"].isString()) {
            found.push_back({"invalid_type", {"title"}, "Expected string"});
        }
        if (!input["done"].isBool()) {
            found.push_back({"invalid_type", {"done"}, "Expected boolean"});
        }
        if (!found.empty()) {
            return std::unexpected(std::move(found));
        }
        return input;
    });
}

inline schema_ptr error_body() {
    return make_schema([](const Json::Value& input) -> std::expected<Json::Value, issues> {
        if (!input["error"].isString()) {
            return std::unexpected(issues{{"invalid_type", {"error"}, "Expected string"}});
        }
        return input;
    });
}

inline std::shared_ptr<const accord::contract::registry> todo_api() {
    using namespace accord::contract;
    using accord::http::method;
    static auto api = std::make_shared<const registry>(std::vector<endpoint_definition>{
        {
            .name = "listTodos",
            .path = "/todos",
            .query = list_query(),
            .payload = standard_payload{},
        },
        {
            .name = "createTodo",
            .method = method::POST,
            .path = "/todos",
            .payload = standard_payload{.body = new_todo(), .responses = {{201, todo()}}},
        },
        {
            .name = "getTodo",
            .path = "/todos/:id",
            .params = id_params(),
            .payload = standard_payload{.responses = {{200, todo()}, {404, error_body()}}},
        },
        {
            .name = "completeTodo",
            .method = method::PUT,
            .path = "/todos/:id/done",
            .params = id_params(),
            .payload = standard_payload{.responses = {{200, todo()}, {404, error_body()}}},
        },
        {
            .name = "deleteTodo",
            .method = method::DELETE_,
            .path = "/todos/:id",
            .params = id_params(),
            .payload = standard_payload{},
        },
    });
    return api;
}

} // namespace examples
