#pragma once

/// Chat room contract shared by chat_server and chat_client

#include <accord/contract/registry.hpp>
#include <accord/contract/schema.hpp>

#include <json/json.h>

#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace examples {

/// Object with the listed non-empty string members
inline accord::contract::schema_ptr strings(std::vector<std::string> fields) {
    using accord::contract::issues;
    return accord::contract::make_schema([fields](const Json::Value& input) -> std::expected<Json::Value, issues> {
        issues found;
        for (const auto& f : fields) {
            if (!input[f].isString() || input[f].asString().empty()) {
                found.push_back({"invalid_type", {f}, "Expected a non-empty string"});
            }
        }
        if (!found.empty()) {
            return std::unexpected(std::move(found));
        }
        return input;
    });
}

inline std::shared_ptr<const accord::contract::registry> chat_api() {
    using namespace accord::contract;
    static auto api = std::make_shared<const registry>(std::vector<endpoint_definition>{
        {
            .name = "chatRoom",
            .path = "/rooms/:room",
            .params = strings({"room"}),
            .query = strings({"nick"}),
            .payload = message_payload{
                .client_messages = {
                    {"say", strings({"text"})},
                    {"rename", strings({"nick"})},
                },
                .server_messages = {
                    {"said", strings({"from", "text"})},
                    {"joined", strings({"nick"})},
                    {"left", strings({"nick"})},
                    {"welcome", strings({"room", "nick"})},
                },
            },
        },
    });
    return api;
}

} // namespace examples
