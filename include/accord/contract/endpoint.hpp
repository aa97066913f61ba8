#pragma once

/// @file endpoint.hpp
/// @brief Declarative endpoint definitions
///
/// An endpoint names a route and the schemas that guard it. The transport is
/// chosen by the payload alternative, so every dispatch site can visit it
/// exhaustively:
/// ```cpp
/// contract::endpoint_definition get_user{
///     .name = "getUser",
///     .method = http::method::GET,
///     .path = "/users/:id",
///     .params = id_schema,
///     .payload = contract::standard_payload{.responses = {{200, user_schema}}},
/// };
/// ```

#include <accord/contract/schema.hpp>
#include <accord/http/http_common.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>

namespace accord::contract {

enum class transport_kind {
    standard,
    event_stream,
    chunk_stream,
    message
};

inline constexpr std::string_view to_string(transport_kind kind) noexcept {
    switch (kind) {
        case transport_kind::standard:     return "standard";
        case transport_kind::event_stream: return "event-stream";
        case transport_kind::chunk_stream: return "chunk-stream";
        case transport_kind::message:      return "message";
    }
    return "unknown";
}

/// Wire format of chunk-stream frames
enum class chunk_framing {
    sentinel,   ///< Chunks verbatim; terminal frame {"__final__":true,"data":...}
    envelope    ///< {"kind":"chunk","value":...} / {"kind":"final","value":...}
};

/// Request/response endpoint
struct standard_payload {
    schema_ptr body;
    std::map<uint16_t, schema_ptr> responses;   ///< status -> body schema
};

/// Server-push event endpoint; event schemas are declarative only
struct event_stream_payload {
    std::map<std::string, schema_ptr> events;
};

/// Chunked incremental stream; chunk schema is declarative only
struct chunk_stream_payload {
    schema_ptr body;
    schema_ptr chunk;
    schema_ptr final_response;
    chunk_framing framing = chunk_framing::sentinel;
};

/// Bidirectional envelope endpoint, keyed by envelope type
struct message_payload {
    std::map<std::string, schema_ptr> client_messages;
    std::map<std::string, schema_ptr> server_messages;
};

using endpoint_payload = std::variant<standard_payload, event_stream_payload,
                                      chunk_stream_payload, message_payload>;

struct endpoint_definition {
    std::string name;
    http::method method = http::method::GET;
    std::string path;
    schema_ptr params;
    schema_ptr query;
    schema_ptr headers;
    endpoint_payload payload;

    transport_kind kind() const noexcept {
        return static_cast<transport_kind>(payload.index());
    }

    template<typename Payload>
    const Payload* get_if() const noexcept {
        return std::get_if<Payload>(&payload);
    }
};

} // namespace accord::contract
