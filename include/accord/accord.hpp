#pragma once

/// Accord Contract-Driven RPC Library - Main Header
///
/// Version: 0.1.0
///
/// This header provides convenient access to all Accord components.
/// Include this file to define contracts, serve them and call them.

// Version information
#define ACCORD_VERSION_MAJOR 0
#define ACCORD_VERSION_MINOR 1
#define ACCORD_VERSION_PATCH 0

#include <tuple>

// Core coroutine types
#include "coro/task.hpp"
#include "coro/cancel_token.hpp"

// Event loop
#include "runtime/event_loop.hpp"

// Networking
#include "net/tcp.hpp"

// Timers
#include "time/timer.hpp"

// Synchronization primitives
#include "sync/primitives.hpp"

// Logging
#include "log/logger.hpp"
#include "log/macros.hpp"

// HTTP and WebSocket wire formats
#include "http/http_common.hpp"
#include "http/http_message.hpp"
#include "http/http_parser.hpp"
#include "http/content.hpp"
#include "http/websocket_frame.hpp"
#include "http/websocket_handshake.hpp"

// JSON values
#include "json/codec.hpp"

// Contracts
#include "contract/schema.hpp"
#include "contract/errors.hpp"
#include "contract/path_matcher.hpp"
#include "contract/endpoint.hpp"
#include "contract/registry.hpp"

// Server
#include "server/router.hpp"
#include "server/server.hpp"

// Clients
#include "client/errors.hpp"
#include "client/http_client.hpp"
#include "client/message_client.hpp"

/// Root namespace for the Accord library
namespace accord {

/// Get library version string
inline const char* version() noexcept {
    return "0.1.0";
}

/// Get library version as tuple
inline constexpr auto version_tuple() noexcept {
    return std::make_tuple(ACCORD_VERSION_MAJOR, ACCORD_VERSION_MINOR, ACCORD_VERSION_PATCH);
}

} // namespace accord

/// Quick Start Example:
///
/// ```cpp
/// #include <accord/accord.hpp>
///
/// using namespace accord;
///
/// auto api = std::make_shared<const contract::registry>(std::vector<contract::endpoint_definition>{
///     {.name = "hello", .path = "/hello/:name", .payload = contract::standard_payload{}},
/// });
///
/// int main() {
///     server::router r(api);
///     r.on_request("hello", [](server::request_context& ctx) -> coro::task<server::handler_response> {
///         co_return server::handler_response{200, json::object({{"hello", ctx.params["name"]}})};
///     });
///
///     server::server srv(std::move(r));
///     runtime::event_loop loop;
///     loop.block_on(srv.listen(net::ipv4_address("0.0.0.0", 8080)));
/// }
/// ```
