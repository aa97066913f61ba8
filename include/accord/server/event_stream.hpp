#pragma once

/// @file event_stream.hpp
/// @brief Server-push event transport (text/event-stream)
///
/// Each event is written as `event: <name>\ndata: <json>\n\n`. There is no
/// terminal frame: the stream ends when the connection closes, which happens
/// on client disconnect or when the handler coroutine returns. A handler
/// that pushes from timers keeps itself alive by awaiting its signal:
/// ```cpp
/// [](server::event_stream_context& ctx) -> coro::task<server::cleanup_action> {
///     co_await ctx.emitter.send("status", json::object({{"ready", true}}));
///     co_await ctx.signal.cancelled();
///     co_return [] { release_watchers(); };
/// }
/// ```

#include <accord/coro/cancel_token.hpp>
#include <accord/coro/task.hpp>
#include <accord/http/http_common.hpp>
#include <accord/http/http_message.hpp>
#include <accord/json/codec.hpp>
#include <accord/log/macros.hpp>
#include <accord/server/connection.hpp>
#include <accord/server/request_validator.hpp>

#include <json/json.h>

#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace accord::server {

/// Release action a long-lived handler may hand back to the engine
using cleanup_action = std::function<void()>;

/// Wire text of one event
inline std::string format_event(std::string_view name, const Json::Value& data) {
    std::string out;
    out.reserve(name.size() + 32);
    out += "event: ";
    out += name;
    out += "\ndata: ";
    out += json::to_string(data);
    out += "\n\n";
    return out;
}

/// Response head opening an event stream
inline http::response event_stream_head() {
    http::response resp(200);
    resp.set_header("Content-Type", http::mime::text_event_stream);
    resp.set_header("Cache-Control", "no-cache");
    resp.set_header("Connection", "close");
    return resp;
}

/// Capability for pushing named events
class event_emitter {
public:
    explicit event_emitter(std::shared_ptr<connection> conn) : conn_(std::move(conn)) {}

    /// Queue an event. A no-op once the stream left the open state; the
    /// task completes when the outbox is back under its high-water mark.
    coro::task<bool> send(std::string_view event, const Json::Value& data) {
        return conn_->write(format_event(event, data));
    }

    bool is_open() const noexcept { return conn_->is_open(); }

private:
    std::shared_ptr<connection> conn_;
};

/// Everything an event-stream handler is invoked with
struct event_stream_context {
    std::string endpoint_name;
    Json::Value params;
    Json::Value query;
    Json::Value headers;
    Json::Value context;
    event_emitter emitter;
    coro::cancel_token signal;
};

using event_stream_handler = std::function<coro::task<cleanup_action>(event_stream_context&)>;

/// Drive one event stream until the connection is closed
///
/// An exception escaping the handler abandons the stream: events already
/// sent are still flushed, then the connection closes, which fires the
/// signal and runs every release action.
inline coro::task<void> run_event_stream(std::shared_ptr<connection> conn,
                                         const event_stream_handler& handler,
                                         std::string endpoint_name,
                                         validated_request input,
                                         Json::Value context) {
    conn->open();
    event_stream_context ctx{
        std::move(endpoint_name),
        std::move(input.params),
        std::move(input.query),
        std::move(input.headers),
        std::move(context),
        event_emitter(conn),
        conn->token(),
    };

    bool failed = false;
    try {
        if (auto cleanup = co_await handler(ctx)) {
            conn->on_release(std::move(cleanup));
        }
    } catch (const std::exception& e) {
        ACCORD_LOG_ERROR("Event stream handler '{}' failed: {}", ctx.endpoint_name, e.what());
        failed = true;
    } catch (...) {
        ACCORD_LOG_ERROR("Event stream handler '{}' failed with a non-standard exception", ctx.endpoint_name);
        failed = true;
    }

    if (failed) {
        conn->abandon();
    } else {
        conn->close();
    }
    co_await conn->wait_closed();
}

} // namespace accord::server
