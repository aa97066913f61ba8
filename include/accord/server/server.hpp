#pragma once

/// @file server.hpp
/// @brief Contract-driven server multiplexing four transports on one listener
///
/// Each accepted connection serves standard requests with keep-alive until a
/// request selects a long-lived transport. From then on the connection
/// belongs to that transport until it is closed.

#include <accord/contract/endpoint.hpp>
#include <accord/coro/cancel_token.hpp>
#include <accord/coro/task.hpp>
#include <accord/http/http_common.hpp>
#include <accord/http/http_message.hpp>
#include <accord/http/http_parser.hpp>
#include <accord/http/websocket_frame.hpp>
#include <accord/http/websocket_handshake.hpp>
#include <accord/log/macros.hpp>
#include <accord/net/tcp.hpp>
#include <accord/runtime/event_loop.hpp>
#include <accord/server/chunk_stream.hpp>
#include <accord/server/connection.hpp>
#include <accord/server/event_stream.hpp>
#include <accord/server/message_session.hpp>
#include <accord/server/request_validator.hpp>
#include <accord/server/response_encoder.hpp>
#include <accord/server/router.hpp>
#include <accord/server/sink.hpp>
#include <accord/server/topic_hub.hpp>
#include <accord/sync/primitives.hpp>
#include <accord/time/timer.hpp>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <expected>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace accord::server {

/// Server configuration
struct server_config {
    size_t max_request_size = 10 * 1024 * 1024;   ///< Max request head + body (10MB)
    size_t read_buffer_size = 8192;                ///< Read buffer size
    size_t max_message_size = 1024 * 1024;         ///< Max reassembled message frame (1MB)
    size_t write_high_water_mark = 64 * 1024;      ///< Queued bytes before send() suspends
    bool enable_logging = true;                    ///< Log one line per request
    std::chrono::milliseconds shutdown_grace{5000}; ///< Flush time for live streams after stop()
};

namespace detail {

template<typename... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

} // namespace detail

class server {
public:
    /// @throws contract::contract_error if an endpoint has no handler
    explicit server(router r, server_config config = {})
        : router_(std::move(r)), config_(config), hub_(std::make_shared<topic_hub>()) {
        router_.check_complete();
    }

    server(const server&) = delete;
    server& operator=(const server&) = delete;

    /// Bind the listener (port 0 picks an ephemeral port); returns errno on failure
    std::expected<void, int> bind(const net::ipv4_address& addr, const net::tcp_options& opts = {}) {
        auto listener = net::tcp_listener::bind(addr, opts);
        if (!listener) {
            ACCORD_LOG_ERROR("Failed to bind server to {}: {}", addr.to_string(), strerror(listener.error()));
            return std::unexpected(listener.error());
        }
        listener_.emplace(std::move(*listener));
        stop_ = coro::cancel_source{};
        return {};
    }

    /// Port the listener is bound to (0 before bind)
    uint16_t port() const noexcept {
        return listener_ ? listener_->local_address().port : 0;
    }

    /// Accept connections until stop(); completes once every connection is gone
    coro::task<void> serve() {
        if (!listener_) {
            throw std::logic_error("accord: server::serve() called before bind()");
        }
        auto& loop = runtime::event_loop::require();
        running_ = true;
        ACCORD_LOG_INFO("Server listening on {}", listener_->local_address().to_string());

        while (running_) {
            auto accepted = co_await listener_->accept(stop_.get_token());
            if (!accepted) {
                if (!running_ || accepted.error() == ECANCELED) {
                    break;
                }
                ACCORD_LOG_ERROR("Accept error: {}", strerror(accepted.error()));
                continue;
            }
            loop.go(handle_connection(std::move(*accepted)));
        }

        coro::cancel_source drained;
        auto watchdog = loop.spawn(abort_after_grace(drained.get_token()));
        while (active_ > 0) {
            co_await idle_.wait();
        }
        drained.cancel();
        co_await watchdog;
        live_.clear();
        listener_.reset();
        ACCORD_LOG_INFO("Server stopped");
    }

    /// bind() then serve()
    coro::task<void> listen(const net::ipv4_address& addr, const net::tcp_options& opts = {}) {
        if (!bind(addr, opts)) {
            co_return;
        }
        co_await serve();
    }

    /// Stop accepting and close every live connection. Frames already queued
    /// are flushed; a connection still open after shutdown_grace is aborted.
    void stop() {
        running_ = false;
        stop_.cancel();
        for (const auto& weak : live_) {
            if (auto conn = weak.lock()) {
                conn->abandon();
            }
        }
    }

    bool is_running() const noexcept { return running_; }
    size_t active_connections() const noexcept { return active_; }
    const std::shared_ptr<topic_hub>& hub() const noexcept { return hub_; }
    const router& get_router() const noexcept { return router_; }

private:
    struct active_guard {
        server* self;
        ~active_guard() {
            if (--self->active_ == 0) {
                self->idle_.notify_all();
            }
        }
    };

    coro::task<void> handle_connection(net::tcp_stream stream) {
        ++active_;
        active_guard guard{this};
        std::string peer = stream.peer_address();
        ACCORD_LOG_DEBUG("Connection from {}", peer);

        std::vector<char> buffer(config_.read_buffer_size);
        std::string pending;

        while (running_ && stream.is_valid()) {
            http::request_parser parser(config_.max_request_size);
            if (!pending.empty()) {
                parser.parse(pending);
                pending.clear();
            }
            while (!parser.is_complete() && !parser.has_error()) {
                auto result = co_await stream.read(buffer.data(), buffer.size(), stop_.get_token());
                if (result.result <= 0) {
                    co_return;
                }
                parser.parse(std::string_view(buffer.data(), static_cast<size_t>(result.result)));
            }

            if (parser.has_error()) {
                bool too_large = parser.error_message() == "Request exceeds maximum size";
                auto resp = too_large ? json_response(413, json::object({{"error", "Payload Too Large"}}))
                                      : bad_request_response(parser.error_message());
                resp.set_header("Connection", "close");
                auto sent = co_await stream.write_all(resp.serialize());
                if (!sent.ok()) {
                    ACCORD_LOG_DEBUG("Failed to send error response to {}: {}", peer, strerror(sent.error()));
                }
                co_return;
            }

            pending = parser.take_remaining();
            auto req = parser.take_request();
            bool keep_alive = co_await dispatch(stream, req, pending, peer);
            if (!keep_alive) {
                co_return;
            }
        }
    }

    /// Route one request; returns whether the connection stays in HTTP mode
    coro::task<bool> dispatch(net::tcp_stream& stream, const http::request& req,
                              std::string& leftover, const std::string& peer) {
        auto route = router_.resolve(req.get_method(), req.path());
        if (!route) {
            co_return co_await respond(stream, req, not_found_response(route.error()), peer);
        }
        if (!route->handler) {
            ACCORD_LOG_ERROR("No handler bound for endpoint '{}'", route->endpoint->name);
            co_return co_await respond(stream, req, internal_error_response(), peer);
        }

        Json::Value context;
        bool context_failed = false;
        try {
            context = router_.make_context(req, *route->endpoint);
        } catch (const std::exception& e) {
            ACCORD_LOG_ERROR("Context factory failed for '{}': {}", route->endpoint->name, e.what());
            context_failed = true;
        }
        if (context_failed) {
            co_return co_await respond(stream, req, internal_error_response(), peer);
        }

        auto work = std::visit(detail::overloaded{
            [&](const contract::standard_payload&) {
                return serve_standard(stream, req, *route, std::move(context), peer);
            },
            [&](const contract::event_stream_payload&) {
                return serve_event_stream(stream, req, *route, std::move(context), peer);
            },
            [&](const contract::chunk_stream_payload& payload) {
                return serve_chunk_stream(stream, req, *route, payload.framing, std::move(context), peer);
            },
            [&](const contract::message_payload&) {
                return serve_message(stream, req, *route, std::move(context), std::move(leftover), peer);
            },
        }, route->endpoint->payload);
        co_return co_await std::move(work);
    }

    coro::task<bool> respond(net::tcp_stream& stream, const http::request& req,
                             http::response resp, const std::string& peer) {
        bool keep_alive = running_ && !http::contains_token(req.header("Connection"), "close");
        if (!keep_alive) {
            resp.set_header("Connection", "close");
        }
        log_access(req, resp.status_code(), peer);
        auto result = co_await stream.write_all(resp.serialize());
        co_return keep_alive && result.ok();
    }

    coro::task<bool> serve_standard(net::tcp_stream& stream, const http::request& req,
                                    router::resolved_route& route, Json::Value context,
                                    const std::string& peer) {
        const auto& handler = std::get<standard_handler>(*route.handler);
        auto resp = co_await dispatch_standard(*route.endpoint, handler, req, route.params, std::move(context));
        co_return co_await respond(stream, req, std::move(resp), peer);
    }

    coro::task<bool> serve_event_stream(net::tcp_stream& stream, const http::request& req,
                                        router::resolved_route& route, Json::Value context,
                                        const std::string& peer) {
        auto input = validate_request(*route.endpoint, req, route.params);
        if (!input) {
            co_await respond(stream, req, validation_error_response(input.error()), peer);
            co_return false;
        }

        log_access(req, 200, peer);
        auto head = co_await stream.write_all(event_stream_head().serialize_head());
        if (!head.ok()) {
            co_return false;
        }

        auto [conn, out] = open_connection(std::move(stream));
        runtime::event_loop::require().go(watch_disconnect(conn, out));
        co_await run_event_stream(conn, std::get<event_stream_handler>(*route.handler),
                                  route.endpoint->name, std::move(*input), std::move(context));
        co_return false;
    }

    coro::task<bool> serve_chunk_stream(net::tcp_stream& stream, const http::request& req,
                                        router::resolved_route& route, contract::chunk_framing framing,
                                        Json::Value context, const std::string& peer) {
        auto input = validate_request(*route.endpoint, req, route.params, body_schema_of(*route.endpoint));
        if (!input) {
            co_await respond(stream, req, validation_error_response(input.error()), peer);
            co_return false;
        }

        log_access(req, 200, peer);
        auto head = co_await stream.write_all(chunk_stream_head(framing).serialize_head());
        if (!head.ok()) {
            co_return false;
        }

        auto [conn, out] = open_connection(std::move(stream));
        runtime::event_loop::require().go(watch_disconnect(conn, out));
        co_await run_chunk_stream(conn, std::get<chunk_stream_handler>(*route.handler), framing,
                                  route.endpoint->name, std::move(*input), std::move(context));
        co_return false;
    }

    coro::task<bool> serve_message(net::tcp_stream& stream, const http::request& req,
                                   router::resolved_route& route, Json::Value context,
                                   std::string leftover, const std::string& peer) {
        const auto& binding = std::get<message_binding>(*route.handler);
        if (!http::websocket::is_upgrade_request(req)) {
            co_return co_await respond(stream, req,
                upgrade_required_response("Endpoint '" + route.endpoint->name + "' requires a WebSocket upgrade"),
                peer);
        }

        auto upgrade = prepare_upgrade(*route.endpoint, req, route.params, std::move(context), binding.options);
        if (!upgrade) {
            ACCORD_LOG_WARNING("Upgrade rejected for '{}': {}", route.endpoint->name, upgrade.error().what());
            co_await respond(stream, req, validation_error_response(upgrade.error()), peer);
            co_return false;
        }
        if (auto valid = http::websocket::check_upgrade_request(req); !valid) {
            co_await respond(stream, req, bad_request_response(valid.error()), peer);
            co_return false;
        }

        log_access(req, 101, peer);
        auto accept = http::websocket::build_upgrade_response(req.header("Sec-WebSocket-Key"));
        auto head = co_await stream.write_all(accept.serialize());
        if (!head.ok()) {
            co_return false;
        }

        auto [conn, out] = open_connection(std::move(stream));
        message_session session(conn, hub_, binding.handlers, std::move(*upgrade));
        co_await run_session(conn, out, session, std::move(leftover));
        co_return false;
    }

    /// Frame loop of one upgraded connection
    coro::task<void> run_session(std::shared_ptr<connection> conn, tcp_sink* out,
                                 message_session& session, std::string pending) {
        namespace ws = http::websocket;
        ws::frame_parser parser(true, config_.max_message_size);
        std::vector<char> buffer(config_.read_buffer_size);

        co_await session.start();
        while (conn->is_open()) {
            if (!pending.empty()) {
                parser.feed(pending);
                pending.clear();
            }
            while (conn->is_open()) {
                auto frame = parser.next();
                if (!frame) {
                    break;
                }
                switch (frame->op) {
                    case ws::opcode::text:
                    case ws::opcode::binary:
                        co_await session.receive(frame->payload);
                        break;
                    case ws::opcode::ping:
                        conn->post(ws::encode_pong_frame(frame->payload));
                        break;
                    case ws::opcode::close: {
                        auto [code, reason] = ws::parse_close_payload(frame->payload);
                        session.peer_closed(static_cast<uint16_t>(code), std::move(reason));
                        break;
                    }
                    default:
                        break;
                }
            }
            if (parser.has_error()) {
                ACCORD_LOG_WARNING("Closing '{}' after frame error: {}",
                                   session.socket().endpoint_name(), parser.error());
                session.socket().close(static_cast<uint16_t>(parser.error_code()), parser.error());
                break;
            }
            if (!conn->is_open()) {
                break;
            }

            auto result = co_await out->stream().read(buffer.data(), buffer.size(), conn->token());
            if (result.result <= 0) {
                if (result.result != -ECANCELED) {
                    conn->abort();
                }
                break;
            }
            pending.assign(buffer.data(), static_cast<size_t>(result.result));
        }

        session.finish();
        co_await conn->wait_closed();
    }

    coro::task<void> abort_after_grace(coro::cancel_token drained) {
        if (co_await time::sleep_for(config_.shutdown_grace, drained) == coro::cancel_result::cancelled) {
            co_return;
        }
        for (const auto& weak : live_) {
            if (auto conn = weak.lock()) {
                ACCORD_LOG_CONN_WARNING(conn->id(), "still flushing after shutdown grace, aborting");
                conn->abort();
            }
        }
    }

    /// Watch the read side of a push-only stream for the peer going away
    static coro::task<void> watch_disconnect(std::shared_ptr<connection> conn, tcp_sink* out) {
        std::array<char, 512> scratch;
        for (;;) {
            auto result = co_await out->stream().read(scratch.data(), scratch.size(), conn->token());
            if (result.result > 0) {
                continue;
            }
            if (result.result != -ECANCELED) {
                ACCORD_LOG_CONN_DEBUG(conn->id(), "peer went away");
                conn->abort();
            }
            co_return;
        }
    }

    std::pair<std::shared_ptr<connection>, tcp_sink*> open_connection(net::tcp_stream stream) {
        auto out = std::make_unique<tcp_sink>(std::move(stream));
        auto* raw = out.get();
        auto conn = std::make_shared<connection>(std::move(out), config_.write_high_water_mark);
        std::erase_if(live_, [](const std::weak_ptr<connection>& w) { return w.expired(); });
        live_.push_back(conn);
        if (!running_) {
            // Upgraded while stop() was in progress
            conn->abandon();
        }
        return {std::move(conn), raw};
    }

    void log_access(const http::request& req, uint16_t status, const std::string& peer) const {
        if (config_.enable_logging) {
            ACCORD_LOG_INFO("{} {} {} -> {}", peer, http::method_to_string(req.get_method()),
                            req.target(), status);
        }
    }

    router router_;
    server_config config_;
    std::shared_ptr<topic_hub> hub_;
    std::optional<net::tcp_listener> listener_;
    coro::cancel_source stop_;
    std::vector<std::weak_ptr<connection>> live_;
    size_t active_ = 0;
    sync::condition_variable idle_;
    bool running_ = false;
};

} // namespace accord::server
