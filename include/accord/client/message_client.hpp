#pragma once

/// @file message_client.hpp
/// @brief Typed client for message endpoints
///
/// Usage:
/// ```cpp
/// auto chat = client::message_client::create(contract, "chat", {.base_url = "http://127.0.0.1:8080"});
/// chat->on("message", [](const Json::Value& payload) { print(payload); });
/// co_await chat->connect();
/// chat->send("say", json::object({{"text", "hello"}}));
/// ```
/// Outbound envelopes are validated against clientMessages, inbound ones
/// against serverMessages. Handlers run on the event loop that connected.

#include <accord/client/errors.hpp>
#include <accord/contract/endpoint.hpp>
#include <accord/contract/path_matcher.hpp>
#include <accord/contract/registry.hpp>
#include <accord/contract/schema.hpp>
#include <accord/coro/task.hpp>
#include <accord/http/content.hpp>
#include <accord/http/http_common.hpp>
#include <accord/http/http_parser.hpp>
#include <accord/http/websocket_frame.hpp>
#include <accord/http/websocket_handshake.hpp>
#include <accord/json/codec.hpp>
#include <accord/log/macros.hpp>
#include <accord/net/tcp.hpp>
#include <accord/runtime/event_loop.hpp>
#include <accord/server/connection.hpp>
#include <accord/server/message_session.hpp>
#include <accord/server/sink.hpp>

#include <json/json.h>

#include <cerrno>
#include <cstring>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace accord::client {

/// Map an HTTP base URL onto the WebSocket scheme (http -> ws, https -> wss)
inline std::string resolve_websocket_url(std::string_view address) {
    if (address.starts_with("ws://") || address.starts_with("wss://")) {
        return std::string(address);
    }
    if (address.starts_with("https://")) {
        return "wss://" + std::string(address.substr(8));
    }
    if (address.starts_with("http://")) {
        return "ws://" + std::string(address.substr(7));
    }
    return "ws://" + std::string(address);
}

struct message_client_config {
    std::string base_url;                          ///< Server root, http:// or ws://
    Json::Value params;                            ///< Path parameters of the endpoint
    Json::Value query;                             ///< Handshake query
    http::headers headers;                         ///< Extra handshake headers
    bool validate = true;                          ///< Validate envelopes in both directions
    size_t max_message_size = 16 * 1024 * 1024;    ///< Max inbound message (16MB)
    size_t read_buffer_size = 8192;                ///< Read buffer size
};

class message_client : public std::enable_shared_from_this<message_client> {
public:
    using message_callback = std::function<void(const server::envelope&)>;
    using payload_callback = std::function<void(const Json::Value& payload)>;
    using state_callback = std::function<void(bool connected)>;
    using error_callback = std::function<void(const std::string& error)>;

    static std::shared_ptr<message_client> create(std::shared_ptr<const contract::registry> api,
                                                  std::string_view endpoint_name,
                                                  message_client_config config = {}) {
        return std::shared_ptr<message_client>(new message_client(std::move(api), endpoint_name, std::move(config)));
    }

    message_client(const message_client&) = delete;
    message_client& operator=(const message_client&) = delete;

    /// Perform the upgrade handshake and start receiving
    /// @throws client_error when the server refuses the upgrade
    coro::task<void> connect() {
        if (conn_) {
            throw std::logic_error("message_client is already connected");
        }
        auto target = http::url::parse(url());
        if (!target) {
            throw client_error("Invalid WebSocket URL: " + url());
        }
        if (target->scheme != "ws") {
            throw client_error("Unsupported URL scheme: " + target->scheme);
        }

        auto connected = co_await net::tcp_connect(target->host, target->effective_port());
        if (!connected) {
            throw client_error("Failed to connect to " + target->authority() + ": " + strerror(connected.error()));
        }
        net::tcp_stream stream = std::move(*connected);

        auto key = http::websocket::generate_websocket_key();
        auto req = http::websocket::build_client_handshake(*target, key);
        req.get_headers().merge(config_.headers);
        auto written = co_await stream.write_all(req.serialize());
        if (!written.ok()) {
            throw client_error("Failed to send handshake: " + std::string(strerror(written.error())));
        }

        http::response_parser parser;
        std::vector<char> buffer(config_.read_buffer_size);
        while (!parser.head_complete() && !parser.has_error()) {
            auto result = co_await stream.read(buffer.data(), buffer.size());
            if (result.result <= 0) {
                throw client_error("Connection closed during handshake");
            }
            parser.parse(std::string_view(buffer.data(), static_cast<size_t>(result.result)));
        }
        if (parser.has_error()) {
            throw client_error("Invalid handshake response: " + std::string(parser.error_message()));
        }

        const auto& head = parser.get();
        if (head.status_code() != 101) {
            while (!parser.is_complete() && !parser.has_error()) {
                auto result = co_await stream.read(buffer.data(), buffer.size());
                if (result.result <= 0) {
                    parser.finish();
                    break;
                }
                parser.parse(std::string_view(buffer.data(), static_cast<size_t>(result.result)));
            }
            auto body = json::parse(parser.get().body());
            throw http_error(head.status_code(), std::string(head.reason()),
                             body ? *body : Json::Value(std::string(parser.get().body())));
        }
        if (head.header("Sec-WebSocket-Accept") != http::websocket::compute_websocket_accept(key)) {
            throw client_error("Invalid Sec-WebSocket-Accept in handshake response");
        }

        std::string pending = parser.take_remaining();
        auto out = std::make_unique<server::tcp_sink>(std::move(stream));
        auto* raw = out.get();
        conn_ = std::make_shared<server::connection>(std::move(out));
        conn_->open();
        ACCORD_LOG_DEBUG("Message client connected to {}", target->to_string());
        notify_state(true);

        runtime::event_loop::require().go(read_loop(shared_from_this(), raw, std::move(pending)));
    }

    /// Send one envelope
    /// @throws client_validation_error for a payload clientMessages rejects
    /// @throws std::logic_error when the connection is not open
    void send(std::string_view type, const Json::Value& payload) {
        if (config_.validate) {
            const auto& messages = messages_->client_messages;
            auto it = messages.find(std::string(type));
            if (it == messages.end()) {
                throw client_validation_error("message[" + std::string(type) + "]",
                    {{"custom", {"type"}, "Unknown message type: " + std::string(type)}});
            }
            auto checked = contract::apply(it->second, payload);
            if (!checked) {
                throw client_validation_error("message[" + std::string(type) + "]", std::move(checked.error()));
            }
        }
        if (!is_open()) {
            throw std::logic_error("message_client is not connected");
        }
        conn_->post(http::websocket::encode_text_frame(server::encode_envelope(type, payload), true));
    }

    /// Start the closing handshake
    void close(uint16_t code = 1000, std::string_view reason = "") {
        if (!is_open()) {
            return;
        }
        close_code_ = code;
        close_reason_ = reason;
        conn_->close(http::websocket::encode_close_frame(
            static_cast<http::websocket::close_code>(code), reason, true));
    }

    bool is_open() const noexcept { return conn_ && conn_->is_open(); }

    /// Completes once the connection has fully closed
    coro::task<void> wait_closed() {
        if (conn_) {
            co_await conn_->wait_closed();
        }
    }

    uint16_t close_code() const noexcept { return close_code_; }
    const std::string& close_reason() const noexcept { return close_reason_; }

    /// Full ws:// URL of the endpoint
    std::string url() const {
        contract::path_params params;
        if (config_.params.isObject()) {
            for (const auto& key : config_.params.getMemberNames()) {
                params[key] = http::value_text(config_.params[key]);
            }
        }
        return resolve_websocket_url(contract::build_url(
            config_.base_url, contract::interpolate(endpoint_->path, params), http::build_query(config_.query)));
    }

    /// Handler for one server message type
    size_t on(std::string type, payload_callback fn) {
        auto id = next_id_++;
        typed_.emplace(id, std::make_pair(std::move(type), std::move(fn)));
        return id;
    }

    /// Handler for every server message
    size_t on_message(message_callback fn) {
        auto id = next_id_++;
        any_.emplace(id, std::move(fn));
        return id;
    }

    size_t on_state_change(state_callback fn) {
        auto id = next_id_++;
        state_.emplace(id, std::move(fn));
        return id;
    }

    size_t on_error(error_callback fn) {
        auto id = next_id_++;
        errors_.emplace(id, std::move(fn));
        return id;
    }

    /// Remove a handler registered by any of the on_* calls
    void off(size_t id) {
        typed_.erase(id);
        any_.erase(id);
        state_.erase(id);
        errors_.erase(id);
    }

private:
    message_client(std::shared_ptr<const contract::registry> api, std::string_view endpoint_name,
                   message_client_config config)
        : api_(std::move(api)), config_(std::move(config)) {
        if (!api_) {
            throw client_error("message_client requires a contract");
        }
        endpoint_ = &api_->at(endpoint_name);
        messages_ = endpoint_->get_if<contract::message_payload>();
        if (!messages_) {
            throw client_error("Endpoint '" + endpoint_->name + "' is not a message endpoint");
        }
    }

    static coro::task<void> read_loop(std::shared_ptr<message_client> self, server::tcp_sink* in, std::string pending) {
        namespace ws = http::websocket;
        ws::frame_parser parser(false, self->config_.max_message_size);
        std::vector<char> buffer(self->config_.read_buffer_size);
        auto conn = self->conn_;

        for (;;) {
            if (!pending.empty()) {
                parser.feed(pending);
                pending.clear();
            }
            while (auto frame = parser.next()) {
                switch (frame->op) {
                    case ws::opcode::text:
                    case ws::opcode::binary:
                        self->dispatch(frame->payload);
                        break;
                    case ws::opcode::ping:
                        conn->post(ws::encode_pong_frame(frame->payload, true));
                        break;
                    case ws::opcode::close: {
                        auto [code, reason] = ws::parse_close_payload(frame->payload);
                        if (conn->is_open()) {
                            self->close_code_ = static_cast<uint16_t>(code);
                            self->close_reason_ = reason;
                            conn->close(ws::encode_close_frame(
                                code == ws::close_code::no_status ? ws::close_code::normal : code, "", true));
                        } else {
                            conn->abort();
                        }
                        break;
                    }
                    default:
                        break;
                }
            }
            if (parser.has_error()) {
                self->notify_error("Protocol error: " + parser.error());
                conn->abort();
                break;
            }
            if (conn->state() == server::connection_state::closed) {
                break;
            }

            auto result = co_await in->stream().read(buffer.data(), buffer.size());
            if (result.result <= 0) {
                if (result.result < 0 && result.result != -ECANCELED && result.result != -EBADF) {
                    self->notify_error(std::string("Read failed: ") + strerror(-static_cast<int>(result.result)));
                }
                conn->abort();
                break;
            }
            pending.assign(buffer.data(), static_cast<size_t>(result.result));
        }

        co_await conn->wait_closed();
        ACCORD_LOG_DEBUG("Message client disconnected ({})", self->close_code_);
        self->notify_state(false);
    }

    void dispatch(std::string_view text) {
        auto parsed = json::parse(text);
        if (!parsed || !parsed->isObject() || !(*parsed)["type"].isString()) {
            notify_error("Malformed message from server");
            return;
        }
        server::envelope msg{(*parsed)["type"].asString(), (*parsed)["payload"]};

        if (config_.validate && msg.type != server::ERROR_MESSAGE_TYPE) {
            auto it = messages_->server_messages.find(msg.type);
            if (it == messages_->server_messages.end()) {
                notify_error("Unknown message type: " + msg.type);
                return;
            }
            auto checked = contract::apply(it->second, msg.payload);
            if (!checked) {
                notify_error("Validation failed for message type " + msg.type + ": " +
                             json::to_string(contract::to_json(checked.error())));
                return;
            }
            msg.payload = std::move(*checked);
        }

        auto typed = typed_;
        for (const auto& [id, entry] : typed) {
            if (entry.first == msg.type) {
                entry.second(msg.payload);
            }
        }
        auto any = any_;
        for (const auto& [id, fn] : any) {
            fn(msg);
        }
    }

    void notify_state(bool connected) {
        auto handlers = state_;
        for (const auto& [id, fn] : handlers) {
            fn(connected);
        }
    }

    void notify_error(const std::string& error) {
        ACCORD_LOG_DEBUG("Message client error: {}", error);
        auto handlers = errors_;
        for (const auto& [id, fn] : handlers) {
            fn(error);
        }
    }

    std::shared_ptr<const contract::registry> api_;
    message_client_config config_;
    const contract::endpoint_definition* endpoint_ = nullptr;
    const contract::message_payload* messages_ = nullptr;
    std::shared_ptr<server::connection> conn_;
    uint16_t close_code_ = static_cast<uint16_t>(http::websocket::close_code::abnormal);
    std::string close_reason_;

    size_t next_id_ = 1;
    std::map<size_t, std::pair<std::string, payload_callback>> typed_;
    std::map<size_t, message_callback> any_;
    std::map<size_t, state_callback> state_;
    std::map<size_t, error_callback> errors_;
};

} // namespace accord::client
