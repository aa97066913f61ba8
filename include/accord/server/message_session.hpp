#pragma once

/// @file message_session.hpp
/// @brief Bidirectional typed-envelope transport
///
/// Two phases. prepare_upgrade() validates the handshake request (params,
/// query, headers and the per-connection data) and yields an upgrade_result;
/// the socket handshake itself belongs to the server. message_session then
/// drives the hooks: open once, message for every valid inbound envelope,
/// drain at most once, close once.
///
/// An inbound envelope with an unknown type or an invalid payload never
/// closes the connection. It goes to the validation_error hook when one is
/// registered, otherwise the peer receives
/// `{"type":"error","payload":{"code":"VALIDATION_ERROR",...}}`.

#include <accord/contract/endpoint.hpp>
#include <accord/contract/errors.hpp>
#include <accord/contract/path_matcher.hpp>
#include <accord/contract/schema.hpp>
#include <accord/coro/cancel_token.hpp>
#include <accord/coro/task.hpp>
#include <accord/http/http_message.hpp>
#include <accord/http/websocket_frame.hpp>
#include <accord/json/codec.hpp>
#include <accord/log/macros.hpp>
#include <accord/server/connection.hpp>
#include <accord/server/request_validator.hpp>
#include <accord/server/topic_hub.hpp>

#include <json/json.h>

#include <cstdint>
#include <exception>
#include <expected>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <utility>

namespace accord::server {

/// Envelope type reserved for engine-generated error replies
inline constexpr std::string_view ERROR_MESSAGE_TYPE = "error";

/// Wire unit of the message transport
struct envelope {
    std::string type;
    Json::Value payload;
};

inline std::string encode_envelope(std::string_view type, const Json::Value& payload) {
    Json::Value out(Json::objectValue);
    out["type"] = std::string(type);
    out["payload"] = payload;
    return json::to_string(out);
}

/// Parse an inbound envelope and validate it against clientMessages
inline std::expected<envelope, contract::message_validation_error>
decode_envelope(std::string_view text, const contract::message_payload& messages) {
    auto parsed = json::parse(text);
    if (!parsed) {
        return std::unexpected(contract::message_validation_error("", {
            {"invalid_json", {}, "Malformed message: " + parsed.error()}}));
    }
    if (!parsed->isObject() || !(*parsed)["type"].isString()) {
        return std::unexpected(contract::message_validation_error("", {
            {"invalid_type", {"type"}, "Message type must be a string"}}));
    }

    envelope msg{(*parsed)["type"].asString(), (*parsed)["payload"]};
    auto it = messages.client_messages.find(msg.type);
    if (it == messages.client_messages.end()) {
        return std::unexpected(contract::message_validation_error(msg.type, {
            {"custom", {"type"}, "Unknown message type: " + msg.type}}));
    }
    auto checked = contract::apply(it->second, msg.payload);
    if (!checked) {
        return std::unexpected(contract::message_validation_error(msg.type, std::move(checked.error())));
    }
    msg.payload = std::move(*checked);
    return msg;
}

/// Payload of the reserved error envelope
inline Json::Value validation_error_payload(const contract::message_validation_error& e) {
    Json::Value payload(Json::objectValue);
    payload["code"] = "VALIDATION_ERROR";
    payload["message"] = e.what();
    payload["issues"] = contract::to_json(e.issues());
    return payload;
}

/// Per-endpoint options of the message transport
struct message_options {
    contract::schema_ptr data_schema;   ///< validates the per-connection data
};

/// Validated handshake, consumed by the socket upgrade
struct upgrade_result {
    std::string endpoint_name;
    const contract::endpoint_definition* endpoint = nullptr;
    Json::Value params;
    Json::Value query;
    Json::Value headers;
    Json::Value data;
};

/// Upgrade phase: params, query and headers, then the per-connection data
inline std::expected<upgrade_result, contract::request_validation_error>
prepare_upgrade(const contract::endpoint_definition& endpoint,
                const http::request& req,
                const contract::path_params& params,
                Json::Value data,
                const message_options& options = {}) {
    auto validated = validate_request(endpoint, req, params);
    if (!validated) {
        return std::unexpected(std::move(validated.error()));
    }
    auto checked = contract::apply(options.data_schema, data);
    if (!checked) {
        return std::unexpected(contract::request_validation_error("data", std::move(checked.error())));
    }
    return upgrade_result{
        endpoint.name,
        &endpoint,
        std::move(validated->params),
        std::move(validated->query),
        std::move(validated->headers),
        std::move(*checked),
    };
}

class message_session;

/// Handler-side view of one message connection
class message_socket {
public:
    message_socket(std::shared_ptr<connection> conn, std::shared_ptr<topic_hub> hub, upgrade_result info)
        : conn_(std::move(conn)), hub_(std::move(hub)), info_(std::move(info)) {}

    /// Send an envelope; a no-op unless open. Payloads are not validated.
    void send(std::string_view type, const Json::Value& payload) {
        conn_->post(http::websocket::encode_text_frame(encode_envelope(type, payload)));
    }

    /// Start the closing handshake
    void close(uint16_t code = 1000, std::string_view reason = "") {
        if (!conn_->is_open()) {
            return;
        }
        close_code_ = code;
        close_reason_ = reason;
        conn_->close(http::websocket::encode_close_frame(
            static_cast<http::websocket::close_code>(code), reason));
    }

    bool is_open() const noexcept { return conn_->is_open(); }
    connection_state state() const noexcept { return conn_->state(); }
    coro::cancel_token signal() const noexcept { return conn_->token(); }

    void subscribe(const std::string& topic) {
        if (hub_) {
            hub_->subscribe(topic, conn_);
            topics_.insert(topic);
        }
    }

    void unsubscribe(const std::string& topic) {
        if (hub_) {
            hub_->unsubscribe(topic, conn_.get());
            topics_.erase(topic);
        }
    }

    /// Send to every other subscriber of @p topic
    size_t publish(const std::string& topic, std::string_view type, const Json::Value& payload) {
        if (!hub_) {
            return 0;
        }
        return hub_->publish(topic,
            http::websocket::encode_text_frame(encode_envelope(type, payload)), conn_.get());
    }

    const std::set<std::string>& topics() const noexcept { return topics_; }

    const std::string& endpoint_name() const noexcept { return info_.endpoint_name; }
    const contract::endpoint_definition& endpoint() const noexcept { return *info_.endpoint; }
    const Json::Value& params() const noexcept { return info_.params; }
    const Json::Value& query() const noexcept { return info_.query; }
    const Json::Value& headers() const noexcept { return info_.headers; }
    const Json::Value& data() const noexcept { return info_.data; }

    /// Mutable per-connection state owned by the handlers
    Json::Value& state_data() noexcept { return state_; }

    uint16_t close_code() const noexcept { return close_code_; }
    const std::string& close_reason() const noexcept { return close_reason_; }

private:
    friend class message_session;

    std::shared_ptr<connection> conn_;
    std::shared_ptr<topic_hub> hub_;
    upgrade_result info_;
    Json::Value state_{Json::objectValue};
    std::set<std::string> topics_;
    uint16_t close_code_ = static_cast<uint16_t>(http::websocket::close_code::abnormal);
    std::string close_reason_;
};

/// Lifecycle hooks of a message endpoint; only `message` is required
struct message_handlers {
    std::function<coro::task<void>(message_socket&)> open;
    std::function<coro::task<void>(message_socket&, const envelope&)> message;
    std::function<void(message_socket&, uint16_t code, const std::string& reason)> close;
    std::function<void(message_socket&)> drain;
    std::function<void(message_socket&, const contract::message_validation_error&)> validation_error;
};

/// Drives the hooks of one upgraded connection
class message_session {
public:
    message_session(std::shared_ptr<connection> conn,
                    std::shared_ptr<topic_hub> hub,
                    const message_handlers& handlers,
                    upgrade_result info)
        : conn_(conn)
        , handlers_(handlers)
        , socket_(std::move(conn), std::move(hub), std::move(info)) {}

    message_session(const message_session&) = delete;
    message_session& operator=(const message_session&) = delete;

    message_socket& socket() noexcept { return socket_; }

    /// connecting -> open, then the open hook
    coro::task<void> start() {
        conn_->open();
        if (handlers_.drain) {
            conn_->on_drain([this] { handlers_.drain(socket_); });
        }
        if (!handlers_.open) {
            co_return;
        }
        bool failed = false;
        try {
            co_await handlers_.open(socket_);
        } catch (const std::exception& e) {
            ACCORD_LOG_ERROR("Message open handler '{}' failed: {}", socket_.endpoint_name(), e.what());
            failed = true;
        } catch (...) {
            ACCORD_LOG_ERROR("Message open handler '{}' failed with a non-standard exception",
                             socket_.endpoint_name());
            failed = true;
        }
        if (failed) {
            socket_.close(static_cast<uint16_t>(http::websocket::close_code::unexpected), "Internal error");
        }
    }

    /// Handle one inbound text message
    coro::task<void> receive(std::string_view text) {
        if (!conn_->is_open()) {
            co_return;
        }
        auto msg = decode_envelope(text, *socket_.endpoint().get_if<contract::message_payload>());
        if (!msg) {
            reject(msg.error());
            co_return;
        }
        try {
            co_await handlers_.message(socket_, *msg);
        } catch (const contract::message_validation_error& e) {
            reject(e);
        } catch (const std::exception& e) {
            ACCORD_LOG_ERROR("Message handler '{}' failed on '{}': {}",
                             socket_.endpoint_name(), msg->type, e.what());
        } catch (...) {
            ACCORD_LOG_ERROR("Message handler '{}' failed on '{}' with a non-standard exception",
                             socket_.endpoint_name(), msg->type);
        }
    }

    /// The peer started the closing handshake. A missing code is answered
    /// with 1000; a code that may not appear on the wire with 1002.
    void peer_closed(uint16_t code, std::string reason) {
        namespace ws = http::websocket;
        auto reply = ws::close_code::normal;
        if (ws::is_sendable_close_code(code)) {
            reply = static_cast<ws::close_code>(code);
        } else if (code != static_cast<uint16_t>(ws::close_code::no_status)) {
            ACCORD_LOG_WARNING("Peer of '{}' sent invalid close code {}", socket_.endpoint_name(), code);
            reply = ws::close_code::protocol_error;
            code = static_cast<uint16_t>(reply);
        }
        socket_.close_code_ = code;
        socket_.close_reason_ = std::move(reason);
        conn_->close(ws::encode_close_frame(reply));
    }

    /// Final teardown: close the connection, leave every topic, run the close hook once
    void finish() {
        if (finished_) {
            return;
        }
        finished_ = true;
        conn_->close();
        for (const auto& topic : std::set<std::string>(socket_.topics())) {
            socket_.unsubscribe(topic);
        }
        if (handlers_.close) {
            try {
                handlers_.close(socket_, socket_.close_code(), socket_.close_reason());
            } catch (const std::exception& e) {
                ACCORD_LOG_ERROR("Message close handler '{}' failed: {}", socket_.endpoint_name(), e.what());
            } catch (...) {
                ACCORD_LOG_ERROR("Message close handler '{}' failed with a non-standard exception",
                                 socket_.endpoint_name());
            }
        }
    }

private:
    void reject(const contract::message_validation_error& e) {
        ACCORD_LOG_DEBUG("Rejected message on '{}': {}", socket_.endpoint_name(), e.what());
        if (handlers_.validation_error) {
            try {
                handlers_.validation_error(socket_, e);
            } catch (const std::exception& hook_error) {
                ACCORD_LOG_ERROR("Message validation hook '{}' failed: {}",
                                 socket_.endpoint_name(), hook_error.what());
            } catch (...) {
                ACCORD_LOG_ERROR("Message validation hook '{}' failed with a non-standard exception",
                                 socket_.endpoint_name());
            }
        } else {
            socket_.send(ERROR_MESSAGE_TYPE, validation_error_payload(e));
        }
    }

    std::shared_ptr<connection> conn_;
    const message_handlers& handlers_;
    message_socket socket_;
    bool finished_ = false;
};

} // namespace accord::server
