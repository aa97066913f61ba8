#pragma once

/// @file chunk_stream.hpp
/// @brief Chunked incremental transport (application/x-ndjson)
///
/// One JSON value per line, strictly in send() order, followed by at most
/// one terminal frame. With the default sentinel framing a chunk is written
/// verbatim and the terminal frame is `{"__final__":true,"data":<final>}`;
/// envelope framing tags every line with "kind" instead.

#include <accord/contract/endpoint.hpp>
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
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace accord::server {

/// Reserved keys of the sentinel terminal frame
inline constexpr std::string_view FINAL_MARKER_KEY = "__final__";
inline constexpr std::string_view FINAL_DATA_KEY = "data";

/// Response header announcing envelope framing
inline constexpr std::string_view CHUNK_FRAMING_HEADER = "X-Accord-Chunk-Framing";

inline std::string encode_chunk_frame(const Json::Value& chunk, contract::chunk_framing framing) {
    if (framing == contract::chunk_framing::envelope) {
        Json::Value frame(Json::objectValue);
        frame["kind"] = "chunk";
        frame["value"] = chunk;
        return json::to_string(frame) + "\n";
    }
    return json::to_string(chunk) + "\n";
}

inline std::string encode_final_frame(const std::optional<Json::Value>& final_value,
                                      contract::chunk_framing framing) {
    Json::Value frame(Json::objectValue);
    if (framing == contract::chunk_framing::envelope) {
        frame["kind"] = "final";
        if (final_value) {
            frame["value"] = *final_value;
        }
    } else {
        frame[std::string(FINAL_MARKER_KEY)] = true;
        frame[std::string(FINAL_DATA_KEY)] = final_value ? *final_value : Json::Value();
    }
    return json::to_string(frame) + "\n";
}

inline http::response chunk_stream_head(contract::chunk_framing framing) {
    http::response resp(200);
    resp.set_header("Content-Type", http::mime::application_ndjson);
    resp.set_header("Cache-Control", "no-cache");
    resp.set_header("Connection", "close");
    if (framing == contract::chunk_framing::envelope) {
        resp.set_header(CHUNK_FRAMING_HEADER, "envelope");
    }
    return resp;
}

/// Handler-side view of a chunked stream
class chunk_stream {
public:
    chunk_stream(std::shared_ptr<connection> conn, contract::chunk_framing framing)
        : conn_(std::move(conn)), framing_(framing) {}

    /// Queue one chunk; a no-op after close() or disconnect
    coro::task<bool> send(const Json::Value& chunk) {
        return conn_->write(encode_chunk_frame(chunk, framing_));
    }

    /// Emit the terminal frame and close; later calls do nothing
    void close(std::optional<Json::Value> final_value = std::nullopt) {
        if (!conn_->is_open()) {
            return;
        }
        conn_->close(encode_final_frame(final_value, framing_));
    }

    bool is_open() const noexcept { return conn_->is_open(); }

private:
    std::shared_ptr<connection> conn_;
    contract::chunk_framing framing_;
};

struct chunk_stream_context {
    std::string endpoint_name;
    Json::Value params;
    Json::Value query;
    Json::Value headers;
    Json::Value body;
    Json::Value context;
    chunk_stream stream;
    coro::cancel_token signal;
};

using chunk_stream_handler = std::function<coro::task<void>(chunk_stream_context&)>;

/// Drive one chunked stream until the connection is closed
///
/// A handler that returns without calling close() gets a terminal frame
/// without a final value. A handler that throws abandons the stream: no
/// terminal frame is written, chunks already sent are flushed and the
/// connection closes.
inline coro::task<void> run_chunk_stream(std::shared_ptr<connection> conn,
                                         const chunk_stream_handler& handler,
                                         contract::chunk_framing framing,
                                         std::string endpoint_name,
                                         validated_request input,
                                         Json::Value context) {
    conn->open();
    chunk_stream_context ctx{
        std::move(endpoint_name),
        std::move(input.params),
        std::move(input.query),
        std::move(input.headers),
        std::move(input.body),
        std::move(context),
        chunk_stream(conn, framing),
        conn->token(),
    };

    bool failed = false;
    try {
        co_await handler(ctx);
    } catch (const std::exception& e) {
        ACCORD_LOG_ERROR("Chunk stream handler '{}' failed: {}", ctx.endpoint_name, e.what());
        failed = true;
    } catch (...) {
        ACCORD_LOG_ERROR("Chunk stream handler '{}' failed with a non-standard exception", ctx.endpoint_name);
        failed = true;
    }

    if (failed) {
        conn->abandon();
    } else {
        ctx.stream.close();
    }
    co_await conn->wait_closed();
}

} // namespace accord::server
