#pragma once

/// @file http_client.hpp
/// @brief Contract-driven client for the standard and streaming transports
///
/// Usage:
/// ```cpp
/// client::http_client api(contract, {.base_url = "http://127.0.0.1:8080/api"});
/// auto user = co_await api.call("getUser", {.params = json::object({{"id", "42"}})});
/// ```
/// Each call uses its own connection (`Connection: close`).

#include <accord/client/errors.hpp>
#include <accord/client/stream_readers.hpp>
#include <accord/contract/endpoint.hpp>
#include <accord/contract/path_matcher.hpp>
#include <accord/contract/registry.hpp>
#include <accord/contract/schema.hpp>
#include <accord/coro/cancel_token.hpp>
#include <accord/coro/task.hpp>
#include <accord/http/content.hpp>
#include <accord/http/http_common.hpp>
#include <accord/http/http_message.hpp>
#include <accord/http/http_parser.hpp>
#include <accord/json/codec.hpp>
#include <accord/log/macros.hpp>
#include <accord/net/tcp.hpp>
#include <accord/server/chunk_stream.hpp>
#include <accord/server/request_validator.hpp>

#include <json/json.h>

#include <cerrno>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace accord::client {

/// HTTP client configuration
struct client_config {
    std::string base_url;                          ///< e.g. http://host:port/prefix
    http::headers headers;                         ///< Sent with every request
    bool validate_request = true;                  ///< Check outgoing data against the contract
    bool validate_response = true;                 ///< Check responses against the contract
    size_t read_buffer_size = 8192;                ///< Read buffer size
    std::string user_agent = "accord-client/1.0";  ///< User-Agent header
};

/// Per-call inputs; null members are omitted
struct call_options {
    Json::Value params;
    Json::Value query;
    Json::Value headers;
    std::optional<Json::Value> body;
    coro::cancel_token token;
};

struct client_response {
    uint16_t status = 0;
    Json::Value data;
    http::headers headers;
};

/// Decode a response body: 204 -> {}, JSON parsed, text/* as a string,
/// anything else as its text when non-empty
inline Json::Value decode_response_body(const http::response& resp) {
    if (resp.status_code() == 204) {
        return Json::Value(Json::objectValue);
    }
    std::string content_type = http::to_lower(resp.content_type());
    if (content_type.find("application/json") != std::string::npos) {
        auto parsed = json::parse(resp.body());
        if (!parsed) {
            throw client_error("Invalid JSON in response: " + parsed.error());
        }
        return std::move(*parsed);
    }
    if (content_type.find("text/") != std::string::npos || !resp.body().empty()) {
        return Json::Value(std::string(resp.body()));
    }
    return Json::Value(Json::objectValue);
}

class http_client {
public:
    http_client(std::shared_ptr<const contract::registry> api, client_config config)
        : api_(std::move(api)), config_(std::move(config)) {
        if (!api_) {
            throw client_error("http_client requires a contract");
        }
        auto base = http::url::parse(config_.base_url);
        if (!base) {
            throw client_error("Invalid base URL: " + config_.base_url);
        }
        if (base->scheme != "http") {
            throw client_error("Unsupported URL scheme: " + base->scheme);
        }
    }

    const client_config& config() const noexcept { return config_; }
    const contract::registry& api() const noexcept { return *api_; }

    /// Invoke a standard endpoint
    /// @throws client_validation_error, http_error, client_error
    coro::task<client_response> call(std::string_view name, call_options options = {}) {
        const auto& endpoint = api_->at(name);
        const auto* payload = endpoint.get_if<contract::standard_payload>();
        if (!payload) {
            throw client_error("Endpoint '" + endpoint.name + "' uses the " +
                               std::string(contract::to_string(endpoint.kind())) + " transport");
        }

        auto req = prepare(endpoint, options);
        auto exchange = co_await open_exchange(req, options.token);
        while (!exchange.parser.is_complete()) {
            if (!co_await exchange.read_more(options.token)) {
                break;
            }
        }
        if (!exchange.parser.is_complete()) {
            throw client_error(exchange.parser.has_error()
                                   ? std::string(exchange.parser.error_message())
                                   : "Request cancelled");
        }

        auto resp = exchange.parser.take_response();
        client_response result{resp.status_code(), decode_response_body(resp), resp.get_headers()};

        auto declared = payload->responses.find(result.status);
        if (!resp.is_success() && declared == payload->responses.end()) {
            throw http_error(result.status, std::string(resp.reason()), result.data);
        }
        if (config_.validate_response && declared != payload->responses.end()) {
            auto checked = contract::apply(declared->second, result.data);
            if (!checked) {
                throw client_validation_error("response[" + std::to_string(result.status) + "]",
                                              std::move(checked.error()));
            }
        }
        co_return result;
    }

    /// Consume an event stream until the server closes it or the token fires
    coro::task<void> stream_events(std::string_view name, call_options options,
                                   event_stream_reader::callback on_event) {
        const auto& endpoint = api_->at(name);
        const auto* payload = endpoint.get_if<contract::event_stream_payload>();
        if (!payload) {
            throw client_error("Endpoint '" + endpoint.name + "' is not an event stream");
        }

        auto req = prepare(endpoint, options);
        req.set_header("Accept", http::mime::text_event_stream);
        auto exchange = co_await open_exchange(req, options.token);
        co_await exchange.expect_success(options.token);

        event_stream_reader reader([&](const std::string& event, const Json::Value& data) {
            if (config_.validate_response) {
                if (auto it = payload->events.find(event); it != payload->events.end()) {
                    auto checked = contract::apply(it->second, data);
                    if (!checked) {
                        throw client_validation_error("event[" + event + "]", std::move(checked.error()));
                    }
                }
            }
            on_event(event, data);
        });

        do {
            reader.feed(exchange.parser.take_body());
        } while (co_await exchange.read_more(options.token));
    }

    /// Consume a chunked stream; returns the final value, if one arrived
    /// @throws client_error if the server ended the stream without a terminal frame
    coro::task<std::optional<Json::Value>> stream_chunks(std::string_view name, call_options options,
                                                         chunk_stream_reader::callback on_chunk) {
        const auto& endpoint = api_->at(name);
        const auto* payload = endpoint.get_if<contract::chunk_stream_payload>();
        if (!payload) {
            throw client_error("Endpoint '" + endpoint.name + "' is not a chunk stream");
        }

        auto req = prepare(endpoint, options);
        req.set_header("Accept", http::mime::application_ndjson);
        auto exchange = co_await open_exchange(req, options.token);
        co_await exchange.expect_success(options.token);

        auto framing = http::to_lower(exchange.parser.get().header(server::CHUNK_FRAMING_HEADER)) == "envelope"
                           ? contract::chunk_framing::envelope
                           : contract::chunk_framing::sentinel;
        chunk_stream_reader reader(framing, [&](const Json::Value& chunk) {
            if (config_.validate_response) {
                auto checked = contract::apply(payload->chunk, chunk);
                if (!checked) {
                    throw client_validation_error("chunk", std::move(checked.error()));
                }
            }
            on_chunk(chunk);
        });

        do {
            reader.feed(exchange.parser.take_body());
        } while (!reader.finished() && co_await exchange.read_more(options.token));

        if (!reader.finished()) {
            if (options.token.is_cancelled()) {
                co_return std::nullopt;
            }
            throw client_error("Stream '" + endpoint.name + "' ended without a terminal frame");
        }

        const auto& final_value = reader.final_value();
        if (final_value && config_.validate_response) {
            auto checked = contract::apply(payload->final_response, *final_value);
            if (!checked) {
                throw client_validation_error("final", std::move(checked.error()));
            }
        }
        co_return final_value;
    }

    /// Validate (when enabled) and build the request for @p endpoint
    http::request prepare(const contract::endpoint_definition& endpoint, const call_options& options) const {
        if (config_.validate_request) {
            validate_outgoing(endpoint, options);
        }

        contract::path_params params;
        if (options.params.isObject()) {
            for (const auto& key : options.params.getMemberNames()) {
                params[key] = http::value_text(options.params[key]);
            }
        }
        auto target = http::url::parse(contract::build_url(
            config_.base_url, contract::interpolate(endpoint.path, params), http::build_query(options.query)));
        if (!target) {
            throw client_error("Invalid request URL for endpoint '" + endpoint.name + "'");
        }

        http::request req(endpoint.method, target->path);
        req.set_query(target->query);
        req.set_header("Host", target->authority());
        req.set_header("User-Agent", config_.user_agent);
        req.get_headers().merge(config_.headers);
        if (options.headers.isObject()) {
            for (const auto& key : options.headers.getMemberNames()) {
                req.set_header(key, http::value_text(options.headers[key]));
            }
        }
        if (options.body) {
            req.set_header("Content-Type", http::mime::application_json);
            req.set_body(json::to_string(*options.body));
        }
        req.set_header("Connection", "close");
        return req;
    }

private:
    /// One request/response exchange over a dedicated connection
    struct exchange {
        net::tcp_stream stream;
        http::response_parser parser;
        std::vector<char> buffer;

        /// Read and parse one slice; false on EOF, error or cancellation
        coro::task<bool> read_more(coro::cancel_token token) {
            if (parser.is_complete() || parser.has_error()) {
                co_return false;
            }
            auto result = co_await stream.read(buffer.data(), buffer.size(), token);
            if (result.result == 0) {
                parser.finish();
                co_return false;
            }
            if (result.result < 0) {
                if (result.result != -ECANCELED) {
                    ACCORD_LOG_DEBUG("Response read failed: {}", strerror(-result.result));
                }
                co_return false;
            }
            parser.parse(std::string_view(buffer.data(), static_cast<size_t>(result.result)));
            co_return !parser.has_error();
        }

        /// Throw http_error unless the head carries a 2xx status
        coro::task<void> expect_success(coro::cancel_token token) {
            if (parser.get().is_success()) {
                co_return;
            }
            while (co_await read_more(token)) {
            }
            auto resp = parser.take_response();
            Json::Value body;
            try {
                body = decode_response_body(resp);
            } catch (const client_error&) {
                body = Json::Value(std::string(resp.body()));
            }
            throw http_error(resp.status_code(), std::string(resp.reason()), std::move(body));
        }
    };

    void validate_outgoing(const contract::endpoint_definition& endpoint, const call_options& options) const {
        auto check = [](const char* field, const contract::schema_ptr& schema, const Json::Value& value) {
            if (!schema || value.isNull()) {
                return;
            }
            auto checked = schema->parse(value);
            if (!checked) {
                throw client_validation_error(field, std::move(checked.error()));
            }
        };
        check("params", endpoint.params, options.params);
        check("query", endpoint.query, options.query);
        check("headers", endpoint.headers, options.headers);
        if (options.body) {
            check("body", server::body_schema_of(endpoint), *options.body);
        }
    }

    coro::task<exchange> open_exchange(const http::request& req, coro::cancel_token token) {
        auto target = *http::url::parse(config_.base_url);
        auto connected = co_await net::tcp_connect(target.host, target.effective_port(), token);
        if (!connected) {
            throw client_error("Failed to connect to " + target.authority() + ": " + strerror(connected.error()));
        }

        exchange ex{std::move(*connected), http::response_parser(req.get_method() == http::method::HEAD),
                    std::vector<char>(config_.read_buffer_size)};
        auto written = co_await ex.stream.write_all(req.serialize(), token);
        if (!written.ok()) {
            throw client_error("Failed to send request: " + std::string(strerror(written.error())));
        }
        while (!ex.parser.head_complete()) {
            if (!co_await ex.read_more(token)) {
                break;
            }
        }
        if (!ex.parser.head_complete() && !ex.parser.is_complete()) {
            throw client_error(ex.parser.has_error() ? std::string(ex.parser.error_message())
                                                     : "Connection closed before response head");
        }
        ACCORD_LOG_DEBUG("{} {} -> {}", http::method_to_string(req.get_method()), req.target(),
                         ex.parser.get().status_code());
        co_return ex;
    }

    std::shared_ptr<const contract::registry> api_;
    client_config config_;
};

} // namespace accord::client
