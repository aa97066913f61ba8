#pragma once

/// @file router.hpp
/// @brief Handler bindings and the standard request/response pipeline
///
/// Usage:
/// ```cpp
/// auto api = std::make_shared<const contract::registry>(make_contract());
/// server::router r(api, {.base_path = "/api"});
/// r.on_request("getUser", [](server::request_context& ctx) -> coro::task<server::handler_response> {
///     co_return server::handler_response{200, load_user(ctx.params["id"].asString())};
/// });
/// r.on_message("chat", chat_handlers);
/// ```
/// Every endpoint of the contract must be bound before a server accepts
/// the router; check_complete() enforces it.

#include <accord/contract/endpoint.hpp>
#include <accord/contract/errors.hpp>
#include <accord/contract/path_matcher.hpp>
#include <accord/contract/registry.hpp>
#include <accord/coro/task.hpp>
#include <accord/http/http_message.hpp>
#include <accord/json/codec.hpp>
#include <accord/log/macros.hpp>
#include <accord/server/chunk_stream.hpp>
#include <accord/server/event_stream.hpp>
#include <accord/server/message_session.hpp>
#include <accord/server/request_validator.hpp>
#include <accord/server/response_encoder.hpp>

#include <json/json.h>

#include <exception>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>

namespace accord::server {

/// Everything a standard handler is invoked with
struct request_context {
    std::string endpoint_name;
    Json::Value params;
    Json::Value query;
    Json::Value headers;
    Json::Value body;
    Json::Value context;
    const http::request& request;
};

using standard_handler = std::function<coro::task<handler_response>(request_context&)>;

struct message_binding {
    message_handlers handlers;
    message_options options;
};

/// One alternative per transport, in endpoint_payload order
using endpoint_handler = std::variant<standard_handler, event_stream_handler,
                                      chunk_stream_handler, message_binding>;

using context_factory = std::function<Json::Value(const http::request&, const contract::endpoint_definition&)>;

struct router_options {
    std::string base_path;            ///< Prefix stripped from inbound paths
    context_factory make_context;     ///< Per-request context for every handler
};

/// "api/" -> "/api", "/" -> ""
inline std::string normalize_base_path(std::string_view base) {
    std::string out(base);
    while (!out.empty() && out.back() == '/') {
        out.pop_back();
    }
    if (!out.empty() && out.front() != '/') {
        out.insert(out.begin(), '/');
    }
    return out;
}

/// Standard pipeline: validate, invoke, validate and encode the response
///
/// The handler never sees a request that failed validation. Exceptions
/// escaping the handler become a 500 (a request_validation_error thrown by
/// the handler itself still maps to 400).
inline coro::task<http::response> dispatch_standard(const contract::endpoint_definition& endpoint,
                                                    const standard_handler& handler,
                                                    const http::request& req,
                                                    const contract::path_params& params,
                                                    Json::Value context) {
    const auto& payload = std::get<contract::standard_payload>(endpoint.payload);
    auto input = validate_request(endpoint, req, params, payload.body);
    if (!input) {
        co_return validation_error_response(input.error());
    }

    request_context ctx{
        endpoint.name,
        std::move(input->params),
        std::move(input->query),
        std::move(input->headers),
        std::move(input->body),
        std::move(context),
        req,
    };

    handler_response result;
    try {
        result = co_await handler(ctx);
    } catch (const contract::request_validation_error& e) {
        co_return validation_error_response(e);
    } catch (const contract::route_not_found& e) {
        co_return not_found_response(e);
    } catch (const std::exception& e) {
        ACCORD_LOG_ERROR("Handler '{}' failed: {}", endpoint.name, e.what());
        co_return internal_error_response();
    } catch (...) {
        ACCORD_LOG_ERROR("Handler '{}' failed with a non-standard exception", endpoint.name);
        co_return internal_error_response();
    }

    auto encoded = encode_response(payload, std::move(result));
    if (!encoded) {
        ACCORD_LOG_ERROR("Handler '{}' violated its response contract for status {}: {}",
                         endpoint.name, encoded.error().status(),
                         json::to_string(contract::to_json(encoded.error().issues())));
        co_return internal_error_response();
    }
    co_return std::move(*encoded);
}

class router {
public:
    /// Matched endpoint together with its bound handler
    struct resolved_route {
        const contract::endpoint_definition* endpoint = nullptr;
        contract::path_params params;
        const endpoint_handler* handler = nullptr;
    };

    explicit router(std::shared_ptr<const contract::registry> api, router_options options = {})
        : api_(std::move(api)), options_(std::move(options)) {
        if (!api_) {
            throw contract::contract_error("router requires a contract");
        }
        options_.base_path = normalize_base_path(options_.base_path);
    }

    router& on_request(std::string_view name, standard_handler handler) {
        return bind(name, endpoint_handler(std::in_place_index<0>, std::move(handler)));
    }

    router& on_events(std::string_view name, event_stream_handler handler) {
        return bind(name, endpoint_handler(std::in_place_index<1>, std::move(handler)));
    }

    router& on_chunks(std::string_view name, chunk_stream_handler handler) {
        return bind(name, endpoint_handler(std::in_place_index<2>, std::move(handler)));
    }

    router& on_message(std::string_view name, message_handlers handlers, message_options options = {}) {
        if (!handlers.message) {
            throw contract::contract_error("Message endpoint '" + std::string(name) + "' needs a message handler");
        }
        return bind(name, endpoint_handler(std::in_place_index<3>,
                                           message_binding{std::move(handlers), std::move(options)}));
    }

    /// Throws contract_error naming every endpoint without a handler
    void check_complete() const {
        std::string missing;
        for (const auto& entry : *api_) {
            if (!handlers_.contains(entry.definition.name)) {
                missing += missing.empty() ? "" : ", ";
                missing += entry.definition.name;
            }
        }
        if (!missing.empty()) {
            throw contract::contract_error("No handler bound for: " + missing);
        }
    }

    const contract::registry& api() const noexcept { return *api_; }
    const router_options& options() const noexcept { return options_; }

    /// Strip the base path and match against the contract
    std::expected<resolved_route, contract::route_not_found> resolve(http::method m, std::string_view path) const {
        auto not_found = [&] {
            return std::unexpected(contract::route_not_found(
                std::string(http::method_to_string(m)), std::string(path)));
        };

        std::string_view local = path;
        if (!options_.base_path.empty()) {
            if (!local.starts_with(options_.base_path)) {
                return not_found();
            }
            local.remove_prefix(options_.base_path.size());
            if (!local.empty() && local.front() != '/') {
                return not_found();
            }
            if (local.empty()) {
                local = "/";
            }
        }

        auto match = api_->match(m, local);
        if (!match) {
            return not_found();
        }
        auto it = handlers_.find(match->endpoint->name);
        return resolved_route{
            match->endpoint,
            std::move(match->params),
            it == handlers_.end() ? nullptr : &it->second,
        };
    }

    /// Per-request context from the configured factory (null without one)
    Json::Value make_context(const http::request& req, const contract::endpoint_definition& endpoint) const {
        if (!options_.make_context) {
            return Json::Value();
        }
        return options_.make_context(req, endpoint);
    }

    /// Run a request through the standard pipeline
    ///
    /// Streaming endpoints need a connection and are answered with 400 here.
    coro::task<http::response> handle(const http::request& req) const {
        auto route = resolve(req.get_method(), req.path());
        if (!route) {
            co_return not_found_response(route.error());
        }
        if (!route->handler) {
            ACCORD_LOG_ERROR("No handler bound for endpoint '{}'", route->endpoint->name);
            co_return internal_error_response();
        }
        const auto* handler = std::get_if<standard_handler>(route->handler);
        if (!handler) {
            co_return bad_request_response("Endpoint '" + route->endpoint->name + "' uses the " +
                std::string(contract::to_string(route->endpoint->kind())) + " transport");
        }

        Json::Value context;
        try {
            context = make_context(req, *route->endpoint);
        } catch (const std::exception& e) {
            ACCORD_LOG_ERROR("Context factory failed for '{}': {}", route->endpoint->name, e.what());
            co_return internal_error_response();
        }
        co_return co_await dispatch_standard(*route->endpoint, *handler, req, route->params, std::move(context));
    }

private:
    router& bind(std::string_view name, endpoint_handler handler) {
        const auto& endpoint = api_->at(name);
        if (handler.index() != endpoint.payload.index()) {
            throw contract::contract_error("Endpoint '" + endpoint.name + "' uses the " +
                std::string(contract::to_string(endpoint.kind())) + " transport");
        }
        handlers_.insert_or_assign(endpoint.name, std::move(handler));
        return *this;
    }

    std::shared_ptr<const contract::registry> api_;
    router_options options_;
    std::unordered_map<std::string, endpoint_handler> handlers_;
};

} // namespace accord::server
