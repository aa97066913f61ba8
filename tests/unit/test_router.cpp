#include <catch2/catch.hpp>
#include <accord/coro/task.hpp>
#include <accord/json/codec.hpp>
#include <accord/runtime/event_loop.hpp>
#include <accord/server/router.hpp>

#include "../support/fake_schemas.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace accord;
using namespace accord::server;
using accord::coro::task;
using accord::http::method;
using accord::runtime::event_loop;

namespace {

std::shared_ptr<const contract::registry> users_api() {
    return std::make_shared<const contract::registry>(std::vector<contract::endpoint_definition>{
        {
            .name = "createUser",
            .method = method::POST,
            .path = "/users",
            .payload = contract::standard_payload{
                .body = test::object_schema({{"name"}, {"email"}}),
                .responses = {{201, test::object_schema({{"id", Json::intValue}, {"name"}})}},
            },
        },
        {
            .name = "getUser",
            .method = method::GET,
            .path = "/users/:id",
            .params = test::integer_field_schema("id"),
            .payload = contract::standard_payload{
                .responses = {{200, test::object_schema({{"id", Json::intValue}})}},
            },
        },
        {
            .name = "logs",
            .path = "/logs",
            .payload = contract::event_stream_payload{},
        },
    });
}

http::request json_request(method m, std::string_view path, std::string_view body = "") {
    http::request req(m, path);
    if (!body.empty()) {
        req.set_header("Content-Type", "application/json");
        req.set_body(std::string(body));
    }
    return req;
}

Json::Value body_of(const http::response& resp) {
    auto parsed = json::parse(resp.body());
    return parsed ? *parsed : Json::Value();
}

event_stream_handler idle_events() {
    return [](event_stream_context&) -> task<cleanup_action> { co_return nullptr; };
}

} // namespace

TEST_CASE("invalid body never reaches the handler", "[router]") {
    event_loop loop;
    int calls = 0;

    router r(users_api());
    r.on_request("createUser", [&](request_context& ctx) -> task<handler_response> {
        ++calls;
        co_return handler_response{201, json::object({{"id", 1}, {"name", ctx.body["name"]}})};
    });

    auto resp = loop.block_on(r.handle(json_request(method::POST, "/users", R"({"name":"Ada"})")));

    REQUIRE(resp.status_code() == 400);
    auto body = body_of(resp);
    REQUIRE(body["error"].asString() == "Validation Error");
    REQUIRE(body["field"].asString() == "body");
    REQUIRE(body["issues"][0]["path"][0].asString() == "email");
    REQUIRE(calls == 0);
}

TEST_CASE("valid request reaches the handler with coerced values", "[router]") {
    event_loop loop;
    Json::Value seen_id;

    router r(users_api());
    r.on_request("getUser", [&](request_context& ctx) -> task<handler_response> {
        seen_id = ctx.params["id"];
        co_return handler_response{200, json::object({{"id", ctx.params["id"]}})};
    });

    auto resp = loop.block_on(r.handle(json_request(method::GET, "/users/42")));

    REQUIRE(resp.status_code() == 200);
    REQUIRE(seen_id.isInt64());
    REQUIRE(body_of(resp)["id"].asInt64() == 42);
}

TEST_CASE("only the first of two identical routes is dispatched", "[router]") {
    event_loop loop;
    auto api = std::make_shared<const contract::registry>(std::vector<contract::endpoint_definition>{
        {.name = "itemById", .method = method::GET, .path = "/items/:id", .payload = contract::standard_payload{}},
        {.name = "itemByKey", .method = method::GET, .path = "/items/:key", .payload = contract::standard_payload{}},
    });
    int first_calls = 0;
    int second_calls = 0;

    router r(api);
    r.on_request("itemById", [&](request_context& ctx) -> task<handler_response> {
        ++first_calls;
        co_return handler_response{200, json::object({{"by", ctx.endpoint_name}, {"id", ctx.params["id"]}})};
    });
    r.on_request("itemByKey", [&](request_context&) -> task<handler_response> {
        ++second_calls;
        co_return handler_response{200, json::object({{"by", "itemByKey"}})};
    });

    for (int i = 0; i < 3; ++i) {
        auto resp = loop.block_on(r.handle(json_request(method::GET, "/items/" + std::to_string(i))));
        REQUIRE(resp.status_code() == 200);
        REQUIRE(body_of(resp)["by"].asString() == "itemById");
        REQUIRE(body_of(resp)["id"].asString() == std::to_string(i));
    }

    REQUIRE(first_calls == 3);
    REQUIRE(second_calls == 0);
}

TEST_CASE("unmatched routes are 404", "[router]") {
    event_loop loop;
    router r(users_api());

    auto resp = loop.block_on(r.handle(json_request(method::DELETE_, "/users/1")));
    REQUIRE(resp.status_code() == 404);
    REQUIRE(body_of(resp)["error"].asString() == "Not Found");
    REQUIRE(body_of(resp)["message"].asString() == "Route not found: DELETE /users/1");
}

TEST_CASE("base path is stripped before matching", "[router]") {
    event_loop loop;
    router r(users_api(), {.base_path = "api/v1/"});
    REQUIRE(r.options().base_path == "/api/v1");

    r.on_request("getUser", [](request_context& ctx) -> task<handler_response> {
        co_return handler_response{200, json::object({{"id", ctx.params["id"]}})};
    });

    REQUIRE(loop.block_on(r.handle(json_request(method::GET, "/api/v1/users/5"))).status_code() == 200);
    REQUIRE(loop.block_on(r.handle(json_request(method::GET, "/users/5"))).status_code() == 404);
    REQUIRE(loop.block_on(r.handle(json_request(method::GET, "/api/v1x/users/5"))).status_code() == 404);

    REQUIRE(normalize_base_path("/") == "");
    REQUIRE(normalize_base_path("") == "");
}

TEST_CASE("handler failures become 500", "[router]") {
    event_loop loop;
    router r(users_api());

    SECTION("exception") {
        r.on_request("getUser", [](request_context&) -> task<handler_response> {
            throw std::runtime_error("database down");
            co_return handler_response{};
        });
        auto resp = loop.block_on(r.handle(json_request(method::GET, "/users/1")));
        REQUIRE(resp.status_code() == 500);
        REQUIRE(body_of(resp)["error"].asString() == "Internal Server Error");
    }

    SECTION("response contract violation") {
        r.on_request("getUser", [](request_context&) -> task<handler_response> {
            co_return handler_response{200, json::object({{"id", "not a number"}})};
        });
        auto resp = loop.block_on(r.handle(json_request(method::GET, "/users/1")));
        REQUIRE(resp.status_code() == 500);
    }

    SECTION("validation error thrown by the handler") {
        r.on_request("getUser", [](request_context&) -> task<handler_response> {
            throw contract::request_validation_error("params", {{"custom", {"id"}, "Unknown user"}});
            co_return handler_response{};
        });
        auto resp = loop.block_on(r.handle(json_request(method::GET, "/users/1")));
        REQUIRE(resp.status_code() == 400);
        REQUIRE(body_of(resp)["field"].asString() == "params");
    }
}

TEST_CASE("undeclared status passes through", "[router]") {
    event_loop loop;
    router r(users_api());
    r.on_request("getUser", [](request_context&) -> task<handler_response> {
        co_return handler_response{404, json::object({{"error", "No such user"}})};
    });

    auto resp = loop.block_on(r.handle(json_request(method::GET, "/users/7")));
    REQUIRE(resp.status_code() == 404);
    REQUIRE(body_of(resp)["error"].asString() == "No such user");
}

TEST_CASE("binding checks", "[router]") {
    router r(users_api());

    SECTION("unknown endpoint") {
        REQUIRE_THROWS_AS(r.on_request("nope", [](request_context&) -> task<handler_response> {
            co_return handler_response{};
        }), contract::contract_error);
    }

    SECTION("transport mismatch") {
        REQUIRE_THROWS_AS(r.on_request("logs", [](request_context&) -> task<handler_response> {
            co_return handler_response{};
        }), contract::contract_error);
        REQUIRE_THROWS_AS(r.on_events("getUser", idle_events()), contract::contract_error);
    }

    SECTION("incomplete binding names the missing endpoints") {
        r.on_events("logs", idle_events());
        try {
            r.check_complete();
            FAIL("check_complete accepted an incomplete router");
        } catch (const contract::contract_error& e) {
            std::string message = e.what();
            REQUIRE(message.find("createUser") != std::string::npos);
            REQUIRE(message.find("getUser") != std::string::npos);
            REQUIRE(message.find("logs") == std::string::npos);
        }
    }

    SECTION("message endpoints need a message hook") {
        auto api = std::make_shared<const contract::registry>(std::vector<contract::endpoint_definition>{
            {.name = "chat", .path = "/chat", .payload = contract::message_payload{}},
        });
        router chat(api);
        REQUIRE_THROWS_AS(chat.on_message("chat", message_handlers{}), contract::contract_error);
    }
}

TEST_CASE("streaming endpoints are rejected by the standard pipeline", "[router]") {
    event_loop loop;
    router r(users_api());
    r.on_events("logs", idle_events());

    auto resp = loop.block_on(r.handle(json_request(method::GET, "/logs")));
    REQUIRE(resp.status_code() == 400);
    REQUIRE(body_of(resp)["message"].asString() == "Endpoint 'logs' uses the event-stream transport");
}

TEST_CASE("unbound endpoint is a 500", "[router]") {
    event_loop loop;
    router r(users_api());

    auto resp = loop.block_on(r.handle(json_request(method::GET, "/users/1")));
    REQUIRE(resp.status_code() == 500);
}

TEST_CASE("context factory feeds every handler", "[router][context]") {
    event_loop loop;
    std::string seen;

    router_options options;
    options.make_context = [](const http::request& req, const contract::endpoint_definition& ep) {
        return json::object({{"user", std::string(req.header("X-User"))}, {"endpoint", ep.name}});
    };
    router r(users_api(), options);
    r.on_request("getUser", [&](request_context& ctx) -> task<handler_response> {
        seen = ctx.context["user"].asString() + "@" + ctx.context["endpoint"].asString();
        co_return handler_response{200, json::object({{"id", 1}})};
    });

    auto req = json_request(method::GET, "/users/1");
    req.set_header("X-User", "grace");
    REQUIRE(loop.block_on(r.handle(req)).status_code() == 200);
    REQUIRE(seen == "grace@getUser");

    SECTION("a failing factory is a 500") {
        router_options failing;
        failing.make_context = [](const http::request&, const contract::endpoint_definition&) -> Json::Value {
            throw std::runtime_error("session store offline");
        };
        router broken(users_api(), failing);
        broken.on_request("getUser", [](request_context&) -> task<handler_response> {
            co_return handler_response{200, json::object({{"id", 1}})};
        });
        REQUIRE(loop.block_on(broken.handle(req)).status_code() == 500);
    }
}
