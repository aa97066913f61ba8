#include <catch2/catch.hpp>
#include <accord/client/errors.hpp>
#include <accord/client/http_client.hpp>
#include <accord/contract/registry.hpp>
#include <accord/coro/task.hpp>
#include <accord/json/codec.hpp>
#include <accord/server/router.hpp>
#include <accord/server/server.hpp>

#include "../support/fake_schemas.hpp"
#include "../support/loopback.hpp"
#include "../test_main.cpp"  // For scaled timeouts

#include <map>
#include <memory>
#include <string>

using namespace accord;
using accord::coro::task;
using accord::http::method;

namespace {

std::shared_ptr<const contract::registry> users_api() {
    auto user = test::object_schema({{"id", Json::intValue}, {"name"}});
    return std::make_shared<const contract::registry>(std::vector<contract::endpoint_definition>{
        {
            .name = "createUser",
            .method = method::POST,
            .path = "/users",
            .payload = contract::standard_payload{
                .body = test::object_schema({{"name"}}),
                .responses = {{201, user}},
            },
        },
        {
            .name = "getUser",
            .method = method::GET,
            .path = "/users/:id",
            .params = test::integer_field_schema("id"),
            .payload = contract::standard_payload{
                .responses = {{200, user}, {404, test::object_schema({{"error"}})}},
            },
        },
        {
            .name = "listUsers",
            .method = method::GET,
            .path = "/users",
            .payload = contract::standard_payload{},
        },
        {
            .name = "deleteUser",
            .method = method::DELETE_,
            .path = "/users/:id",
            .params = test::integer_field_schema("id"),
            .payload = contract::standard_payload{},
        },
        {
            .name = "readme",
            .path = "/readme",
            .payload = contract::standard_payload{},
        },
    });
}

/// In-memory user store behind the handlers
struct user_store {
    std::map<Json::Int64, std::string> users;
    Json::Int64 next_id = 1;
};

server::router users_router(std::shared_ptr<const contract::registry> api,
                            std::shared_ptr<user_store> store,
                            server::router_options options = {}) {
    server::router r(std::move(api), std::move(options));
    r.on_request("createUser", [store](server::request_context& ctx) -> task<server::handler_response> {
        auto id = store->next_id++;
        store->users[id] = ctx.body["name"].asString();
        co_return server::handler_response{201, json::object({{"id", id}, {"name", ctx.body["name"]}})};
    });
    r.on_request("getUser", [store](server::request_context& ctx) -> task<server::handler_response> {
        auto it = store->users.find(ctx.params["id"].asInt64());
        if (it == store->users.end()) {
            co_return server::handler_response{404, json::object({{"error", "User not found"}})};
        }
        co_return server::handler_response{200, json::object({{"id", it->first}, {"name", it->second}})};
    });
    r.on_request("listUsers", [store](server::request_context& ctx) -> task<server::handler_response> {
        Json::Value out(Json::arrayValue);
        for (const auto& [id, name] : store->users) {
            out.append(json::object({{"id", id}, {"name", name}}));
        }
        Json::Value body = json::object({{"users", out}, {"query", ctx.query}});
        co_return server::handler_response{200, body};
    });
    r.on_request("deleteUser", [store](server::request_context& ctx) -> task<server::handler_response> {
        if (store->users.erase(ctx.params["id"].asInt64()) == 0) {
            co_return server::handler_response{409, json::object({{"error", "No such user"}})};
        }
        co_return server::handler_response{204, Json::Value()};
    });
    r.on_request("readme", [](server::request_context&) -> task<server::handler_response> {
        http::headers h;
        h.set("Content-Type", "text/plain");
        co_return server::handler_response{200, "# accord\n", h};
    });
    return r;
}

} // namespace

TEST_CASE("client and server agree on a CRUD contract", "[integration][http]") {
    auto api = users_api();
    auto store = std::make_shared<user_store>();
    server::server srv(users_router(api, store));

    auto body = [&](uint16_t port) -> task<void> {
        client::http_client client(api, {.base_url = test::loopback_url(port)});

        auto body_1 = json::object({{"name", "Ada"}});
        auto created = co_await client.call("createUser", {.body = body_1});
        REQUIRE(created.status == 201);
        REQUIRE(created.data["id"].asInt64() == 1);
        REQUIRE(created.data["name"].asString() == "Ada");

        auto params_2 = json::object({{"id", "1"}});
        auto fetched = co_await client.call("getUser", {.params = params_2});
        REQUIRE(fetched.status == 200);
        REQUIRE(fetched.data["name"].asString() == "Ada");

        // Declared error status is returned, not thrown
        auto params_3 = json::object({{"id", "99"}});
        auto missing = co_await client.call("getUser", {.params = params_3});
        REQUIRE(missing.status == 404);
        REQUIRE(missing.data["error"].asString() == "User not found");

        auto query_4 = json::object({{"tag", json::array({"a", "b"})}});
        auto listed = co_await client.call("listUsers", {.query = query_4});
        REQUIRE(listed.data["users"].size() == 1);
        REQUIRE(listed.data["query"]["tag"].size() == 2);

        auto params_5 = json::object({{"id", "1"}});
        auto deleted = co_await client.call("deleteUser", {.params = params_5});
        REQUIRE(deleted.status == 204);
        REQUIRE(deleted.data.isObject());
        REQUIRE(deleted.data.empty());

        auto readme = co_await client.call("readme");
        REQUIRE(readme.data.asString() == "# accord\n");
    };
    test::run_against(srv, body);

    REQUIRE(store->users.empty());
}

TEST_CASE("undeclared error status throws http_error", "[integration][http]") {
    auto api = users_api();
    auto store = std::make_shared<user_store>();
    server::server srv(users_router(api, store));

    auto body = [&](uint16_t port) -> task<void> {
        client::http_client client(api, {.base_url = test::loopback_url(port)});
        bool thrown = false;
        try {
            auto params_6 = json::object({{"id", "5"}});
            co_await client.call("deleteUser", {.params = params_6});
        } catch (const client::http_error& e) {
            thrown = true;
            REQUIRE(e.status() == 409);
            REQUIRE(e.body()["error"].asString() == "No such user");
            REQUIRE(std::string(e.what()) == "HTTP Error 409: Conflict");
        }
        REQUIRE(thrown);
    };
    test::run_against(srv, body);
}

TEST_CASE("client validation stops bad requests before sending", "[integration][http]") {
    auto api = users_api();
    auto store = std::make_shared<user_store>();
    server::server srv(users_router(api, store));

    auto body = [&](uint16_t port) -> task<void> {
        client::http_client strict(api, {.base_url = test::loopback_url(port)});
        bool thrown = false;
        try {
            auto body_7 = json::object({{"nickname", "x"}});
            co_await strict.call("createUser", {.body = body_7});
        } catch (const client::client_validation_error& e) {
            thrown = true;
            REQUIRE(e.field() == "body");
        }
        REQUIRE(thrown);
        REQUIRE(store->users.empty());

        // With client checks off the server answers 400 with the same field
        client::http_client lax(api, {.base_url = test::loopback_url(port), .validate_request = false});
        bool rejected = false;
        try {
            auto body_8 = json::object({{"nickname", "x"}});
            co_await lax.call("createUser", {.body = body_8});
        } catch (const client::http_error& e) {
            rejected = true;
            REQUIRE(e.status() == 400);
            REQUIRE(e.body()["field"].asString() == "body");
        }
        REQUIRE(rejected);
        REQUIRE(store->users.empty());
    };
    test::run_against(srv, body);
}

TEST_CASE("client validates responses against its own contract", "[integration][http]") {
    // The server declares no response schema for getUser; the client does
    auto server_api = std::make_shared<const contract::registry>(std::vector<contract::endpoint_definition>{
        {.name = "getUser", .path = "/users/:id", .payload = contract::standard_payload{}},
    });
    server::router r(server_api);
    r.on_request("getUser", [](server::request_context&) -> task<server::handler_response> {
        co_return server::handler_response{200, json::object({{"id", "not-a-number"}})};
    });
    server::server srv(std::move(r));

    auto client_api = std::make_shared<const contract::registry>(std::vector<contract::endpoint_definition>{
        {.name = "getUser", .path = "/users/:id",
         .payload = contract::standard_payload{.responses = {{200, test::object_schema({{"id", Json::intValue}})}}}},
    });

    auto body = [&](uint16_t port) -> task<void> {
        client::http_client checked(client_api, {.base_url = test::loopback_url(port)});
        bool thrown = false;
        try {
            auto params_9 = json::object({{"id", 1}});
            co_await checked.call("getUser", {.params = params_9});
        } catch (const client::client_validation_error& e) {
            thrown = true;
            REQUIRE(e.field() == "response[200]");
        }
        REQUIRE(thrown);

        client::http_client unchecked(client_api, {.base_url = test::loopback_url(port), .validate_response = false});
        auto params_10 = json::object({{"id", 1}});
        auto resp = co_await unchecked.call("getUser", {.params = params_10});
        REQUIRE(resp.data["id"].asString() == "not-a-number");
    };
    test::run_against(srv, body);
}

TEST_CASE("base path and context factory", "[integration][http]") {
    auto api = users_api();
    auto store = std::make_shared<user_store>();
    store->users[7] = "Grace";

    server::router_options options{
        .base_path = "/api",
        .make_context = [](const http::request& req, const contract::endpoint_definition&) {
            return json::object({{"trace", std::string(req.header("X-Trace"))}});
        },
    };
    auto r = users_router(api, store, options);
    std::string seen_trace;
    r.on_request("readme", [&](server::request_context& ctx) -> task<server::handler_response> {
        seen_trace = ctx.context["trace"].asString();
        co_return server::handler_response{200, "ok"};
    });
    server::server srv(std::move(r));

    auto body = [&](uint16_t port) -> task<void> {
        client::http_client client(api, {.base_url = test::loopback_url(port) + "/api"});
        auto params_11 = json::object({{"id", "7"}});
        auto user = co_await client.call("getUser", {.params = params_11});
        REQUIRE(user.data["name"].asString() == "Grace");

        auto headers_12 = json::object({{"X-Trace", "t-1"}});
        co_await client.call("readme", {.headers = headers_12});
    };
    test::run_against(srv, body);

    REQUIRE(seen_trace == "t-1");
}

TEST_CASE("raw protocol edge cases", "[integration][http]") {
    auto api = users_api();
    auto store = std::make_shared<user_store>();
    server::server srv(users_router(api, store), {.max_request_size = 1024});

    std::string not_found, too_large, huge_chunk, malformed, pipelined;

    auto body = [&](uint16_t port) -> task<void> {
        not_found = co_await test::raw_exchange(port,
            "GET /nowhere HTTP/1.1\r\nHost: x\r\nConnection: close\r\n\r\n");
        too_large = co_await test::raw_exchange(port,
            "GET /users HTTP/1.1\r\nHost: x\r\nX-Padding: " + std::string(2000, 'p') + "\r\n\r\n");
        huge_chunk = co_await test::raw_exchange(port,
            "POST /users HTTP/1.1\r\nHost: x\r\nTransfer-Encoding: chunked\r\n\r\nFFFFFFFFFFFFFFFF\r\nabc");
        malformed = co_await test::raw_exchange(port, "NONSENSE\r\n\r\n");
        pipelined = co_await test::raw_exchange(port,
            "GET /users HTTP/1.1\r\nHost: x\r\n\r\n"
            "GET /readme HTTP/1.1\r\nHost: x\r\nConnection: close\r\n\r\n");
    };
    test::run_against(srv, body);

    REQUIRE(not_found.starts_with("HTTP/1.1 404"));
    REQUIRE(not_found.find("Route not found: GET /nowhere") != std::string::npos);
    REQUIRE(too_large.starts_with("HTTP/1.1 413"));
    REQUIRE(huge_chunk.starts_with("HTTP/1.1 413"));
    REQUIRE(malformed.starts_with("HTTP/1.1 400"));

    // Both responses arrive on one keep-alive connection, in order
    auto first = pipelined.find("HTTP/1.1 200");
    auto second = pipelined.find("HTTP/1.1 200", first + 1);
    REQUIRE(first == 0);
    REQUIRE(second != std::string::npos);
    REQUIRE(pipelined.find("# accord") > second);
}

TEST_CASE("stop ends serve once idle connections are gone", "[integration][http]") {
    auto api = users_api();
    auto store = std::make_shared<user_store>();
    server::server srv(users_router(api, store));

    auto body = [&](uint16_t port) -> task<void> {
        // An idle keep-alive connection must not hold serve() open
        auto idle = co_await net::tcp_connect("127.0.0.1", port);
        REQUIRE(idle.has_value());
        co_await time::sleep_for(test::scaled_ms(20));
        REQUIRE(srv.active_connections() == 1);
    };
    test::run_against(srv, body);

    REQUIRE(srv.active_connections() == 0);
    REQUIRE_FALSE(srv.is_running());
}
