#include <catch2/catch.hpp>
#include <accord/json/codec.hpp>
#include <accord/server/response_encoder.hpp>

#include "../support/fake_schemas.hpp"

#include <string>

using namespace accord;
using namespace accord::server;

TEST_CASE("declared responses are validated and serialised", "[encoder]") {
    contract::standard_payload ep{.responses = {{200, test::object_schema({{"id", Json::intValue}})}}};

    auto ok = encode_response(ep, {.status = 200, .body = json::object({{"id", 7}})});
    REQUIRE(ok.has_value());
    REQUIRE(ok->status_code() == 200);
    REQUIRE(ok->content_type() == "application/json");
    REQUIRE(ok->body() == "{\"id\":7}");

    auto bad = encode_response(ep, {.status = 200, .body = json::object({{"id", "seven"}})});
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().status() == 200);
    REQUIRE(bad.error().issues()[0].path == std::vector<std::string>{"id"});
}

TEST_CASE("undeclared statuses pass through", "[encoder]") {
    contract::standard_payload ep{.responses = {{200, test::object_schema({{"id", Json::intValue}})}}};

    auto teapot = encode_response(ep, {.status = 418, .body = json::object({{"anything", true}})});
    REQUIRE(teapot.has_value());
    REQUIRE(teapot->status_code() == 418);
    REQUIRE(teapot->body() == "{\"anything\":true}");
}

TEST_CASE("schema output replaces the handler body", "[encoder]") {
    contract::standard_payload ep{.responses = {{200, test::integer_field_schema("count")}}};

    auto resp = encode_response(ep, {.status = 200, .body = json::object({{"count", "3"}})});
    REQUIRE(resp.has_value());
    REQUIRE(resp->body() == "{\"count\":3}");
}

TEST_CASE("204 has no body", "[encoder]") {
    contract::standard_payload ep;

    auto resp = encode_response(ep, {.status = 204, .body = json::object({{"ignored", 1}})});
    REQUIRE(resp.has_value());
    REQUIRE(resp->body().empty());
    REQUIRE_FALSE(resp->get_headers().contains("Content-Type"));
}

TEST_CASE("text bodies are written verbatim under a text type", "[encoder]") {
    contract::standard_payload ep;

    http::headers extra;
    extra.set("Content-Type", "text/plain; charset=utf-8");
    extra.set("Cache-Control", "no-store");
    auto resp = encode_response(ep, {.status = 200, .body = "plain words", .headers = extra});
    REQUIRE(resp.has_value());
    REQUIRE(resp->body() == "plain words");
    REQUIRE(resp->header("Cache-Control") == "no-store");

    // Without a text type the same string is JSON-encoded
    auto quoted = encode_response(ep, {.status = 200, .body = "plain words"});
    REQUIRE(quoted->body() == "\"plain words\"");
}

TEST_CASE("error bodies", "[encoder]") {
    auto validation = validation_error_response(
        contract::request_validation_error("body", {{"invalid_type", {"name"}, "Required"}}));
    REQUIRE(validation.status_code() == 400);
    auto parsed = json::parse(validation.body());
    REQUIRE(parsed.has_value());
    REQUIRE((*parsed)["error"].asString() == "Validation Error");
    REQUIRE((*parsed)["field"].asString() == "body");
    REQUIRE((*parsed)["issues"][0]["path"][0].asString() == "name");

    auto missing = not_found_response(contract::route_not_found("GET", "/nope"));
    REQUIRE(missing.status_code() == 404);
    REQUIRE((*json::parse(missing.body()))["message"].asString() == "Route not found: GET /nope");

    auto internal = internal_error_response();
    REQUIRE(internal.status_code() == 500);
    REQUIRE((*json::parse(internal.body()))["error"].asString() == "Internal Server Error");

    REQUIRE(upgrade_required_response("use a WebSocket").status_code() == 426);
}
