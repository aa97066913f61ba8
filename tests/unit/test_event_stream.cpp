#include <catch2/catch.hpp>
#include <accord/coro/task.hpp>
#include <accord/json/codec.hpp>
#include <accord/runtime/event_loop.hpp>
#include <accord/server/event_stream.hpp>
#include <accord/time/timer.hpp>

#include "../support/memory_sink.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

using namespace accord;
using namespace accord::server;
using accord::coro::task;
using accord::runtime::event_loop;

TEST_CASE("format_event writes one event block", "[event_stream]") {
    REQUIRE(format_event("update", json::object({{"n", 1}})) == "event: update\ndata: {\"n\":1}\n\n");
    REQUIRE(format_event("line", Json::Value("a\nb")) == "event: line\ndata: \"a\\nb\"\n\n");

    auto head = event_stream_head();
    REQUIRE(head.status_code() == 200);
    REQUIRE(head.content_type() == "text/event-stream");
    REQUIRE(head.header("Cache-Control") == "no-cache");
}

TEST_CASE("events arrive in order and stop at disconnect", "[event_stream]") {
    event_loop loop;
    auto record = std::make_shared<test::sink_record>();
    bool cleaned_up = false;
    bool late_send = true;

    event_stream_handler handler = [&](event_stream_context& ctx) -> task<cleanup_action> {
        auto payload_1 = json::object({{"v", "X"}});
        co_await ctx.emitter.send("tick", payload_1);
        auto payload_2 = json::object({{"v", "Y"}});
        co_await ctx.emitter.send("tick", payload_2);
        co_await ctx.signal.cancelled();
        auto payload_3 = json::object({{"v", "Z"}});
        late_send = co_await ctx.emitter.send("tick", payload_3);
        co_return [&] { cleaned_up = true; };
    };

    auto driver = [&]() -> task<void> {
        auto conn = test::memory_connection(record);
        auto& l = runtime::event_loop::require();
        auto stream = l.spawn(run_event_stream(conn, handler, "ticks", validated_request{}, Json::Value()));

        co_await time::yield();
        co_await conn->flush();
        REQUIRE(record->frames.size() == 2);

        // Peer went away
        conn->abort();
        co_await stream;
    };
    loop.block_on(driver());

    REQUIRE(record->joined() ==
            "event: tick\ndata: {\"v\":\"X\"}\n\n"
            "event: tick\ndata: {\"v\":\"Y\"}\n\n");
    REQUIRE_FALSE(late_send);
    REQUIRE(cleaned_up);
}

TEST_CASE("handler completion closes the stream", "[event_stream]") {
    event_loop loop;
    auto record = std::make_shared<test::sink_record>();
    bool cleaned_up = false;
    std::string seen_name, seen_id, seen_user;

    event_stream_handler handler = [&](event_stream_context& ctx) -> task<cleanup_action> {
        seen_name = ctx.endpoint_name;
        seen_id = ctx.params["id"].asString();
        seen_user = ctx.context["user"].asString();
        co_await ctx.emitter.send("done", Json::Value(true));
        co_return [&] { cleaned_up = true; };
    };

    auto driver = [&]() -> task<void> {
        auto conn = test::memory_connection(record);
        validated_request input;
        input.params["id"] = "7";
        auto payload_4 = json::object({{"user", "ada"}});
        co_await run_event_stream(conn, handler, "once", std::move(input), payload_4);
        REQUIRE(conn->state() == connection_state::closed);
    };
    loop.block_on(driver());

    REQUIRE(seen_name == "once");
    REQUIRE(seen_id == "7");
    REQUIRE(seen_user == "ada");
    REQUIRE(record->joined() == "event: done\ndata: true\n\n");
    REQUIRE(record->closed);
    REQUIRE(cleaned_up);
}

TEST_CASE("a throwing handler still delivers the events it sent", "[event_stream]") {
    event_loop loop;
    auto record = std::make_shared<test::sink_record>();
    std::optional<coro::cancel_token> signal;
    bool x_sent = false, y_sent = false;
    std::weak_ptr<connection> weak;

    event_stream_handler handler = [&](event_stream_context& ctx) -> task<cleanup_action> {
        signal = ctx.signal;
        x_sent = co_await ctx.emitter.send("log", Json::Value("X"));
        y_sent = co_await ctx.emitter.send("log", Json::Value("Y"));
        throw std::runtime_error("boom");
    };

    auto driver = [&]() -> task<void> {
        auto conn = test::memory_connection(record);
        weak = conn;
        co_await run_event_stream(conn, handler, "broken", validated_request{}, Json::Value());
        REQUIRE(conn->state() == connection_state::closed);
    };
    loop.block_on(driver());

    REQUIRE(x_sent);
    REQUIRE(y_sent);
    REQUIRE(record->joined() ==
            "event: log\ndata: \"X\"\n\n"
            "event: log\ndata: \"Y\"\n\n");
    REQUIRE(signal.has_value());
    REQUIRE(signal->is_cancelled());
    REQUIRE(record->closed);
    REQUIRE(weak.expired());
}
