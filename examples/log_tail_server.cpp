/// @file log_tail_server.cpp
/// @brief Push-event log tail with a heartbeat
///
/// Each subscriber gets a stream of synthetic log lines at the level it asks
/// for, plus a heartbeat event every few seconds. The stream ends when the
/// client goes away; the handler notices through its cancellation signal.
///
/// Usage: ./log_tail_server [port]
/// Default: Port 8080
///
/// Try:
///   curl -N localhost:8080/logs?level=warn

#include <accord/accord.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <csignal>
#include <ctime>
#include <expected>
#include <memory>
#include <string>

using namespace accord;
using namespace std::chrono_literals;

std::atomic<bool> g_running{true};

void signal_handler(int) {
    g_running = false;
}

namespace {

constexpr std::array<const char*, 3> levels{"info", "warn", "error"};

int level_rank(const std::string& level) {
    for (size_t i = 0; i < levels.size(); ++i) {
        if (level == levels[i]) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

/// ?level=info|warn|error, defaulting to info
contract::schema_ptr tail_query() {
    return contract::make_schema([](const Json::Value& input) -> std::expected<Json::Value, contract::issues> {
        std::string level = input.get("level", "info").asString();
        if (level_rank(level) < 0) {
            return std::unexpected(contract::issues{{"invalid_enum_value", {"level"}, "Expected info, warn or error"}});
        }
        return json::object({{"level", level}});
    });
}

std::shared_ptr<const contract::registry> log_api() {
    return std::make_shared<const contract::registry>(std::vector<contract::endpoint_definition>{
        {
            .name = "tailLogs",
            .path = "/logs",
            .query = tail_query(),
            .payload = contract::event_stream_payload{
                .events = {{"line", nullptr}, {"heartbeat", nullptr}},
            },
        },
    });
}

/// Sends a heartbeat until the stream closes
coro::task<void> heartbeat(server::event_emitter emitter, coro::cancel_token signal) {
    while (!signal.is_cancelled()) {
        co_await time::sleep_for(3s, signal);
        auto payload_1 = json::object({{"ts", static_cast<Json::Int64>(std::time(nullptr))}});
        if (!co_await emitter.send("heartbeat", payload_1)) {
            break;
        }
    }
}

coro::task<server::cleanup_action> tail_logs(server::event_stream_context& ctx) {
    int min_rank = level_rank(ctx.query["level"].asString());
    auto subscriber = std::make_shared<int>(0);
    ACCORD_LOG_INFO("Log subscriber attached (level >= {})", ctx.query["level"].asString());

    runtime::event_loop::require().go(heartbeat(ctx.emitter, ctx.signal));

    uint64_t seq = 0;
    while (ctx.emitter.is_open()) {
        ++seq;
        int rank = static_cast<int>(seq % 5 == 0 ? 2 : seq % 3 == 0 ? 1 : 0);
        if (rank >= min_rank) {
            ++*subscriber;
            auto payload_2 = json::object({
                {"seq", static_cast<Json::UInt64>(seq)},
                {"level", levels[static_cast<size_t>(rank)]},
                {"message", "synthetic event #" + std::to_string(seq)},
            });
            co_await ctx.emitter.send("line", payload_2);
        }
        co_await time::sleep_for(500ms, ctx.signal);
    }

    co_return [subscriber] {
        ACCORD_LOG_INFO("Log subscriber detached after {} lines", *subscriber);
    };
}

coro::task<void> shutdown_watch(server::server& srv) {
    while (g_running) {
        co_await time::sleep_for(200ms);
    }
    ACCORD_LOG_INFO("Shutting down...");
    srv.stop();
}

} // namespace

int main(int argc, char* argv[]) {
    uint16_t port = 8080;
    if (argc > 1) {
        port = static_cast<uint16_t>(std::stoi(argv[1]));
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    server::router r(log_api());
    r.on_events("tailLogs", tail_logs);

    server::server srv(std::move(r));
    if (!srv.bind(net::ipv4_address(port))) {
        return 1;
    }

    runtime::event_loop loop;
    loop.go(shutdown_watch(srv));
    loop.block_on(srv.serve());
    return 0;
}
