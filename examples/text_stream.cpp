/// @file text_stream.cpp
/// @brief Incremental text generation over a chunked stream
///
/// Starts a server whose "complete" endpoint streams a reply word by word as
/// NDJSON chunks and finishes with a usage summary. A client in the same
/// process consumes the stream and prints the words as they arrive.
///
/// Usage: ./text_stream [prompt...]
///
/// The server keeps running with --serve [port], for use with curl:
///   curl -N -X POST localhost:8080/complete -H 'Content-Type: application/json' -d '{"prompt":"hello"}'

#include <accord/accord.hpp>

#include <chrono>
#include <expected>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace accord;
using namespace std::chrono_literals;

namespace {

contract::schema_ptr prompt_schema() {
    return contract::make_schema([](const Json::Value& input) -> std::expected<Json::Value, contract::issues> {
        if (!input["prompt"].isString() || input["prompt"].asString().empty()) {
            return std::unexpected(contract::issues{{"invalid_type", {"prompt"}, "Prompt is required"}});
        }
        return input;
    });
}

contract::schema_ptr token_schema() {
    return contract::make_schema([](const Json::Value& input) -> std::expected<Json::Value, contract::issues> {
        if (!input["text"].isString()) {
            return std::unexpected(contract::issues{{"invalid_type", {"text"}, "Expected string"}});
        }
        return input;
    });
}

std::shared_ptr<const contract::registry> completion_api() {
    return std::make_shared<const contract::registry>(std::vector<contract::endpoint_definition>{
        {
            .name = "complete",
            .method = http::method::POST,
            .path = "/complete",
            .payload = contract::chunk_stream_payload{
                .body = prompt_schema(),
                .chunk = token_schema(),
            },
        },
    });
}

std::vector<std::string> words_of(const std::string& text) {
    std::istringstream in(text);
    std::vector<std::string> words;
    for (std::string w; in >> w;) {
        words.push_back(w);
    }
    return words;
}

coro::task<void> complete(server::chunk_stream_context& ctx) {
    auto prompt = ctx.body["prompt"].asString();
    auto words = words_of("You said: " + prompt + ". Streaming one word at a time keeps latency low.");

    size_t sent = 0;
    for (const auto& w : words) {
        // Stop producing once the client is gone
        if (!ctx.stream.is_open()) {
            ACCORD_LOG_INFO("Client left after {} of {} words", sent, words.size());
            co_return;
        }
        auto payload_1 = json::object({{"text", w + " "}});
        co_await ctx.stream.send(payload_1);
        ++sent;
        co_await time::sleep_for(80ms, ctx.signal);
    }
    ctx.stream.close(json::object({{"words", static_cast<Json::UInt64>(sent)}}));
}

server::router make_router() {
    server::router r(completion_api());
    r.on_chunks("complete", complete);
    return r;
}

coro::task<void> run_demo(server::server& srv, std::string prompt) {
    auto& loop = runtime::event_loop::require();
    auto serving = loop.spawn(srv.serve());

    client::http_client api(completion_api(), {.base_url = "http://127.0.0.1:" + std::to_string(srv.port())});
    try {
        auto body_2 = json::object({{"prompt", prompt}});
        auto usage = co_await api.stream_chunks("complete", {.body = body_2},
                                                [](const Json::Value& chunk) {
            std::cout << chunk["text"].asString() << std::flush;
        });
        std::cout << std::endl;
        if (usage) {
            std::cout << "Usage: " << json::to_string(*usage) << std::endl;
        }
    } catch (const client::client_error& e) {
        ACCORD_LOG_ERROR("Stream failed: {}", e.what());
    }

    srv.stop();
    co_await serving;
}

} // namespace

int main(int argc, char* argv[]) {
    server::server srv(make_router(), {.enable_logging = false});
    runtime::event_loop loop;

    if (argc > 1 && std::string(argv[1]) == "--serve") {
        uint16_t port = argc > 2 ? static_cast<uint16_t>(std::stoi(argv[2])) : 8080;
        if (!srv.bind(net::ipv4_address(port))) {
            return 1;
        }
        loop.block_on(srv.serve());
        return 0;
    }

    std::string prompt;
    for (int i = 1; i < argc; ++i) {
        prompt += (i > 1 ? " " : "") + std::string(argv[i]);
    }
    if (prompt.empty()) {
        prompt = "hello accord";
    }

    if (!srv.bind(net::ipv4_address("127.0.0.1", 0))) {
        return 1;
    }
    loop.block_on(run_demo(srv, prompt));
    return 0;
}
