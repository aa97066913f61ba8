/// @file chat_client.cpp
/// @brief Scripted chat room member
///
/// Joins a room, says each message given on the command line, listens for a
/// while and leaves. Run two of them against chat_server to watch the fan-out.
///
/// Usage: ./chat_client [base_url] [room] [nick] [message...]
/// Default: ws://127.0.0.1:8080 lobby guest

#include <accord/accord.hpp>

#include "chat_contract.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

using namespace accord;
using namespace std::chrono_literals;

coro::task<void> run_client(std::string base_url, std::string room, std::string nick,
                            std::vector<std::string> lines) {
    auto chat = client::message_client::create(examples::chat_api(), "chatRoom", {
        .base_url = base_url,
        .params = json::object({{"room", room}}),
        .query = json::object({{"nick", nick}}),
    });

    chat->on("welcome", [](const Json::Value& p) {
        std::cout << "* joined " << p["room"].asString() << " as " << p["nick"].asString() << std::endl;
    });
    chat->on("joined", [](const Json::Value& p) {
        std::cout << "* " << p["nick"].asString() << " joined" << std::endl;
    });
    chat->on("left", [](const Json::Value& p) {
        std::cout << "* " << p["nick"].asString() << " left" << std::endl;
    });
    chat->on("said", [](const Json::Value& p) {
        std::cout << "<" << p["from"].asString() << "> " << p["text"].asString() << std::endl;
    });
    chat->on_error([](const std::string& error) {
        std::cerr << "! " << error << std::endl;
    });

    ACCORD_LOG_INFO("Connecting to {}", chat->url());
    co_await chat->connect();

    for (const auto& line : lines) {
        chat->send("say", json::object({{"text", line}}));
        co_await time::sleep_for(300ms);
    }

    // Listen for the rest of the room
    co_await time::sleep_for(5s);
    chat->close(1000, "bye");
    co_await chat->wait_closed();
}

int main(int argc, char* argv[]) {
    std::string base_url = argc > 1 ? argv[1] : "ws://127.0.0.1:8080";
    std::string room = argc > 2 ? argv[2] : "lobby";
    std::string nick = argc > 3 ? argv[3] : "guest";
    std::vector<std::string> lines;
    for (int i = 4; i < argc; ++i) {
        lines.emplace_back(argv[i]);
    }

    runtime::event_loop loop;
    try {
        loop.block_on(run_client(base_url, room, nick, lines));
    } catch (const client::http_error& e) {
        ACCORD_LOG_ERROR("Join refused: {} {}", e.what(), json::to_string(e.body()));
        return 1;
    } catch (const client::client_error& e) {
        ACCORD_LOG_ERROR("Chat failed: {}", e.what());
        return 1;
    }
    return 0;
}
