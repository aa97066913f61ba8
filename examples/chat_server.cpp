/// @file chat_server.cpp
/// @brief Chat rooms over the message transport
///
/// Each connection joins the room named in its path and is announced to the
/// other members. Messages are fanned out through the server's topic hub,
/// which never echoes a message back to its sender.
///
/// Usage: ./chat_server [port]
/// Default: Port 8080

#include <accord/accord.hpp>

#include "chat_contract.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <string>

using namespace accord;

std::atomic<bool> g_running{true};

void signal_handler(int) {
    g_running = false;
}

namespace {

std::string topic_of(const server::message_socket& socket) {
    return "room:" + socket.params()["room"].asString();
}

server::message_handlers chat_handlers() {
    server::message_handlers h;

    h.open = [](server::message_socket& socket) -> coro::task<void> {
        auto nick = socket.query()["nick"].asString();
        socket.state_data()["nick"] = nick;
        socket.subscribe(topic_of(socket));
        socket.send("welcome", json::object({{"room", socket.params()["room"]}, {"nick", nick}}));
        auto others = socket.publish(topic_of(socket), "joined", json::object({{"nick", nick}}));
        ACCORD_LOG_INFO("{} joined {} ({} others)", nick, topic_of(socket), others);
        co_return;
    };

    h.message = [](server::message_socket& socket, const server::envelope& msg) -> coro::task<void> {
        auto& nick = socket.state_data()["nick"];
        if (msg.type == "say") {
            socket.publish(topic_of(socket), "said", json::object({{"from", nick}, {"text", msg.payload["text"]}}));
        } else if (msg.type == "rename") {
            socket.publish(topic_of(socket), "left", json::object({{"nick", nick}}));
            nick = msg.payload["nick"];
            socket.publish(topic_of(socket), "joined", json::object({{"nick", nick}}));
        }
        co_return;
    };

    h.close = [](server::message_socket& socket, uint16_t code, const std::string&) {
        const auto& nick = socket.state_data()["nick"];
        if (!nick.isString()) {
            return;
        }
        ACCORD_LOG_INFO("{} left {} (code {})", nick.asString(), topic_of(socket), code);
        socket.publish(topic_of(socket), "left", json::object({{"nick", nick}}));
    };

    return h;
}

coro::task<void> shutdown_watch(server::server& srv) {
    while (g_running) {
        co_await time::sleep_for(std::chrono::milliseconds(200));
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

    server::router r(examples::chat_api());
    r.on_message("chatRoom", chat_handlers());

    server::server srv(std::move(r));
    if (!srv.bind(net::ipv4_address(port))) {
        return 1;
    }

    runtime::event_loop loop;
    loop.go(shutdown_watch(srv));
    ACCORD_LOG_INFO("Join with: ./chat_client ws://127.0.0.1:{} <room> <nick>", port);
    loop.block_on(srv.serve());
    return 0;
}
