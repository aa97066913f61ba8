/// @file crud_server.cpp
/// @brief Contract-driven CRUD service
///
/// Serves the todo contract from todo_contract.hpp. Every request is checked
/// against the contract before a handler runs, and every declared response
/// is checked before it is written.
///
/// Usage: ./crud_server [port]
/// Default: Port 8080
///
/// Try:
///   curl -X POST localhost:8080/api/todos -H 'Content-Type: application/json' -d '{"title":"write docs"}'
///   curl localhost:8080/api/todos/1
///   curl localhost:8080/api/todos?done=false
///   curl -X DELETE localhost:8080/api/todos/1

#include <accord/accord.hpp>

#include "todo_contract.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <map>
#include <memory>
#include <string>

using namespace accord;

// Global flag for graceful shutdown
std::atomic<bool> g_running{true};

void signal_handler(int) {
    g_running = false;
}

/// Handler-owned state; the server never looks inside it
struct todo_store {
    std::map<Json::Int64, Json::Value> todos;
    Json::Int64 next_id = 1;
};

/// Stops the server once a signal has been seen
coro::task<void> shutdown_watch(server::server& srv) {
    while (g_running) {
        co_await time::sleep_for(std::chrono::milliseconds(200));
    }
    ACCORD_LOG_INFO("Shutting down...");
    srv.stop();
}

server::router make_router(std::shared_ptr<todo_store> store) {
    server::router r(examples::todo_api(), {.base_path = "/api"});

    r.on_request("listTodos", [store](server::request_context& ctx) -> coro::task<server::handler_response> {
        Json::Value items(Json::arrayValue);
        for (const auto& [id, todo] : store->todos) {
            if (ctx.query.isMember("done") && ctx.query["done"].asBool() != todo["done"].asBool()) {
                continue;
            }
            items.append(todo);
        }
        co_return server::handler_response{200, json::object({{"items", items}})};
    });

    r.on_request("createTodo", [store](server::request_context& ctx) -> coro::task<server::handler_response> {
        auto id = store->next_id++;
        Json::Value todo = json::object({{"id", id}, {"title", ctx.body["title"]}, {"done", false}});
        store->todos[id] = todo;
        ACCORD_LOG_INFO("Created todo {}: {}", id, ctx.body["title"].asString());
        co_return server::handler_response{201, todo};
    });

    r.on_request("getTodo", [store](server::request_context& ctx) -> coro::task<server::handler_response> {
        auto it = store->todos.find(ctx.params["id"].asInt64());
        if (it == store->todos.end()) {
            co_return server::handler_response{404, json::object({{"error", "Todo not found"}})};
        }
        co_return server::handler_response{200, it->second};
    });

    r.on_request("completeTodo", [store](server::request_context& ctx) -> coro::task<server::handler_response> {
        auto it = store->todos.find(ctx.params["id"].asInt64());
        if (it == store->todos.end()) {
            co_return server::handler_response{404, json::object({{"error", "Todo not found"}})};
        }
        it->second["done"] = true;
        co_return server::handler_response{200, it->second};
    });

    r.on_request("deleteTodo", [store](server::request_context& ctx) -> coro::task<server::handler_response> {
        store->todos.erase(ctx.params["id"].asInt64());
        co_return server::handler_response{204, Json::Value()};
    });

    return r;
}

int main(int argc, char* argv[]) {
    uint16_t port = 8080;
    if (argc > 1) {
        port = static_cast<uint16_t>(std::stoi(argv[1]));
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    server::server srv(make_router(std::make_shared<todo_store>()));
    if (!srv.bind(net::ipv4_address(port))) {
        return 1;
    }

    runtime::event_loop loop;
    loop.go(shutdown_watch(srv));
    ACCORD_LOG_INFO("Press Ctrl+C to stop");
    loop.block_on(srv.serve());
    return 0;
}
