/// @file crud_client.cpp
/// @brief Typed client for the todo contract
///
/// Calls crud_server by endpoint name. Request data is checked before it is
/// sent, and declared responses are checked when they arrive.
///
/// Usage: ./crud_client [base_url]
/// Default: http://127.0.0.1:8080/api

#include <accord/accord.hpp>

#include "todo_contract.hpp"

#include <iostream>
#include <string>

using namespace accord;

coro::task<void> run_client(std::string base_url) {
    client::http_client api(examples::todo_api(), {.base_url = base_url});

    auto body_1 = json::object({{"title", "try accord"}});
    auto created = co_await api.call("createTodo", {.body = body_1});
    std::cout << "Created: " << json::to_string(created.data) << std::endl;
    auto id = std::to_string(created.data["id"].asInt64());

    auto params_2 = json::object({{"id", id}});
    auto done = co_await api.call("completeTodo", {.params = params_2});
    std::cout << "Completed: " << json::to_string(done.data) << std::endl;

    auto query_3 = json::object({{"done", "false"}});
    auto open = co_await api.call("listTodos", {.query = query_3});
    std::cout << "Open todos: " << open.data["items"].size() << std::endl;

    // A declared 404 comes back as a normal response
    auto params_4 = json::object({{"id", "999"}});
    auto missing = co_await api.call("getTodo", {.params = params_4});
    std::cout << "GET /todos/999 -> " << missing.status << " " << missing.data["error"].asString() << std::endl;

    // Invalid input never leaves the process
    try {
        auto body_5 = json::object({{"title", ""}});
        co_await api.call("createTodo", {.body = body_5});
    } catch (const client::client_validation_error& e) {
        std::cout << "Rejected locally: " << e.what() << " "
                  << json::to_string(contract::to_json(e.issues())) << std::endl;
    }

    auto params_6 = json::object({{"id", id}});
    co_await api.call("deleteTodo", {.params = params_6});
    std::cout << "Deleted todo " << id << std::endl;
}

int main(int argc, char* argv[]) {
    std::string base_url = "http://127.0.0.1:8080/api";
    if (argc > 1) {
        base_url = argv[1];
    }

    runtime::event_loop loop;
    try {
        loop.block_on(run_client(base_url));
    } catch (const client::http_error& e) {
        ACCORD_LOG_ERROR("{} {}", e.what(), json::to_string(e.body()));
        return 1;
    } catch (const client::client_error& e) {
        ACCORD_LOG_ERROR("Request failed: {}", e.what());
        return 1;
    }
    return 0;
}
