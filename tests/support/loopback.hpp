#pragma once

/// Runs a test body against a server bound to an ephemeral loopback port

#include <accord/coro/task.hpp>
#include <accord/net/tcp.hpp>
#include <accord/runtime/event_loop.hpp>
#include <accord/server/server.hpp>

#include <fmt/format.h>

#include <cstring>
#include <exception>
#include <stdexcept>
#include <string>

namespace accord::test {

inline std::string loopback_url(uint16_t port, std::string_view scheme = "http") {
    return fmt::format("{}://127.0.0.1:{}", scheme, port);
}

/// Serve @p srv while @p body(port) runs, then stop it and wait for every
/// connection to wind down. Failures inside the body are rethrown.
template<typename Body>
void run_against(server::server& srv, Body& body) {
    runtime::event_loop loop;
    auto bound = srv.bind(net::ipv4_address("127.0.0.1", 0));
    if (!bound) {
        throw std::runtime_error(fmt::format("bind failed: {}", std::strerror(bound.error())));
    }

    auto driver = [&]() -> coro::task<void> {
        auto& l = runtime::event_loop::require();
        auto serving = l.spawn(srv.serve());
        std::exception_ptr failure;
        try {
            co_await body(srv.port());
        } catch (...) {
            failure = std::current_exception();
        }
        srv.stop();
        co_await serving;
        if (failure) {
            std::rethrow_exception(failure);
        }
    };
    loop.block_on(driver());
}

/// Send raw bytes and read until the server closes the connection
inline coro::task<std::string> raw_exchange(uint16_t port, std::string request) {
    auto connected = co_await net::tcp_connect("127.0.0.1", port);
    if (!connected) {
        throw std::runtime_error("connect failed");
    }
    auto sent = co_await connected->write_all(std::move(request));
    if (!sent.ok()) {
        throw std::runtime_error("send failed");
    }
    std::string out;
    char buf[4096];
    for (;;) {
        auto r = co_await connected->read(buf, sizeof(buf));
        if (r.result <= 0) {
            break;
        }
        out.append(buf, static_cast<size_t>(r.result));
    }
    co_return out;
}

} // namespace accord::test
