#pragma once

/// @file sink.hpp
/// @brief Exclusive write capability of a long-lived connection

#include <accord/coro/cancel_token.hpp>
#include <accord/coro/task.hpp>
#include <accord/net/tcp.hpp>

#include <string>
#include <utility>

namespace accord::server {

/// Outcome of one sink write
struct write_result {
    bool ok = true;              ///< false once the peer is gone
    bool backpressured = false;  ///< the transport had to wait for buffer space
};

/// Ordered byte sink below a connection
///
/// A connection issues at most one write at a time and never writes after
/// close().
class sink {
public:
    virtual ~sink() = default;

    virtual coro::task<write_result> write(std::string data) = 0;

    /// Release the transport; pending and later writes fail
    virtual void close() noexcept = 0;

    virtual bool is_closed() const noexcept = 0;
};

/// Sink writing to an owned TCP stream
class tcp_sink final : public sink {
public:
    explicit tcp_sink(net::tcp_stream stream) : stream_(std::move(stream)) {}

    coro::task<write_result> write(std::string data) override {
        if (!stream_.is_valid()) {
            co_return write_result{false, false};
        }
        auto result = co_await stream_.write_all(std::move(data), closing_.get_token());
        co_return write_result{result.ok(), result.blocked};
    }

    void close() noexcept override {
        closing_.cancel();
        stream_.close();
    }

    bool is_closed() const noexcept override { return !stream_.is_valid(); }

    /// The underlying stream, for the transport's read side
    net::tcp_stream& stream() noexcept { return stream_; }

private:
    net::tcp_stream stream_;
    coro::cancel_source closing_;
};

} // namespace accord::server
