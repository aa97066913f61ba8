#pragma once

#include <accord/coro/cancel_token.hpp>
#include <accord/coro/task.hpp>
#include <accord/log/macros.hpp>
#include <accord/runtime/event_loop.hpp>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <utility>

namespace accord::net {

/// TCP socket options
struct tcp_options {
    bool reuse_addr = true;      ///< SO_REUSEADDR
    bool no_delay = true;        ///< TCP_NODELAY (disable Nagle's algorithm)
    int backlog = 128;           ///< Listen backlog
};

/// Outcome of a stream operation
struct io_result {
    ssize_t result = 0;          ///< Bytes transferred, or -errno
    bool blocked = false;        ///< The operation had to wait for the socket

    [[nodiscard]] bool ok() const noexcept { return result >= 0; }
    [[nodiscard]] int error() const noexcept { return result < 0 ? static_cast<int>(-result) : 0; }
};

/// IPv4 address wrapper
struct ipv4_address {
    uint32_t addr = INADDR_ANY;
    uint16_t port = 0;

    ipv4_address() = default;

    explicit ipv4_address(uint16_t p) : port(p) {}

    /// Construct from IP address or host name and port
    ipv4_address(std::string_view host, uint16_t p) : port(p) {
        if (host.empty() || host == "0.0.0.0") {
            addr = INADDR_ANY;
            return;
        }
        std::string host_str(host);
        if (inet_pton(AF_INET, host_str.c_str(), &addr) == 1) {
            return;
        }
        struct addrinfo hints{};
        struct addrinfo* result = nullptr;
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;
        if (getaddrinfo(host_str.c_str(), nullptr, &hints, &result) == 0 && result) {
            auto* sa = reinterpret_cast<struct sockaddr_in*>(result->ai_addr);
            addr = sa->sin_addr.s_addr;
            freeaddrinfo(result);
        } else {
            ACCORD_LOG_ERROR("Failed to resolve hostname: {}", host);
            addr = INADDR_ANY;
        }
    }

    explicit ipv4_address(const struct sockaddr_in& sa)
        : addr(sa.sin_addr.s_addr), port(ntohs(sa.sin_port)) {}

    struct sockaddr_in to_sockaddr() const {
        struct sockaddr_in sa{};
        sa.sin_family = AF_INET;
        sa.sin_addr.s_addr = addr;
        sa.sin_port = htons(port);
        return sa;
    }

    std::string to_string() const {
        char buf[INET_ADDRSTRLEN];
        struct in_addr in{};
        in.s_addr = addr;
        inet_ntop(AF_INET, &in, buf, sizeof(buf));
        return std::string(buf) + ":" + std::to_string(port);
    }
};

/// Connected TCP socket driven by the running event loop
class tcp_stream {
public:
    explicit tcp_stream(int fd) : fd_(fd) {
        int flags = fcntl(fd_, F_GETFL, 0);
        fcntl(fd_, F_SETFL, flags | O_NONBLOCK);
    }

    tcp_stream(tcp_stream&& other) noexcept
        : fd_(std::exchange(other.fd_, -1)) {}

    tcp_stream& operator=(tcp_stream&& other) noexcept {
        if (this != &other) {
            close();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    ~tcp_stream() { close(); }

    tcp_stream(const tcp_stream&) = delete;
    tcp_stream& operator=(const tcp_stream&) = delete;

    bool is_valid() const noexcept { return fd_ >= 0; }
    int fd() const noexcept { return fd_; }

    /// Peer address, if still connected
    std::string peer_address() const {
        struct sockaddr_in sa{};
        socklen_t len = sizeof(sa);
        if (getpeername(fd_, reinterpret_cast<struct sockaddr*>(&sa), &len) == 0) {
            return ipv4_address(sa).to_string();
        }
        return "unknown";
    }

    /// Read up to @p len bytes; 0 means the peer closed its side
    coro::task<io_result> read(void* buffer, size_t len, coro::cancel_token token = {}) {
        auto& loop = runtime::event_loop::require();
        for (;;) {
            ssize_t n = ::recv(fd_, buffer, len, 0);
            if (n >= 0) {
                co_return io_result{n};
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                co_return io_result{-errno};
            }
            int rc = co_await loop.wait_readable(fd_, token);
            if (rc < 0) {
                co_return io_result{rc};
            }
        }
    }

    /// Write all of @p data, suspending while the socket buffer is full
    coro::task<io_result> write_all(std::string data, coro::cancel_token token = {}) {
        auto& loop = runtime::event_loop::require();
        size_t sent = 0;
        bool blocked = false;
        while (sent < data.size()) {
            ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n >= 0) {
                sent += static_cast<size_t>(n);
                continue;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                co_return io_result{-errno, blocked};
            }
            blocked = true;
            int rc = co_await loop.wait_writable(fd_, token);
            if (rc < 0) {
                co_return io_result{rc, blocked};
            }
        }
        co_return io_result{static_cast<ssize_t>(sent), blocked};
    }

    /// Half-close the sending side
    void shutdown_write() noexcept {
        if (fd_ >= 0) {
            ::shutdown(fd_, SHUT_WR);
        }
    }

    void set_no_delay(bool enable) noexcept {
        int flag = enable ? 1 : 0;
        setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
    }

    void close() noexcept {
        if (fd_ < 0) {
            return;
        }
        if (auto* loop = runtime::event_loop::current()) {
            loop->release_fd(fd_);
        }
        ::close(fd_);
        fd_ = -1;
    }

private:
    int fd_ = -1;
};

/// Connect to a remote TCP server
inline coro::task<std::expected<tcp_stream, int>> tcp_connect(std::string host, uint16_t port,
                                                              coro::cancel_token token = {}) {
    auto& loop = runtime::event_loop::require();
    ipv4_address addr(host, port);
    auto sa = addr.to_sockaddr();

    int fd = socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        co_return std::unexpected(errno);
    }
    tcp_stream stream(fd);

    if (::connect(fd, reinterpret_cast<struct sockaddr*>(&sa), sizeof(sa)) < 0) {
        if (errno != EINPROGRESS) {
            co_return std::unexpected(errno);
        }
        int rc = co_await loop.wait_writable(fd, token);
        if (rc < 0) {
            co_return std::unexpected(-rc);
        }
        int err = 0;
        socklen_t len = sizeof(err);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
            co_return std::unexpected(errno);
        }
        if (err != 0) {
            co_return std::unexpected(err);
        }
    }

    stream.set_no_delay(true);
    ACCORD_LOG_DEBUG("Connected to {}", addr.to_string());
    co_return std::move(stream);
}

/// TCP listener for accepting connections
class tcp_listener {
public:
    /// Create and bind a TCP listener
    /// @param addr Address to bind to (port 0 picks an ephemeral port)
    /// @param opts Socket options
    static std::expected<tcp_listener, int> bind(const ipv4_address& addr,
                                                 const tcp_options& opts = {}) {
        int fd = socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
        if (fd < 0) {
            return std::unexpected(errno);
        }

        if (opts.reuse_addr) {
            int flag = 1;
            setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &flag, sizeof(flag));
        }

        auto sa = addr.to_sockaddr();
        if (::bind(fd, reinterpret_cast<struct sockaddr*>(&sa), sizeof(sa)) < 0) {
            int err = errno;
            ::close(fd);
            return std::unexpected(err);
        }

        if (::listen(fd, opts.backlog) < 0) {
            int err = errno;
            ::close(fd);
            return std::unexpected(err);
        }

        struct sockaddr_in bound{};
        socklen_t len = sizeof(bound);
        getsockname(fd, reinterpret_cast<struct sockaddr*>(&bound), &len);
        ipv4_address local(bound);

        ACCORD_LOG_INFO("TCP listener bound to {}", local.to_string());
        return tcp_listener(fd, local, opts);
    }

    tcp_listener(tcp_listener&& other) noexcept
        : fd_(std::exchange(other.fd_, -1))
        , local_addr_(other.local_addr_)
        , opts_(other.opts_) {}

    tcp_listener& operator=(tcp_listener&& other) noexcept {
        if (this != &other) {
            close();
            fd_ = std::exchange(other.fd_, -1);
            local_addr_ = other.local_addr_;
            opts_ = other.opts_;
        }
        return *this;
    }

    ~tcp_listener() { close(); }

    tcp_listener(const tcp_listener&) = delete;
    tcp_listener& operator=(const tcp_listener&) = delete;

    bool is_valid() const noexcept { return fd_ >= 0; }
    int fd() const noexcept { return fd_; }
    const ipv4_address& local_address() const noexcept { return local_addr_; }

    /// Accept a new connection; -ECANCELED when the token fires
    coro::task<std::expected<tcp_stream, int>> accept(coro::cancel_token token = {}) {
        auto& loop = runtime::event_loop::require();
        for (;;) {
            int fd = ::accept4(fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
            if (fd >= 0) {
                tcp_stream stream(fd);
                stream.set_no_delay(opts_.no_delay);
                co_return std::move(stream);
            }
            if (errno == EINTR || errno == ECONNABORTED) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                co_return std::unexpected(errno);
            }
            int rc = co_await loop.wait_readable(fd_, token);
            if (rc < 0) {
                co_return std::unexpected(-rc);
            }
        }
    }

    void close() noexcept {
        if (fd_ < 0) {
            return;
        }
        if (auto* loop = runtime::event_loop::current()) {
            loop->release_fd(fd_);
        }
        ::close(fd_);
        fd_ = -1;
    }

private:
    tcp_listener(int fd, const ipv4_address& addr, const tcp_options& opts)
        : fd_(fd), local_addr_(addr), opts_(opts) {}

    int fd_ = -1;
    ipv4_address local_addr_;
    tcp_options opts_;
};

} // namespace accord::net
