#pragma once

/// @file connection.hpp
/// @brief State machine shared by every long-lived transport
///
/// A connection moves strictly forward through
/// connecting -> open -> closing -> closed. Frames are queued in call order
/// and written by a single pump coroutine, so the wire order always matches
/// the order of post()/write()/close() calls.
///
/// The cancellation signal fires exactly once, when the connection leaves
/// the open state for any reason (explicit close, handler completion or peer
/// disconnect). Release actions are tied to the same signal: each runs
/// exactly once, and an action registered after the signal fired runs
/// immediately.
///
/// close() and abandon() keep every frame already accepted; only abort(),
/// used once the peer is gone, discards the outbox.

#include <accord/coro/cancel_token.hpp>
#include <accord/coro/task.hpp>
#include <accord/log/macros.hpp>
#include <accord/runtime/event_loop.hpp>
#include <accord/server/sink.hpp>
#include <accord/sync/primitives.hpp>

#include <algorithm>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace accord::server {

enum class connection_state {
    connecting,
    open,
    closing,
    closed
};

inline constexpr std::string_view to_string(connection_state s) noexcept {
    switch (s) {
        case connection_state::connecting: return "connecting";
        case connection_state::open:       return "open";
        case connection_state::closing:    return "closing";
        case connection_state::closed:     return "closed";
    }
    return "unknown";
}

class connection : public std::enable_shared_from_this<connection> {
public:
    using release_action = std::function<void()>;

    /// @param high_water_mark Queued bytes above which write() suspends
    explicit connection(std::unique_ptr<sink> out, size_t high_water_mark = 64 * 1024)
        : sink_(std::move(out)), high_water_mark_(high_water_mark), id_(next_id()) {}

    connection(const connection&) = delete;
    connection& operator=(const connection&) = delete;

    uint64_t id() const noexcept { return id_; }
    connection_state state() const noexcept { return state_; }
    bool is_open() const noexcept { return state_ == connection_state::open; }

    /// One-shot signal fired when the connection leaves the open state
    coro::cancel_token token() const noexcept { return cancel_.get_token(); }

    /// Bytes queued but not yet accepted by the sink
    size_t queued_bytes() const noexcept { return queued_bytes_; }

    sink& get_sink() noexcept { return *sink_; }

    /// connecting -> open
    void open() {
        if (state_ == connection_state::connecting) {
            transition(connection_state::open);
        }
    }

    /// Register a release action run once at teardown
    void on_release(release_action action) {
        auto id = id_;
        releases_.push_back(cancel_.get_token().on_cancel([id, action = std::move(action)]() {
            try {
                action();
            } catch (const std::exception& e) {
                ACCORD_LOG_CONN_ERROR(id, "release action threw: {}", e.what());
            }
        }));
    }

    /// Called once, after a write that hit backpressure has been flushed
    void on_drain(std::function<void()> callback) {
        drain_ = std::move(callback);
    }

    /// Queue a frame. Returns false, without queuing, unless open.
    bool post(std::string frame) {
        if (state_ != connection_state::open) {
            return false;
        }
        enqueue(std::move(frame));
        return true;
    }

    /// Queue a frame now; the returned task suspends while the outbox
    /// is above the high-water mark and yields whether the frame was queued
    coro::task<bool> write(std::string frame) {
        bool accepted = post(std::move(frame));
        return wait_capacity(shared_from_this(), accepted);
    }

    /// open -> closing. @p last_frame is written after everything already
    /// queued; the connection is closed once the outbox drains.
    void close(std::optional<std::string> last_frame = std::nullopt) {
        if (state_ != connection_state::open && state_ != connection_state::connecting) {
            return;
        }
        transition(connection_state::closing);
        if (last_frame) {
            enqueue(std::move(*last_frame));
        }
        cancel_.cancel();
        if (!writing_) {
            finish();
        }
    }

    /// open -> closing without a terminal frame. Frames already accepted
    /// still reach the sink before the connection closes.
    void abandon() {
        close();
    }

    /// Peer gone or sink failed: closed at once, queued frames dropped
    void abort() {
        if (state_ == connection_state::closed) {
            return;
        }
        outbox_.clear();
        queued_bytes_ = 0;
        finish();
    }

    /// Wait until everything queued so far reached the sink (or the connection died)
    coro::task<void> flush() {
        auto self = shared_from_this();
        while ((writing_ || !outbox_.empty()) && state_ != connection_state::closed) {
            co_await progress_.wait();
        }
    }

    /// Awaitable completing once the connection is closed
    [[nodiscard]] auto wait_closed() { return closed_.wait(); }

private:
    static uint64_t next_id() noexcept {
        static uint64_t counter = 0;
        return ++counter;
    }

    void transition(connection_state next) {
        ACCORD_LOG_CONN_DEBUG(id_, "{} -> {}", to_string(state_), to_string(next));
        state_ = next;
    }

    void enqueue(std::string frame) {
        queued_bytes_ += frame.size();
        outbox_.push_back(std::move(frame));
        if (!writing_) {
            writing_ = true;
            runtime::event_loop::require().go(pump(shared_from_this()));
        }
    }

    void finish() {
        if (state_ == connection_state::closed) {
            return;
        }
        transition(connection_state::closed);
        sink_->close();
        cancel_.cancel();
        progress_.notify_all();
        closed_.set();
    }

    static coro::task<bool> wait_capacity(std::shared_ptr<connection> self, bool accepted) {
        while (accepted && self->queued_bytes_ > self->high_water_mark_ &&
               self->state_ != connection_state::closed) {
            co_await self->progress_.wait();
        }
        co_return accepted;
    }

    static coro::task<void> pump(std::shared_ptr<connection> self) {
        while (!self->outbox_.empty() && self->state_ != connection_state::closed) {
            std::string frame = std::move(self->outbox_.front());
            self->outbox_.pop_front();
            size_t size = frame.size();

            write_result result;
            try {
                result = co_await self->sink_->write(std::move(frame));
            } catch (const std::exception& e) {
                ACCORD_LOG_CONN_ERROR(self->id_, "sink write failed: {}", e.what());
                result.ok = false;
            }

            self->queued_bytes_ -= std::min(size, self->queued_bytes_);
            self->progress_.notify_all();
            if (!result.ok) {
                self->writing_ = false;
                self->abort();
                co_return;
            }
            if (result.backpressured) {
                self->backpressured_ = true;
            }
        }

        self->writing_ = false;
        self->progress_.notify_all();
        if (self->state_ == connection_state::closed) {
            co_return;
        }
        if (self->backpressured_ && !self->drained_ && self->drain_) {
            self->drained_ = true;
            try {
                self->drain_();
            } catch (const std::exception& e) {
                ACCORD_LOG_CONN_ERROR(self->id_, "drain callback threw: {}", e.what());
            }
        }
        if (self->state_ == connection_state::closing && !self->writing_) {
            self->finish();
        }
    }

    std::unique_ptr<sink> sink_;
    size_t high_water_mark_;
    uint64_t id_;
    connection_state state_ = connection_state::connecting;
    coro::cancel_source cancel_;
    std::vector<coro::cancel_registration> releases_;
    std::function<void()> drain_;
    std::deque<std::string> outbox_;
    size_t queued_bytes_ = 0;
    bool writing_ = false;
    bool backpressured_ = false;
    bool drained_ = false;
    sync::condition_variable progress_;
    sync::event closed_;
};

} // namespace accord::server
