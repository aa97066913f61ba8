#pragma once

#include <algorithm>
#include <coroutine>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace accord::runtime {
void schedule_handle(std::coroutine_handle<> handle) noexcept;
}

namespace accord::coro {

/// Result of a cancellable operation
enum class cancel_result {
    completed,   ///< Operation completed normally
    cancelled    ///< Operation was cancelled
};

namespace detail {

/// Shared cancellation state
///
/// Owned by the event-loop thread; callbacks run synchronously on the
/// thread that calls cancel().
struct cancel_state {
    bool cancelled = false;
    std::vector<std::pair<uint64_t, std::function<void()>>> callbacks;
    uint64_t next_id = 1;

    uint64_t add_callback(std::function<void()> cb) {
        if (cancelled) {
            cb();
            return 0;
        }
        uint64_t id = next_id++;
        callbacks.emplace_back(id, std::move(cb));
        return id;
    }

    void remove_callback(uint64_t id) {
        callbacks.erase(
            std::remove_if(callbacks.begin(), callbacks.end(),
                [id](const auto& p) { return p.first == id; }),
            callbacks.end()
        );
    }

    void trigger() {
        if (cancelled) {
            return;
        }
        cancelled = true;
        auto to_invoke = std::move(callbacks);
        callbacks.clear();
        for (auto& [id, cb] : to_invoke) {
            cb();
        }
    }
};

} // namespace detail

class cancel_source;

/// Registration handle for cancel callbacks
class cancel_registration {
public:
    cancel_registration() = default;
    cancel_registration(cancel_registration&& other) noexcept
        : state_(std::move(other.state_)), id_(other.id_) {
        other.id_ = 0;
    }
    cancel_registration& operator=(cancel_registration&& other) noexcept {
        if (this != &other) {
            unregister();
            state_ = std::move(other.state_);
            id_ = other.id_;
            other.id_ = 0;
        }
        return *this;
    }
    ~cancel_registration() { unregister(); }

    cancel_registration(const cancel_registration&) = delete;
    cancel_registration& operator=(const cancel_registration&) = delete;

    /// Manually unregister the callback
    void unregister() {
        if (state_ && id_ != 0) {
            state_->remove_callback(id_);
            id_ = 0;
        }
    }

private:
    friend class cancel_token;

    cancel_registration(std::shared_ptr<detail::cancel_state> state, uint64_t id)
        : state_(std::move(state)), id_(id) {}

    std::shared_ptr<detail::cancel_state> state_;
    uint64_t id_ = 0;
};

/// A token that can be used to check for and respond to cancellation requests.
///
/// Handlers may poll it, register callbacks, or co_await cancelled():
/// ```cpp
/// task<void> tail(cancel_token token) {
///     auto reg = token.on_cancel([&] { release_watch(); });
///     while (!token.is_cancelled()) {
///         if (co_await time::sleep_for(1s, token) == cancel_result::cancelled) break;
///         publish();
///     }
/// }
/// ```
class cancel_token {
public:
    using registration = cancel_registration;

    /// Default constructor creates an empty (never-cancelled) token
    cancel_token() = default;

    bool is_cancelled() const noexcept {
        return state_ && state_->cancelled;
    }

    /// Returns true if NOT cancelled
    explicit operator bool() const noexcept {
        return !is_cancelled();
    }

    /// Register a callback to be invoked when cancellation is requested.
    /// The callback will be invoked immediately if already cancelled.
    /// @return Registration handle (callback unregisters when handle is destroyed)
    template<typename F>
    [[nodiscard]] registration on_cancel(F&& callback) const {
        if (!state_) {
            return registration{};
        }
        return registration{state_, state_->add_callback(std::forward<F>(callback))};
    }

    class cancelled_awaiter;

    /// Awaitable that completes once the token is cancelled.
    /// Awaiting an empty token parks the caller until its frame is destroyed.
    [[nodiscard]] cancelled_awaiter cancelled() const;

private:
    friend class cancel_source;

    explicit cancel_token(std::shared_ptr<detail::cancel_state> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::cancel_state> state_;
};

/// Suspends until the token fires; resumption goes through the event loop
class cancel_token::cancelled_awaiter {
public:
    explicit cancelled_awaiter(cancel_token token) noexcept
        : token_(std::move(token)) {}

    bool await_ready() const noexcept {
        return token_.is_cancelled();
    }

    void await_suspend(std::coroutine_handle<> h) {
        reg_ = token_.on_cancel([h]() {
            runtime::schedule_handle(h);
        });
    }

    void await_resume() const noexcept {}

private:
    cancel_token token_;
    registration reg_;
};

inline cancel_token::cancelled_awaiter cancel_token::cancelled() const {
    return cancelled_awaiter{*this};
}

/// A source of cancellation that can create tokens and trigger cancellation.
///
/// cancel() is idempotent: callbacks run on the first call only.
class cancel_source {
public:
    cancel_source()
        : state_(std::make_shared<detail::cancel_state>()) {}

    cancel_token get_token() const noexcept {
        return cancel_token{state_};
    }

    void cancel() {
        if (state_) {
            state_->trigger();
        }
    }

    bool is_cancelled() const noexcept {
        return state_ && state_->cancelled;
    }

private:
    std::shared_ptr<detail::cancel_state> state_;
};

} // namespace accord::coro
