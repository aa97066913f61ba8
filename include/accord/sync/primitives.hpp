#pragma once

/// @file primitives.hpp
/// @brief Coroutine wait primitives for the single-threaded event loop
///
/// Every participant runs on the loop thread, so no locking is needed.
/// Waiters are resumed through runtime::schedule_handle, never inline.

#include <coroutine>
#include <utility>
#include <vector>

namespace accord::runtime {
void schedule_handle(std::coroutine_handle<> handle) noexcept;
}

namespace accord::sync {

/// Manual-reset event
class event {
public:
    event() = default;

    event(const event&) = delete;
    event& operator=(const event&) = delete;

    class wait_awaitable {
    public:
        explicit wait_awaitable(event& e) : event_(e) {}

        bool await_ready() const noexcept { return event_.signaled_; }

        void await_suspend(std::coroutine_handle<> awaiter) {
            event_.waiters_.push_back(awaiter);
        }

        void await_resume() const noexcept {}

    private:
        event& event_;
    };

    /// Wait for the event to be signaled
    [[nodiscard]] wait_awaitable wait() { return wait_awaitable(*this); }

    /// Signal the event (wake all waiters)
    void set() {
        signaled_ = true;
        for (auto h : std::exchange(waiters_, {})) {
            runtime::schedule_handle(h);
        }
    }

    void reset() noexcept { signaled_ = false; }

    bool is_set() const noexcept { return signaled_; }

private:
    bool signaled_ = false;
    std::vector<std::coroutine_handle<>> waiters_;
};

/// Condition variable without an external lock
///
/// Usage:
///   while (!condition) {
///       co_await cv.wait();
///   }
class condition_variable {
public:
    condition_variable() = default;

    condition_variable(const condition_variable&) = delete;
    condition_variable& operator=(const condition_variable&) = delete;

    class wait_awaitable {
    public:
        explicit wait_awaitable(condition_variable& cv) : cv_(cv) {}

        bool await_ready() const noexcept { return false; }

        void await_suspend(std::coroutine_handle<> awaiter) {
            cv_.waiters_.push_back(awaiter);
        }

        void await_resume() const noexcept {}

    private:
        condition_variable& cv_;
    };

    [[nodiscard]] wait_awaitable wait() { return wait_awaitable(*this); }

    /// Wake one waiting coroutine
    void notify_one() {
        if (waiters_.empty()) {
            return;
        }
        auto h = waiters_.front();
        waiters_.erase(waiters_.begin());
        runtime::schedule_handle(h);
    }

    /// Wake all waiting coroutines
    void notify_all() {
        for (auto h : std::exchange(waiters_, {})) {
            runtime::schedule_handle(h);
        }
    }

    bool has_waiters() const noexcept { return !waiters_.empty(); }

private:
    std::vector<std::coroutine_handle<>> waiters_;
};

} // namespace accord::sync
