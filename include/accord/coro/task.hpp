#pragma once

#include <coroutine>
#include <exception>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace accord::runtime {
void schedule_handle(std::coroutine_handle<> handle) noexcept;
}

namespace accord::coro {

template<typename T = void>
class task;

template<typename T = void>
class join_handle;

namespace detail {

/// Resumes the awaiting coroutine, or self-destructs a detached frame
struct final_awaiter {
    [[nodiscard]] bool await_ready() const noexcept { return false; }

    template<typename Promise>
    [[nodiscard]] std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> h) noexcept {
        auto continuation = h.promise().continuation_;
        if (continuation) {
            return continuation;
        } else if (h.promise().detached_) {
            h.destroy();
            return std::noop_coroutine();
        }
        // Owned task with no continuation - stay suspended for owner to destroy
        return std::noop_coroutine();
    }

    void await_resume() const noexcept {}
};

/// State shared by every task promise
struct promise_base {
    std::coroutine_handle<> continuation_;
    std::exception_ptr exception_;
    bool detached_ = false;

    void unhandled_exception() noexcept {
        exception_ = std::current_exception();
    }

    [[nodiscard]] std::exception_ptr exception() const noexcept { return exception_; }
};

/// Result slot for a spawned task (single event-loop thread)
template<typename T>
struct join_state {
    std::optional<T> value_;
    std::exception_ptr exception_;
    std::coroutine_handle<> waiter_;
    bool completed_ = false;

    void set_value(T&& value) {
        value_.emplace(std::move(value));
        complete();
    }

    void set_exception(std::exception_ptr ex) {
        exception_ = std::move(ex);
        complete();
    }

    void complete() {
        completed_ = true;
        if (auto waiter = std::exchange(waiter_, nullptr)) {
            runtime::schedule_handle(waiter);
        }
    }

    T get_value() {
        if (exception_) {
            std::rethrow_exception(exception_);
        }
        return std::move(*value_);
    }
};

template<>
struct join_state<void> {
    std::exception_ptr exception_;
    std::coroutine_handle<> waiter_;
    bool completed_ = false;

    void set_value() { complete(); }

    void set_exception(std::exception_ptr ex) {
        exception_ = std::move(ex);
        complete();
    }

    void complete() {
        completed_ = true;
        if (auto waiter = std::exchange(waiter_, nullptr)) {
            runtime::schedule_handle(waiter);
        }
    }

    void get_value() {
        if (exception_) {
            std::rethrow_exception(exception_);
        }
    }
};

} // namespace detail

/// Join handle for awaiting a spawned task
/// Returned by event_loop::spawn(), allows co_await to get the result
template<typename T>
class join_handle {
public:
    explicit join_handle(std::shared_ptr<detail::join_state<T>> state) noexcept
        : state_(std::move(state)) {}

    join_handle(join_handle&&) noexcept = default;
    join_handle& operator=(join_handle&&) noexcept = default;

    join_handle(const join_handle&) = delete;
    join_handle& operator=(const join_handle&) = delete;

    [[nodiscard]] bool await_ready() const noexcept {
        return state_->completed_;
    }

    void await_suspend(std::coroutine_handle<> awaiter) noexcept {
        state_->waiter_ = awaiter;
    }

    T await_resume() {
        return state_->get_value();
    }

    /// Check if the spawned task has completed
    [[nodiscard]] bool is_ready() const noexcept {
        return state_->completed_;
    }

    /// Take the result of a completed task (rethrows its exception)
    T get() {
        return state_->get_value();
    }

private:
    std::shared_ptr<detail::join_state<T>> state_;
};

/// Lazily started coroutine producing a T
template<typename T>
class task {
public:
    struct promise_type : detail::promise_base {
        std::optional<T> value_;

        [[nodiscard]] task get_return_object() noexcept {
            return task{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        [[nodiscard]] std::suspend_always initial_suspend() noexcept { return {}; }
        [[nodiscard]] detail::final_awaiter final_suspend() noexcept { return {}; }

        template<typename U>
        void return_value(U&& value) {
            value_.emplace(std::forward<U>(value));
        }
    };

    using handle_type = std::coroutine_handle<promise_type>;

    explicit task(handle_type handle) noexcept : handle_(handle) {}
    task(task&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    task& operator=(task&& other) noexcept {
        if (this != &other) {
            if (handle_) handle_.destroy();
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    ~task() { if (handle_) handle_.destroy(); }

    task(const task&) = delete;
    task& operator=(const task&) = delete;

    [[nodiscard]] handle_type handle() const noexcept { return handle_; }
    [[nodiscard]] handle_type release() noexcept {
        if (handle_) handle_.promise().detached_ = true;
        return std::exchange(handle_, nullptr);
    }

    [[nodiscard]] bool await_ready() const noexcept { return false; }

    [[nodiscard]] std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiter) noexcept {
        handle_.promise().continuation_ = awaiter;
        return handle_;
    }

    T await_resume() {
        auto& promise = handle_.promise();
        if (promise.exception()) {
            std::rethrow_exception(promise.exception());
        }
        return std::move(*promise.value_);
    }

private:
    handle_type handle_;
};

/// Specialization for task<void>
template<>
class task<void> {
public:
    struct promise_type : detail::promise_base {
        [[nodiscard]] task get_return_object() noexcept {
            return task{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        [[nodiscard]] std::suspend_always initial_suspend() noexcept { return {}; }
        [[nodiscard]] detail::final_awaiter final_suspend() noexcept { return {}; }

        void return_void() noexcept {}
    };

    using handle_type = std::coroutine_handle<promise_type>;

    explicit task(handle_type handle) noexcept : handle_(handle) {}
    task(task&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    task& operator=(task&& other) noexcept {
        if (this != &other) {
            if (handle_) handle_.destroy();
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    ~task() { if (handle_) handle_.destroy(); }

    task(const task&) = delete;
    task& operator=(const task&) = delete;

    [[nodiscard]] handle_type handle() const noexcept { return handle_; }
    [[nodiscard]] handle_type release() noexcept {
        if (handle_) handle_.promise().detached_ = true;
        return std::exchange(handle_, nullptr);
    }

    [[nodiscard]] bool await_ready() const noexcept { return false; }

    [[nodiscard]] std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiter) noexcept {
        handle_.promise().continuation_ = awaiter;
        return handle_;
    }

    void await_resume() {
        auto& promise = handle_.promise();
        if (promise.exception()) {
            std::rethrow_exception(promise.exception());
        }
    }

private:
    handle_type handle_;
};

namespace detail {

/// Wrapper task that forwards result to join_state
template<typename T>
task<void> join_wrapper(task<T> t, std::shared_ptr<join_state<T>> state) {
    try {
        if constexpr (std::is_void_v<T>) {
            co_await std::move(t);
            state->set_value();
        } else {
            T result = co_await std::move(t);
            state->set_value(std::move(result));
        }
    } catch (...) {
        state->set_exception(std::current_exception());
    }
}

} // namespace detail

} // namespace accord::coro
