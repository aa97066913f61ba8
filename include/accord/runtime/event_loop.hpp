#pragma once

#include <accord/coro/cancel_token.hpp>
#include <accord/coro/task.hpp>
#include <accord/log/macros.hpp>

#include <sys/epoll.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <queue>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace accord::runtime {

/// Direction of an fd readiness wait
enum class io_direction {
    read,
    write
};

/// Single-threaded cooperative reactor
///
/// Every coroutine of the dispatch engine runs on the thread that calls
/// run() or block_on(). Handles become runnable through the ready queue;
/// readiness waits and timers feed that queue from epoll_wait.
class event_loop {
public:
    using clock = std::chrono::steady_clock;

    struct config {
        size_t max_events = 256;     ///< Max events per poll
    };

    /// Bookkeeping for one suspended readiness wait
    struct wait_slot {
        std::coroutine_handle<> handle;
        int result = 0;              ///< 0 when ready, -errno otherwise
        bool pending = false;
    };

    /// Bookkeeping for one suspended sleep
    struct timer_slot {
        std::coroutine_handle<> handle;
        bool active = true;
    };

    event_loop() : event_loop(config{}) {}

    explicit event_loop(const config& cfg)
        : events_(cfg.max_events) {
        epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
        if (epoll_fd_ < 0) {
            throw std::runtime_error(
                std::string("epoll_create1 failed: ") + strerror(errno)
            );
        }
        ACCORD_LOG_DEBUG("event_loop initialized (max_events={})", cfg.max_events);
    }

    ~event_loop() {
        if (epoll_fd_ >= 0) {
            ::close(epoll_fd_);
        }
    }

    event_loop(const event_loop&) = delete;
    event_loop& operator=(const event_loop&) = delete;

    /// Loop currently running on this thread (nullptr outside run/block_on)
    static event_loop* current() noexcept { return current_; }

    /// Loop currently running on this thread, or std::logic_error
    static event_loop& require() {
        if (!current_) {
            throw std::logic_error("accord: no event loop is running on this thread");
        }
        return *current_;
    }

    /// Make a suspended coroutine runnable
    void schedule(std::coroutine_handle<> handle) {
        ready_.push_back(handle);
    }

    /// Start a task and return a handle to its result
    template<typename T>
    [[nodiscard]] coro::join_handle<T> spawn(coro::task<T> t) {
        auto state = std::make_shared<coro::detail::join_state<T>>();
        schedule(coro::detail::join_wrapper(std::move(t), state).release());
        return coro::join_handle<T>(std::move(state));
    }

    /// Start a fire-and-forget task; an escaping exception is logged
    void go(coro::task<void> t) {
        schedule(guarded(std::move(t)).release());
    }

    /// Run until stop() or until nothing is runnable, waiting or sleeping
    void run() {
        run_until([] { return false; });
    }

    /// Ask run() to return after the current batch
    void stop() noexcept {
        stop_requested_ = true;
    }

    /// Drive the loop until @p t completes and return its result
    template<typename T>
    T block_on(coro::task<T> t) {
        auto handle = spawn(std::move(t));
        run_until([&handle] { return handle.is_ready(); });
        if (!handle.is_ready()) {
            throw std::runtime_error("accord: event loop stopped before the task completed");
        }
        return handle.get();
    }

    /// Number of readiness waits and live timers keeping the loop busy
    [[nodiscard]] size_t pending_waits() const noexcept { return waiting_ + active_timers_; }

    /// Register a readiness wait. Returns 0, or -errno if epoll refused the fd.
    int add_waiter(int fd, io_direction dir, wait_slot* slot) {
        auto& watch = watches_[fd];
        auto& entry = dir == io_direction::read ? watch.reader : watch.writer;
        if (entry) {
            return -EBUSY;
        }
        entry = slot;
        slot->pending = true;
        ++waiting_;
        int rc = update_interest(fd);
        if (rc < 0) {
            remove_waiter(fd, dir);
        }
        return rc;
    }

    /// Drop a readiness wait without resuming it
    void remove_waiter(int fd, io_direction dir) {
        auto it = watches_.find(fd);
        if (it == watches_.end()) {
            return;
        }
        auto& entry = dir == io_direction::read ? it->second.reader : it->second.writer;
        if (entry) {
            entry->pending = false;
            entry = nullptr;
            --waiting_;
        }
        update_interest(fd);
    }

    /// Forget every wait on an fd that is about to be closed.
    /// Suspended waiters resume with -EBADF.
    void release_fd(int fd) {
        auto it = watches_.find(fd);
        if (it == watches_.end()) {
            return;
        }
        for (auto* slot : {it->second.reader, it->second.writer}) {
            if (slot) {
                slot->pending = false;
                slot->result = -EBADF;
                --waiting_;
                schedule(slot->handle);
            }
        }
        if (it->second.registered != 0) {
            epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
        }
        watches_.erase(it);
    }

    /// Arm a timer that schedules @p handle at @p deadline
    std::shared_ptr<timer_slot> add_timer(clock::time_point deadline, std::coroutine_handle<> handle) {
        auto slot = std::make_shared<timer_slot>();
        slot->handle = handle;
        timers_.push(timer_entry{deadline, next_timer_seq_++, slot});
        ++active_timers_;
        return slot;
    }

    /// Disarm a timer; returns false if it already fired
    bool cancel_timer(const std::shared_ptr<timer_slot>& slot) noexcept {
        if (!slot || !slot->active) {
            return false;
        }
        slot->active = false;
        --active_timers_;
        return true;
    }

    /// Awaitable readiness wait; resumes with 0 or -errno (-ECANCELED on cancel)
    class io_wait_awaiter {
    public:
        io_wait_awaiter(event_loop& loop, int fd, io_direction dir, coro::cancel_token token)
            : loop_(loop), fd_(fd), dir_(dir), token_(std::move(token)) {}

        ~io_wait_awaiter() {
            if (slot_.pending) {
                loop_.remove_waiter(fd_, dir_);
            }
        }

        io_wait_awaiter(const io_wait_awaiter&) = delete;
        io_wait_awaiter& operator=(const io_wait_awaiter&) = delete;

        bool await_ready() noexcept {
            if (token_.is_cancelled()) {
                slot_.result = -ECANCELED;
                return true;
            }
            return false;
        }

        bool await_suspend(std::coroutine_handle<> h) {
            slot_.handle = h;
            int rc = loop_.add_waiter(fd_, dir_, &slot_);
            if (rc < 0) {
                slot_.result = rc;
                return false;
            }
            reg_ = token_.on_cancel([this]() {
                if (slot_.pending) {
                    loop_.remove_waiter(fd_, dir_);
                    slot_.result = -ECANCELED;
                    loop_.schedule(slot_.handle);
                }
            });
            return true;
        }

        int await_resume() noexcept {
            reg_.unregister();
            return slot_.result;
        }

    private:
        event_loop& loop_;
        int fd_;
        io_direction dir_;
        coro::cancel_token token_;
        coro::cancel_registration reg_;
        wait_slot slot_;
    };

    [[nodiscard]] io_wait_awaiter wait_readable(int fd, coro::cancel_token token = {}) {
        return io_wait_awaiter{*this, fd, io_direction::read, std::move(token)};
    }

    [[nodiscard]] io_wait_awaiter wait_writable(int fd, coro::cancel_token token = {}) {
        return io_wait_awaiter{*this, fd, io_direction::write, std::move(token)};
    }

    /// Awaitable sleep; resumes with cancel_result::cancelled if the token fires first
    class sleep_awaiter {
    public:
        sleep_awaiter(event_loop& loop, clock::duration duration, coro::cancel_token token)
            : loop_(loop), duration_(duration), token_(std::move(token)) {}

        ~sleep_awaiter() {
            loop_.cancel_timer(slot_);
        }

        sleep_awaiter(const sleep_awaiter&) = delete;
        sleep_awaiter& operator=(const sleep_awaiter&) = delete;

        bool await_ready() noexcept {
            if (token_.is_cancelled()) {
                cancelled_ = true;
                return true;
            }
            return duration_ <= clock::duration::zero();
        }

        void await_suspend(std::coroutine_handle<> h) {
            slot_ = loop_.add_timer(clock::now() + duration_, h);
            reg_ = token_.on_cancel([this]() {
                if (loop_.cancel_timer(slot_)) {
                    cancelled_ = true;
                    loop_.schedule(slot_->handle);
                }
            });
        }

        coro::cancel_result await_resume() noexcept {
            reg_.unregister();
            return cancelled_ ? coro::cancel_result::cancelled : coro::cancel_result::completed;
        }

    private:
        event_loop& loop_;
        clock::duration duration_;
        coro::cancel_token token_;
        coro::cancel_registration reg_;
        std::shared_ptr<timer_slot> slot_;
        bool cancelled_ = false;
    };

    template<typename Rep, typename Period>
    [[nodiscard]] sleep_awaiter sleep_for(std::chrono::duration<Rep, Period> duration,
                                          coro::cancel_token token = {}) {
        return sleep_awaiter{*this,
            std::chrono::duration_cast<clock::duration>(duration), std::move(token)};
    }

    /// Awaitable that requeues the caller behind everything already runnable
    struct yield_awaiter {
        event_loop& loop;

        bool await_ready() const noexcept { return false; }
        void await_suspend(std::coroutine_handle<> h) { loop.schedule(h); }
        void await_resume() const noexcept {}
    };

    [[nodiscard]] yield_awaiter yield() noexcept {
        return yield_awaiter{*this};
    }

private:
    struct fd_watch {
        wait_slot* reader = nullptr;
        wait_slot* writer = nullptr;
        uint32_t registered = 0;
    };

    struct timer_entry {
        clock::time_point deadline;
        uint64_t seq;
        std::shared_ptr<timer_slot> slot;

        bool operator>(const timer_entry& other) const noexcept {
            if (deadline != other.deadline) {
                return deadline > other.deadline;
            }
            return seq > other.seq;
        }
    };

    static coro::task<void> guarded(coro::task<void> t) {
        try {
            co_await std::move(t);
        } catch (const std::exception& e) {
            ACCORD_LOG_ERROR("Unhandled exception in detached task: {}", e.what());
        } catch (...) {
            ACCORD_LOG_ERROR("Unhandled non-standard exception in detached task");
        }
    }

    template<typename Pred>
    void run_until(Pred&& done) {
        struct current_guard {
            event_loop* previous;
            ~current_guard() { current_ = previous; }
        } guard{std::exchange(current_, this)};

        stop_requested_ = false;
        while (!stop_requested_ && !done()) {
            run_ready();
            if (stop_requested_ || done()) {
                break;
            }
            if (!ready_.empty()) {
                poll(0);
                continue;
            }
            if (waiting_ == 0 && active_timers_ == 0) {
                break;
            }
            poll(next_timeout_ms());
        }
    }

    void run_ready() {
        std::deque<std::coroutine_handle<>> batch;
        batch.swap(ready_);
        while (!batch.empty()) {
            auto h = batch.front();
            batch.pop_front();
            if (h && !h.done()) {
                h.resume();
            }
        }
    }

    int next_timeout_ms() {
        while (!timers_.empty() && !timers_.top().slot->active) {
            timers_.pop();
        }
        if (timers_.empty()) {
            return -1;
        }
        auto remaining = timers_.top().deadline - clock::now();
        if (remaining <= clock::duration::zero()) {
            return 0;
        }
        auto ms = std::chrono::ceil<std::chrono::milliseconds>(remaining).count();
        return static_cast<int>(ms);
    }

    void poll(int timeout_ms) {
        int n = epoll_wait(epoll_fd_, events_.data(), static_cast<int>(events_.size()), timeout_ms);
        if (n < 0) {
            if (errno != EINTR) {
                ACCORD_LOG_ERROR("epoll_wait failed: {}", strerror(errno));
            }
            n = 0;
        }

        for (int i = 0; i < n; ++i) {
            int fd = events_[i].data.fd;
            uint32_t ev = events_[i].events;
            auto it = watches_.find(fd);
            if (it == watches_.end()) {
                continue;
            }
            auto& watch = it->second;
            bool failed = (ev & (EPOLLERR | EPOLLHUP)) != 0;
            if (watch.reader && (failed || (ev & (EPOLLIN | EPOLLRDHUP)))) {
                wake(std::exchange(watch.reader, nullptr));
            }
            if (watch.writer && (failed || (ev & EPOLLOUT))) {
                wake(std::exchange(watch.writer, nullptr));
            }
            update_interest(fd);
        }

        fire_timers();
    }

    void wake(wait_slot* slot) {
        slot->pending = false;
        slot->result = 0;
        --waiting_;
        schedule(slot->handle);
    }

    void fire_timers() {
        auto now = clock::now();
        while (!timers_.empty() && timers_.top().deadline <= now) {
            auto slot = timers_.top().slot;
            timers_.pop();
            if (cancel_timer(slot)) {
                schedule(slot->handle);
            }
        }
    }

    int update_interest(int fd) {
        auto it = watches_.find(fd);
        if (it == watches_.end()) {
            return 0;
        }
        auto& watch = it->second;
        uint32_t want = (watch.reader ? (EPOLLIN | EPOLLRDHUP) : 0u) |
                        (watch.writer ? EPOLLOUT : 0u);
        if (want == watch.registered) {
            if (want == 0) {
                watches_.erase(it);
            }
            return 0;
        }

        if (want == 0) {
            epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
            watches_.erase(it);
            return 0;
        }

        struct epoll_event ev{};
        ev.events = want;
        ev.data.fd = fd;
        int op = watch.registered == 0 ? EPOLL_CTL_ADD : EPOLL_CTL_MOD;
        int rc = epoll_ctl(epoll_fd_, op, fd, &ev);
        if (rc < 0 && op == EPOLL_CTL_MOD && errno == ENOENT) {
            // fd was closed and reused behind our back
            rc = epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev);
        } else if (rc < 0 && op == EPOLL_CTL_ADD && errno == EEXIST) {
            rc = epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev);
        }
        if (rc < 0) {
            int err = errno;
            ACCORD_LOG_ERROR("epoll_ctl failed for fd {}: {}", fd, strerror(err));
            return -err;
        }
        watch.registered = want;
        return 0;
    }

    static inline thread_local event_loop* current_ = nullptr;

    int epoll_fd_ = -1;
    std::vector<struct epoll_event> events_;
    std::deque<std::coroutine_handle<>> ready_;
    std::unordered_map<int, fd_watch> watches_;
    size_t waiting_ = 0;
    std::priority_queue<timer_entry, std::vector<timer_entry>, std::greater<>> timers_;
    uint64_t next_timer_seq_ = 0;
    size_t active_timers_ = 0;
    bool stop_requested_ = false;
};

/// Resume a coroutine through the running loop (inline when none is running)
inline void schedule_handle(std::coroutine_handle<> handle) noexcept {
    if (auto* loop = event_loop::current()) {
        loop->schedule(handle);
    } else {
        handle.resume();
    }
}

} // namespace accord::runtime
