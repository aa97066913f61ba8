#pragma once

#include <accord/runtime/event_loop.hpp>

#include <chrono>

namespace accord::time {

/// Sleep for a duration on the running event loop
/// @return Awaitable yielding coro::cancel_result::completed
template<typename Rep, typename Period>
inline auto sleep_for(std::chrono::duration<Rep, Period> duration) {
    return runtime::event_loop::require().sleep_for(duration);
}

/// Sleep for a duration with cancellation support
/// @param duration Duration to sleep
/// @param token Cancellation token - sleep returns early if cancelled
/// @return Awaitable that returns cancel_result::completed or cancel_result::cancelled
template<typename Rep, typename Period>
inline auto sleep_for(std::chrono::duration<Rep, Period> duration, coro::cancel_token token) {
    return runtime::event_loop::require().sleep_for(duration, std::move(token));
}

/// Let every other runnable coroutine run before continuing
inline auto yield() {
    return runtime::event_loop::require().yield();
}

} // namespace accord::time
