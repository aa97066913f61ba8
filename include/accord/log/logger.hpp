#pragma once

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/chrono.h>
#include <atomic>
#include <chrono>
#include <cstdio>

namespace accord::log {

/// Log level enumeration
enum class level {
    debug = 0,
    info = 1,
    warning = 2,
    error = 3
};

/// Convert log level to string
constexpr const char* level_to_string(level lvl) noexcept {
    switch (lvl) {
        case level::debug:   return "DEBUG";
        case level::info:    return "INFO";
        case level::warning: return "WARN";
        case level::error:   return "ERROR";
        default:             return "UNKNOWN";
    }
}

/// Convert log level to ANSI color code
constexpr const char* level_to_color(level lvl) noexcept {
    switch (lvl) {
        case level::debug:   return "\033[36m";
        case level::info:    return "\033[32m";
        case level::warning: return "\033[33m";
        case level::error:   return "\033[31m";
        default:             return "\033[0m";
    }
}

/// Process-wide logger writing to stderr (or a redirected FILE*)
///
/// The dispatch engine runs on one event-loop thread, so the sink is not
/// locked; the level is atomic so tests and signal handlers can flip it.
class logger {
public:
    static logger& instance() noexcept {
        static logger inst;
        return inst;
    }

    void set_level(level min_level) noexcept {
        min_level_.store(min_level, std::memory_order_relaxed);
    }

    level get_level() const noexcept {
        return min_level_.load(std::memory_order_relaxed);
    }

    /// Redirect output (nullptr restores stderr)
    void set_output(std::FILE* out) noexcept {
        out_ = out ? out : stderr;
    }

    /// Whether a message at @p lvl would be written
    bool enabled(level lvl) const noexcept {
        return lvl >= min_level_.load(std::memory_order_relaxed);
    }

    template<typename... Args>
    void log(level lvl, const char* file, int line, fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (!enabled(lvl)) {
            return;
        }

        auto msg = fmt::format(fmt_str, std::forward<Args>(args)...);

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        // Format: [TIMESTAMP] [LEVEL] [file:line] message
        fmt::print(out_,
            "{}[{:%Y-%m-%d %H:%M:%S}.{:03d}] [{}] [{}:{}] {}\033[0m\n",
            level_to_color(lvl),
            fmt::localtime(time),
            ms.count(),
            level_to_string(lvl),
            file,
            line,
            msg
        );
    }

private:
    logger() noexcept : min_level_(level::info) {}
    ~logger() = default;

    logger(const logger&) = delete;
    logger& operator=(const logger&) = delete;

    std::atomic<level> min_level_;
    std::FILE* out_ = stderr;
};

} // namespace accord::log
