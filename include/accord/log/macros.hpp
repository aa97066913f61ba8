#pragma once

#include "logger.hpp"

/// Logging macros with file and line information
///
/// The ACCORD_LOG_CONN_* forms tag a line with the id of a long-lived
/// connection, so the whole life of one stream or socket greps together:
/// ```cpp
/// ACCORD_LOG_CONN_ERROR(conn->id(), "sink write failed: {}", e.what());
/// // [..] [ERROR] [connection.hpp:212] connection 7: sink write failed: ...
/// ```
/// Format strings must be literals; they are checked at compile time.

#define ACCORD_LOG_AT(lvl, fmt, ...) \
    ::accord::log::logger::instance().log( \
        ::accord::log::level::lvl, \
        __FILE__, __LINE__, \
        fmt __VA_OPT__(,) __VA_ARGS__ \
    )

#define ACCORD_LOG_CONN_AT(lvl, conn_id, fmt, ...) \
    ACCORD_LOG_AT(lvl, "connection {}: " fmt, conn_id __VA_OPT__(,) __VA_ARGS__)

#ifdef ACCORD_DEBUG
    #define ACCORD_LOG_DEBUG(fmt, ...) ACCORD_LOG_AT(debug, fmt __VA_OPT__(,) __VA_ARGS__)
    #define ACCORD_LOG_CONN_DEBUG(conn_id, fmt, ...) \
        ACCORD_LOG_CONN_AT(debug, conn_id, fmt __VA_OPT__(,) __VA_ARGS__)
#else
    #define ACCORD_LOG_DEBUG(fmt, ...) ((void)0)
    #define ACCORD_LOG_CONN_DEBUG(conn_id, fmt, ...) ((void)0)
#endif

#define ACCORD_LOG_INFO(fmt, ...) ACCORD_LOG_AT(info, fmt __VA_OPT__(,) __VA_ARGS__)
#define ACCORD_LOG_WARNING(fmt, ...) ACCORD_LOG_AT(warning, fmt __VA_OPT__(,) __VA_ARGS__)
#define ACCORD_LOG_ERROR(fmt, ...) ACCORD_LOG_AT(error, fmt __VA_OPT__(,) __VA_ARGS__)

#define ACCORD_LOG_CONN_INFO(conn_id, fmt, ...) \
    ACCORD_LOG_CONN_AT(info, conn_id, fmt __VA_OPT__(,) __VA_ARGS__)
#define ACCORD_LOG_CONN_WARNING(conn_id, fmt, ...) \
    ACCORD_LOG_CONN_AT(warning, conn_id, fmt __VA_OPT__(,) __VA_ARGS__)
#define ACCORD_LOG_CONN_ERROR(conn_id, fmt, ...) \
    ACCORD_LOG_CONN_AT(error, conn_id, fmt __VA_OPT__(,) __VA_ARGS__)
