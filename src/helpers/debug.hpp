#pragma once

// 1. Standard includes in alphabetic order
#include <format>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

// 2. Libraries used in the project, in alphabetic order
// None in this file

// 3. All other includes
// None in this file

// Define logging levels
#define LOG_LEVEL_NONE 0
#define LOG_LEVEL_ERROR 1
#define LOG_LEVEL_WARN 2
#define LOG_LEVEL_INFO 3
#define LOG_LEVEL_DEBUG 4
#define LOG_LEVEL_TRACE 5

// Set default log level if not defined (can be overridden with -D compiler flag)
#ifndef MAILBRIDGE_LOG_LEVEL
#ifdef NDEBUG
    // In release builds, only show errors by default
    #define MAILBRIDGE_LOG_LEVEL LOG_LEVEL_ERROR
#else
    #define MAILBRIDGE_LOG_LEVEL LOG_LEVEL_TRACE
#endif
#endif

namespace debug {
    // stdout belongs to the MCP transport, every log line goes to stderr
    inline void write_log(std::string_view component, int level, std::string_view message) {
        static std::mutex log_mutex;
        auto line = std::format("[{}][{}] {}\n", component,
            level == LOG_LEVEL_ERROR ? "ERROR" :
            level == LOG_LEVEL_WARN ? "WARN" :
            level == LOG_LEVEL_INFO ? "INFO" :
            level == LOG_LEVEL_DEBUG ? "DEBUG" : "TRACE",
            message);
        std::lock_guard lock(log_mutex);
        std::cerr << line << std::flush;
    }

    // Helper function for format-based logging
    template<typename... Args>
    inline std::string format_log(std::format_string<Args...> fmt, Args&&... args) {
        return std::format(fmt, std::forward<Args>(args)...);
    }
}

// Convenience macro for component logging
#define LOG_COMPONENT(component, level, message) \
    if (level <= MAILBRIDGE_LOG_LEVEL) { \
        debug::write_log(component, level, message); \
    }

// System/app logging macros
#define SYS_ERROR(message) LOG_COMPONENT("SYSTEM", LOG_LEVEL_ERROR, message)
#define SYS_WARN(message) LOG_COMPONENT("SYSTEM", LOG_LEVEL_WARN, message)
#define SYS_INFO(message) LOG_COMPONENT("SYSTEM", LOG_LEVEL_INFO, message)
#define SYS_DEBUG(message) LOG_COMPONENT("SYSTEM", LOG_LEVEL_DEBUG, message)
#define SYS_TRACE(message) LOG_COMPONENT("SYSTEM", LOG_LEVEL_TRACE, message)

// Configuration logging macros
#define CONFIG_ERROR(message) LOG_COMPONENT("CONFIG", LOG_LEVEL_ERROR, message)
#define CONFIG_WARN(message) LOG_COMPONENT("CONFIG", LOG_LEVEL_WARN, message)
#define CONFIG_INFO(message) LOG_COMPONENT("CONFIG", LOG_LEVEL_INFO, message)
#define CONFIG_DEBUG(message) LOG_COMPONENT("CONFIG", LOG_LEVEL_DEBUG, message)
#define CONFIG_TRACE(message) LOG_COMPONENT("CONFIG", LOG_LEVEL_TRACE, message)

// IMAP mail store logging macros
#define IMAP_ERROR(message) LOG_COMPONENT("IMAP", LOG_LEVEL_ERROR, message)
#define IMAP_WARN(message) LOG_COMPONENT("IMAP", LOG_LEVEL_WARN, message)
#define IMAP_INFO(message) LOG_COMPONENT("IMAP", LOG_LEVEL_INFO, message)
#define IMAP_DEBUG(message) LOG_COMPONENT("IMAP", LOG_LEVEL_DEBUG, message)
#define IMAP_TRACE(message) LOG_COMPONENT("IMAP", LOG_LEVEL_TRACE, message)

// Search engine logging macros
#define SEARCH_ERROR(message) LOG_COMPONENT("SEARCH", LOG_LEVEL_ERROR, message)
#define SEARCH_WARN(message) LOG_COMPONENT("SEARCH", LOG_LEVEL_WARN, message)
#define SEARCH_INFO(message) LOG_COMPONENT("SEARCH", LOG_LEVEL_INFO, message)
#define SEARCH_DEBUG(message) LOG_COMPONENT("SEARCH", LOG_LEVEL_DEBUG, message)
#define SEARCH_TRACE(message) LOG_COMPONENT("SEARCH", LOG_LEVEL_TRACE, message)

// Result cache logging macros
#define CACHE_ERROR(message) LOG_COMPONENT("CACHE", LOG_LEVEL_ERROR, message)
#define CACHE_WARN(message) LOG_COMPONENT("CACHE", LOG_LEVEL_WARN, message)
#define CACHE_INFO(message) LOG_COMPONENT("CACHE", LOG_LEVEL_INFO, message)
#define CACHE_DEBUG(message) LOG_COMPONENT("CACHE", LOG_LEVEL_DEBUG, message)
#define CACHE_TRACE(message) LOG_COMPONENT("CACHE", LOG_LEVEL_TRACE, message)

// Mailbox host logging macros
#define HOST_ERROR(message) LOG_COMPONENT("HOST", LOG_LEVEL_ERROR, message)
#define HOST_WARN(message) LOG_COMPONENT("HOST", LOG_LEVEL_WARN, message)
#define HOST_INFO(message) LOG_COMPONENT("HOST", LOG_LEVEL_INFO, message)
#define HOST_DEBUG(message) LOG_COMPONENT("HOST", LOG_LEVEL_DEBUG, message)
#define HOST_TRACE(message) LOG_COMPONENT("HOST", LOG_LEVEL_TRACE, message)

// MCP transport logging macros
#define MCP_ERROR(message) LOG_COMPONENT("MCP", LOG_LEVEL_ERROR, message)
#define MCP_WARN(message) LOG_COMPONENT("MCP", LOG_LEVEL_WARN, message)
#define MCP_INFO(message) LOG_COMPONENT("MCP", LOG_LEVEL_INFO, message)
#define MCP_DEBUG(message) LOG_COMPONENT("MCP", LOG_LEVEL_DEBUG, message)
#define MCP_TRACE(message) LOG_COMPONENT("MCP", LOG_LEVEL_TRACE, message)

// Convenience macros with format support
#define SYS_ERROR_FMT(fmt, ...) SYS_ERROR(debug::format_log(fmt, __VA_ARGS__))
#define SYS_WARN_FMT(fmt, ...) SYS_WARN(debug::format_log(fmt, __VA_ARGS__))
#define SYS_INFO_FMT(fmt, ...) SYS_INFO(debug::format_log(fmt, __VA_ARGS__))
#define SYS_DEBUG_FMT(fmt, ...) SYS_DEBUG(debug::format_log(fmt, __VA_ARGS__))
#define SYS_TRACE_FMT(fmt, ...) SYS_TRACE(debug::format_log(fmt, __VA_ARGS__))

#define CONFIG_ERROR_FMT(fmt, ...) CONFIG_ERROR(debug::format_log(fmt, __VA_ARGS__))
#define CONFIG_WARN_FMT(fmt, ...) CONFIG_WARN(debug::format_log(fmt, __VA_ARGS__))
#define CONFIG_INFO_FMT(fmt, ...) CONFIG_INFO(debug::format_log(fmt, __VA_ARGS__))
#define CONFIG_DEBUG_FMT(fmt, ...) CONFIG_DEBUG(debug::format_log(fmt, __VA_ARGS__))
#define CONFIG_TRACE_FMT(fmt, ...) CONFIG_TRACE(debug::format_log(fmt, __VA_ARGS__))

#define IMAP_ERROR_FMT(fmt, ...) IMAP_ERROR(debug::format_log(fmt, __VA_ARGS__))
#define IMAP_WARN_FMT(fmt, ...) IMAP_WARN(debug::format_log(fmt, __VA_ARGS__))
#define IMAP_INFO_FMT(fmt, ...) IMAP_INFO(debug::format_log(fmt, __VA_ARGS__))
#define IMAP_DEBUG_FMT(fmt, ...) IMAP_DEBUG(debug::format_log(fmt, __VA_ARGS__))
#define IMAP_TRACE_FMT(fmt, ...) IMAP_TRACE(debug::format_log(fmt, __VA_ARGS__))

#define SEARCH_ERROR_FMT(fmt, ...) SEARCH_ERROR(debug::format_log(fmt, __VA_ARGS__))
#define SEARCH_WARN_FMT(fmt, ...) SEARCH_WARN(debug::format_log(fmt, __VA_ARGS__))
#define SEARCH_INFO_FMT(fmt, ...) SEARCH_INFO(debug::format_log(fmt, __VA_ARGS__))
#define SEARCH_DEBUG_FMT(fmt, ...) SEARCH_DEBUG(debug::format_log(fmt, __VA_ARGS__))
#define SEARCH_TRACE_FMT(fmt, ...) SEARCH_TRACE(debug::format_log(fmt, __VA_ARGS__))

#define CACHE_ERROR_FMT(fmt, ...) CACHE_ERROR(debug::format_log(fmt, __VA_ARGS__))
#define CACHE_WARN_FMT(fmt, ...) CACHE_WARN(debug::format_log(fmt, __VA_ARGS__))
#define CACHE_INFO_FMT(fmt, ...) CACHE_INFO(debug::format_log(fmt, __VA_ARGS__))
#define CACHE_DEBUG_FMT(fmt, ...) CACHE_DEBUG(debug::format_log(fmt, __VA_ARGS__))
#define CACHE_TRACE_FMT(fmt, ...) CACHE_TRACE(debug::format_log(fmt, __VA_ARGS__))

#define HOST_ERROR_FMT(fmt, ...) HOST_ERROR(debug::format_log(fmt, __VA_ARGS__))
#define HOST_WARN_FMT(fmt, ...) HOST_WARN(debug::format_log(fmt, __VA_ARGS__))
#define HOST_INFO_FMT(fmt, ...) HOST_INFO(debug::format_log(fmt, __VA_ARGS__))
#define HOST_DEBUG_FMT(fmt, ...) HOST_DEBUG(debug::format_log(fmt, __VA_ARGS__))
#define HOST_TRACE_FMT(fmt, ...) HOST_TRACE(debug::format_log(fmt, __VA_ARGS__))

#define MCP_ERROR_FMT(fmt, ...) MCP_ERROR(debug::format_log(fmt, __VA_ARGS__))
#define MCP_WARN_FMT(fmt, ...) MCP_WARN(debug::format_log(fmt, __VA_ARGS__))
#define MCP_INFO_FMT(fmt, ...) MCP_INFO(debug::format_log(fmt, __VA_ARGS__))
#define MCP_DEBUG_FMT(fmt, ...) MCP_DEBUG(debug::format_log(fmt, __VA_ARGS__))
#define MCP_TRACE_FMT(fmt, ...) MCP_TRACE(debug::format_log(fmt, __VA_ARGS__))
