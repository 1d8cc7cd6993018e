/**
 * @file log.hpp
 * @brief Logging interface for fastdd
 *
 * The log handler is process-wide and thread-safe. The library never
 * writes diagnostics to stderr on its own; without a handler it is silent.
 *
 * Example:
 * @code
 *   fastdd::set_log_handler([](fastdd::LogLevel level, std::string_view msg) {
 *       std::cerr << "[" << fastdd::log_level_name(level) << "] " << msg << "\n";
 *   });
 *
 *   fastdd::copy(in_fd, out_fd, opts);
 *
 *   fastdd::clear_log_handler();
 * @endcode
 */

#ifndef FASTDD_LOG_HPP
#define FASTDD_LOG_HPP

#include <functional>
#include <mutex>
#include <string_view>

namespace fastdd {

/// Log severity levels (match syslog priorities 1:1)
enum class LogLevel {
    Error = 3,   ///< Error condition
    Warning = 4, ///< Warning condition
    Notice = 5,  ///< Normal but significant
    Info = 6,    ///< Informational
    Debug = 7    ///< Debug-level
};

/// Return a short name for the given log level ("ERR", "WARN", etc.)
[[nodiscard]] inline const char *log_level_name(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Error:
        return "ERR";
    case LogLevel::Warning:
        return "WARN";
    case LogLevel::Notice:
        return "NOTICE";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Debug:
        return "DEBUG";
    default:
        return "???";
    }
}

/// Log handler callback type
using LogHandler = std::function<void(LogLevel, std::string_view)>;

namespace detail {

inline std::mutex log_mutex;
inline LogHandler log_handler_fn;

} // namespace detail

/// Install a process-wide log handler.
///
/// Replaces any previously installed handler. The handler is called from
/// whichever thread emits the log message; it must be thread-safe.
inline void set_log_handler(LogHandler handler) {
    std::lock_guard<std::mutex> lock(detail::log_mutex);
    detail::log_handler_fn = std::move(handler);
}

/// Remove the current log handler.
inline void clear_log_handler() noexcept {
    std::lock_guard<std::mutex> lock(detail::log_mutex);
    detail::log_handler_fn = nullptr;
}

/// True when a handler is installed.
[[nodiscard]] inline bool log_enabled() noexcept {
    std::lock_guard<std::mutex> lock(detail::log_mutex);
    return static_cast<bool>(detail::log_handler_fn);
}

/// Emit a log message through the registered handler (if any).
///
/// No-op when no handler is installed. Thread-safe.
inline void log_emit(LogLevel level, std::string_view msg) {
    std::lock_guard<std::mutex> lock(detail::log_mutex);
    if (detail::log_handler_fn) {
        detail::log_handler_fn(level, msg);
    }
}

} // namespace fastdd

#endif // FASTDD_LOG_HPP
