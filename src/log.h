/**
 * @file log.h
 * @brief Internal logging helpers
 *
 * Internal header - not part of public API.
 */

#ifndef FASTDD_INTERNAL_LOG_H
#define FASTDD_INTERNAL_LOG_H

#include <fastdd/log.hpp>

namespace fastdd {

/**
 * Format and emit a log message through the registered handler (if any).
 *
 * No-op (and no formatting cost) when no handler is registered.
 */
void log_printf(LogLevel level, const char *fmt, ...) __attribute__((format(printf, 2, 3)));

} // namespace fastdd

#endif /* FASTDD_INTERNAL_LOG_H */
