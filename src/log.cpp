/**
 * @file log.cpp
 * @brief Internal logging helpers
 */

#include "log.h"

#include <cstdarg>
#include <cstdio>

namespace fastdd {

void log_printf(LogLevel level, const char *fmt, ...) {
    if (!log_enabled()) return;

    char buf[512];
    va_list ap;
    va_start(ap, fmt);
    int n = vsnprintf(buf, sizeof(buf), fmt, ap);
    va_end(ap);
    if (n < 0) return;

    log_emit(level, buf);
}

} // namespace fastdd
