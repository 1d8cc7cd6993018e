/**
 * @file syslog.cpp
 * @brief Syslog log handler for fastdd
 */

#include <fastdd/syslog.hpp>
#include <fastdd/log.hpp>

#include <string>

#include <syslog.h>

namespace fastdd {

void install_syslog_handler(const SyslogOptions &options) {
    const char *ident = options.ident ? options.ident : "fastdd";
    int facility = options.facility >= 0 ? options.facility : LOG_USER;
    int log_options = options.log_options >= 0 ? options.log_options : (LOG_PID | LOG_NDELAY);

    openlog(ident, log_options, facility);

    set_log_handler([](LogLevel level, std::string_view msg) {
        // syslog() needs a NUL-terminated string
        std::string tmp(msg);
        syslog(static_cast<int>(level), "%s", tmp.c_str());
    });
}

void remove_syslog_handler() noexcept {
    clear_log_handler();
    closelog();
}

} // namespace fastdd
