/**
 * @file syslog.hpp
 * @brief Syslog log handler for fastdd
 *
 * Forwards fastdd log messages to syslog(3). LogLevel values map directly
 * to syslog priorities:
 *   LogLevel::Error   (3) -> LOG_ERR     (3)
 *   LogLevel::Warning (4) -> LOG_WARNING (4)
 *   LogLevel::Notice  (5) -> LOG_NOTICE  (5)
 *   LogLevel::Info    (6) -> LOG_INFO    (6)
 *   LogLevel::Debug   (7) -> LOG_DEBUG   (7)
 */

#ifndef FASTDD_SYSLOG_HPP
#define FASTDD_SYSLOG_HPP

namespace fastdd {

/**
 * Syslog configuration options
 *
 * A value of -1 means "use default" for numeric fields.
 */
struct SyslogOptions {
    const char *ident = "fastdd"; /**< openlog ident; must outlive the handler */
    int facility = -1;            /**< Syslog facility (default: LOG_USER) */
    int log_options = -1;         /**< openlog() flags (default: LOG_PID | LOG_NDELAY) */
};

/**
 * Install a syslog-forwarding log handler
 *
 * Calls openlog() then replaces the process-wide log handler.
 */
void install_syslog_handler(const SyslogOptions &options = {});

/**
 * Remove the log handler and close syslog
 */
void remove_syslog_handler() noexcept;

} // namespace fastdd

#endif // FASTDD_SYSLOG_HPP
