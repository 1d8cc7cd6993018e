/**
 * @file error.hpp
 * @brief Exception hierarchy for fastdd
 */

#ifndef FASTDD_ERROR_HPP
#define FASTDD_ERROR_HPP

#include <cerrno>
#include <exception>
#include <string>
#include <string_view>
#include <system_error>

namespace fastdd {

/**
 * Base exception for fastdd errors
 *
 * Wraps errno values with optional context message. Every failure the
 * engine reports derives from this class.
 */
class Error : public std::exception {
public:
    /**
     * Construct error from errno value
     *
     * @param err Error code (positive errno value)
     * @param context Optional context message
     */
    explicit Error(int err, std::string_view context = {})
        : code_(err)
    {
        // generic_category().message() is thread-safe, strerror() is not
        std::string errmsg = std::generic_category().message(err);
        if (context.empty()) {
            message_ = std::move(errmsg);
        } else {
            message_ = std::string(context) + ": " + errmsg;
        }
    }

    /**
     * Get the error code
     * @return Positive errno value
     */
    [[nodiscard]] int code() const noexcept { return code_; }

    /**
     * Get human-readable error message
     * @return Error message string
     */
    [[nodiscard]] const char* what() const noexcept override {
        return message_.c_str();
    }

    [[nodiscard]] bool is_invalid() const noexcept { return code_ == EINVAL; }
    [[nodiscard]] bool is_again() const noexcept { return code_ == EAGAIN; }
    [[nodiscard]] bool is_not_supported() const noexcept {
        return code_ == ENOSYS || code_ == EOPNOTSUPP;
    }
    [[nodiscard]] bool is_permission() const noexcept {
        return code_ == EPERM || code_ == EACCES;
    }

private:
    int code_;
    std::string message_;
};

/// The RLIMIT_MEMLOCK budget could not be queried.
class ResourceQueryError : public Error {
public:
    using Error::Error;
};

/// The kernel rejected buffer or file (un)registration.
class RegistrationError : public Error {
public:
    using Error::Error;
};

/// A read or write completion reported a failure.
class IoError : public Error {
public:
    using Error::Error;
};

/// Input seek offset lies beyond the end of the input file.
class SeekRangeError : public Error {
public:
    explicit SeekRangeError(std::string_view context)
        : Error(EINVAL, context) {}
};

/// A completion contradicted the request it belongs to.
class InvariantViolation : public Error {
public:
    explicit InvariantViolation(std::string_view context)
        : Error(EPROTO, context) {}
};

/**
 * Throw Error if condition is false
 *
 * @param condition Condition to check
 * @param context Error context message
 * @throws Error with current errno if condition is false
 */
inline void check(bool condition, std::string_view context = {}) {
    if (!condition) {
        throw Error(errno, context);
    }
}

/**
 * Throw Error from current errno
 *
 * @param context Error context message
 * @throws Error with current errno
 */
[[noreturn]] inline void throw_errno(std::string_view context = {}) {
    throw Error(errno, context);
}

} // namespace fastdd

#endif // FASTDD_ERROR_HPP
