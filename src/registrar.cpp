/**
 * @file registrar.cpp
 * @brief Pinned-memory budget and ring registration
 */

#include <fastdd/registrar.hpp>
#include <fastdd/buffer.hpp>
#include <fastdd/error.hpp>
#include <fastdd/ring.hpp>

#include "log.h"

#include <limits>

#include <sys/resource.h>

namespace fastdd {

uint64_t memlock_limit() {
    struct rlimit lim {};
    if (getrlimit(RLIMIT_MEMLOCK, &lim) != 0) {
        throw ResourceQueryError(errno, "getrlimit(RLIMIT_MEMLOCK)");
    }
    if (lim.rlim_cur == RLIM_INFINITY) {
        return std::numeric_limits<uint64_t>::max();
    }
    return static_cast<uint64_t>(lim.rlim_cur);
}

size_t registrable_buffers(size_t num_buffers, size_t block_size, uint64_t limit) noexcept {
    if (block_size == 0) return 0;

    bool overflows = num_buffers > std::numeric_limits<uint64_t>::max() / block_size;
    if (!overflows && static_cast<uint64_t>(num_buffers) * block_size < limit) {
        return num_buffers;
    }

    // Keep one block of headroom below the budget
    uint64_t fit = limit / block_size;
    return fit > 0 ? static_cast<size_t>(fit - 1) : 0;
}

Registration::Registration(Ring &ring, const BufferPool &pool, size_t buffers,
                           std::span<const int> fds)
    : ring_(ring), buffers_(buffers)
{
    if (buffers > 0) {
        auto iov = pool.iovecs(buffers);
        try {
            ring_.register_buffers(iov);
        } catch (const Error &e) {
            throw RegistrationError(e.code(), "register buffers");
        }
        buffers_registered_ = true;
    }

    try {
        ring_.register_files(fds);
    } catch (const Error &e) {
        if (buffers_registered_) {
            try {
                ring_.unregister_buffers();
            } catch (const Error &undo) {
                log_printf(LogLevel::Warning, "unregister buffers after failed file registration: %s",
                           undo.what());
            }
            buffers_registered_ = false;
        }
        throw RegistrationError(e.code(), "register files");
    }
    files_registered_ = true;

    log_printf(LogLevel::Info, "registered %zu of %zu buffers (%zu bytes each) and %zu files",
               buffers, pool.size(), pool.block_size(), fds.size());
}

Registration::~Registration() {
    try {
        release();
    } catch (const Error &e) {
        log_printf(LogLevel::Warning, "%s", e.what());
    }
}

void Registration::release() {
    // Clear the flags first so a failure is reported only once
    if (files_registered_) {
        files_registered_ = false;
        try {
            ring_.unregister_files();
        } catch (const Error &e) {
            if (buffers_registered_) {
                buffers_registered_ = false;
                try {
                    ring_.unregister_buffers();
                } catch (const Error &also) {
                    log_printf(LogLevel::Warning, "%s", also.what());
                }
            }
            throw RegistrationError(e.code(), "unregister files");
        }
    }
    if (buffers_registered_) {
        buffers_registered_ = false;
        try {
            ring_.unregister_buffers();
        } catch (const Error &e) {
            throw RegistrationError(e.code(), "unregister buffers");
        }
    }
}

} // namespace fastdd
