/**
 * @file internal.h
 * @brief Shared internal utilities
 *
 * Internal header - not part of public API.
 */

#ifndef FASTDD_INTERNAL_H
#define FASTDD_INTERNAL_H

#include <cstddef>
#include <cstdint>
#include <time.h>

namespace fastdd {

/** Completion tag of a read operation */
inline constexpr uint64_t TAG_READ = 0;
/** Completion tag of a write operation */
inline constexpr uint64_t TAG_WRITE = 1;

/**
 * Get monotonic time in nanoseconds.
 *
 * @return Current time in nanoseconds
 */
inline int64_t get_time_ns() {
    struct timespec ts;
    if (clock_gettime(CLOCK_MONOTONIC, &ts) != 0) {
        return 0;
    }
    return static_cast<int64_t>(ts.tv_sec) * 1000000000LL + ts.tv_nsec;
}

/**
 * Pack a buffer index and operation tag into completion user data.
 */
inline uint64_t encode_user_data(size_t index, uint64_t tag) {
    return static_cast<uint64_t>(index) << 1 | tag;
}

inline size_t user_data_index(uint64_t user_data) {
    return static_cast<size_t>(user_data >> 1);
}

inline uint64_t user_data_tag(uint64_t user_data) {
    return user_data & 1;
}

} // namespace fastdd

#endif /* FASTDD_INTERNAL_H */
