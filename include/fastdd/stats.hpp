/**
 * @file stats.hpp
 * @brief Per-run copy statistics
 */

#ifndef FASTDD_STATS_HPP
#define FASTDD_STATS_HPP

#include <cstddef>
#include <cstdint>

namespace fastdd {

/**
 * Counters collected by one copy run
 */
struct CopyStats {
    uint64_t bytes_copied = 0;       /**< Bytes written to the destination */
    uint64_t blocks_completed = 0;   /**< Blocks fully committed */
    uint64_t reads_submitted = 0;    /**< Read operations queued */
    uint64_t writes_submitted = 0;   /**< Write operations queued */
    uint64_t short_reads = 0;        /**< Reads that returned fewer bytes than asked */
    uint64_t short_writes = 0;       /**< Writes that accepted fewer bytes than asked */
    size_t registered_buffers = 0;   /**< Buffers using fixed I/O */
    int64_t elapsed_ns = 0;          /**< Wall time of the run */

    /// Bytes per second over the run, 0 if nothing was timed
    [[nodiscard]] double throughput_bps() const noexcept {
        return elapsed_ns > 0 ? static_cast<double>(bytes_copied) * 1e9 /
                                    static_cast<double>(elapsed_ns)
                              : 0.0;
    }
};

} // namespace fastdd

#endif // FASTDD_STATS_HPP
