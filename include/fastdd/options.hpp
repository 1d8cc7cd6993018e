/**
 * @file options.hpp
 * @brief Options builder class for fastdd
 */

#ifndef FASTDD_OPTIONS_HPP
#define FASTDD_OPTIONS_HPP

#include <fastdd/error.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <optional>

namespace fastdd {

/**
 * Copy run configuration
 *
 * Uses builder pattern for fluent configuration.
 *
 * Example:
 * @code
 * fastdd::Options opts;
 * opts.block_size(64 * 1024)
 *     .count(100)
 *     .num_buffers(32)
 *     .ring_size(64);
 *
 * uint64_t copied = fastdd::copy(in_fd, out_fd, opts);
 * @endcode
 */
class Options {
  public:
    static constexpr size_t DEFAULT_BLOCK_SIZE = 4096;
    static constexpr unsigned DEFAULT_RING_SIZE = 256;
    static constexpr size_t DEFAULT_NUM_BUFFERS = 128;
    static constexpr std::chrono::milliseconds DEFAULT_PROGRESS_INTERVAL{1000};

    Options() noexcept = default;

    /**
     * Set the block size
     * @param bytes Bytes per block and per buffer (default: 4096)
     * @return Reference to this for chaining
     */
    Options &block_size(size_t bytes) noexcept {
        block_size_ = bytes;
        return *this;
    }

    /**
     * Limit the copy to a number of blocks
     * @param blocks Block count (unset = rest of the input)
     * @return Reference to this for chaining
     */
    Options &count(uint64_t blocks) noexcept {
        count_ = blocks;
        return *this;
    }

    /**
     * Copy to the end of the input
     * @return Reference to this for chaining
     */
    Options &clear_count() noexcept {
        count_.reset();
        return *this;
    }

    /**
     * Set input seek offset
     * @param blocks Offset into the input, in blocks
     * @return Reference to this for chaining
     */
    Options &input_seek(uint64_t blocks) noexcept {
        input_seek_ = blocks;
        return *this;
    }

    /**
     * Set output seek offset
     * @param blocks Offset into the output, in blocks
     * @return Reference to this for chaining
     */
    Options &output_seek(uint64_t blocks) noexcept {
        output_seek_ = blocks;
        return *this;
    }

    /**
     * Set ring depth
     * @param entries Submission queue entries (default: 256)
     * @return Reference to this for chaining
     */
    Options &ring_size(unsigned entries) noexcept {
        ring_size_ = entries;
        return *this;
    }

    /**
     * Set buffer pool size
     * @param count Number of block-sized buffers (default: 128)
     * @return Reference to this for chaining
     */
    Options &num_buffers(size_t count) noexcept {
        num_buffers_ = count;
        return *this;
    }

    /**
     * Enable the progress reporter
     * @param enable True to render progress on stderr
     * @return Reference to this for chaining
     */
    Options &progress(bool enable = true) noexcept {
        progress_ = enable;
        return *this;
    }

    /**
     * Set progress refresh interval
     * @param interval Time between progress lines (default: 1s)
     * @return Reference to this for chaining
     */
    Options &progress_interval(std::chrono::milliseconds interval) noexcept {
        progress_interval_ = interval;
        return *this;
    }

    /**
     * Set progress output stream
     * @param out Stream the reporter renders to (default: stderr, not closed)
     * @return Reference to this for chaining
     */
    Options &progress_output(FILE *out) noexcept {
        progress_output_ = out;
        return *this;
    }

    /**
     * Override the RLIMIT_MEMLOCK budget
     *
     * The engine normally queries the process limit. An override caps the
     * bytes of buffer memory registered with the kernel.
     *
     * @param bytes Pinned-memory budget in bytes
     * @return Reference to this for chaining
     */
    Options &memlock_limit(uint64_t bytes) noexcept {
        memlock_limit_ = bytes;
        return *this;
    }

    /**
     * Set ring depth and buffer count from optional user input
     *
     * With only a ring size, half as many buffers are used (one buffer for a
     * one-entry ring). With only a buffer count, the ring is twice as deep.
     * With neither, the defaults apply.
     *
     * @param ring_size Requested ring depth, if any
     * @param num_buffers Requested buffer count, if any
     * @return Reference to this for chaining
     * @throws Error (EINVAL) if a given value is zero
     */
    Options &derive_shape(std::optional<unsigned> ring_size, std::optional<size_t> num_buffers) {
        if ((ring_size && *ring_size == 0) || (num_buffers && *num_buffers == 0)) {
            throw Error(EINVAL, "ring size and number of buffers must be greater than 0");
        }
        if (ring_size && num_buffers) {
            ring_size_ = *ring_size;
            num_buffers_ = *num_buffers;
        } else if (ring_size) {
            ring_size_ = *ring_size;
            num_buffers_ = *ring_size == 1 ? 1 : *ring_size / 2;
        } else if (num_buffers) {
            ring_size_ = static_cast<unsigned>(*num_buffers * 2);
            num_buffers_ = *num_buffers;
        } else {
            ring_size_ = DEFAULT_RING_SIZE;
            num_buffers_ = DEFAULT_NUM_BUFFERS;
        }
        return *this;
    }

    /**
     * Check that the configuration can drive a copy
     * @throws Error (EINVAL) on a zero block size, ring size or buffer count
     */
    void validate() const {
        if (block_size_ == 0) {
            throw Error(EINVAL, "block size must be greater than 0");
        }
        if (ring_size_ == 0) {
            throw Error(EINVAL, "ring size must be greater than 0");
        }
        if (num_buffers_ == 0) {
            throw Error(EINVAL, "number of buffers must be greater than 0");
        }
    }

    // Getters
    [[nodiscard]] size_t block_size() const noexcept { return block_size_; }
    [[nodiscard]] std::optional<uint64_t> count() const noexcept { return count_; }
    [[nodiscard]] uint64_t input_seek() const noexcept { return input_seek_; }
    [[nodiscard]] uint64_t output_seek() const noexcept { return output_seek_; }
    [[nodiscard]] unsigned ring_size() const noexcept { return ring_size_; }
    [[nodiscard]] size_t num_buffers() const noexcept { return num_buffers_; }
    [[nodiscard]] bool progress() const noexcept { return progress_; }
    [[nodiscard]] std::chrono::milliseconds progress_interval() const noexcept {
        return progress_interval_;
    }
    [[nodiscard]] FILE *progress_output() const noexcept { return progress_output_; }
    [[nodiscard]] std::optional<uint64_t> memlock_limit() const noexcept { return memlock_limit_; }

  private:
    size_t block_size_ = DEFAULT_BLOCK_SIZE;
    std::optional<uint64_t> count_;
    uint64_t input_seek_ = 0;
    uint64_t output_seek_ = 0;
    unsigned ring_size_ = DEFAULT_RING_SIZE;
    size_t num_buffers_ = DEFAULT_NUM_BUFFERS;
    bool progress_ = false;
    std::chrono::milliseconds progress_interval_ = DEFAULT_PROGRESS_INTERVAL;
    FILE *progress_output_ = stderr;
    std::optional<uint64_t> memlock_limit_;
};

} // namespace fastdd

#endif // FASTDD_OPTIONS_HPP
