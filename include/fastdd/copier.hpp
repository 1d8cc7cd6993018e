/**
 * @file copier.hpp
 * @brief Asynchronous copy engine
 */

#ifndef FASTDD_COPIER_HPP
#define FASTDD_COPIER_HPP

#include <fastdd/buffer.hpp>
#include <fastdd/fwd.hpp>
#include <fastdd/options.hpp>
#include <fastdd/stats.hpp>

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>

namespace fastdd {

/**
 * Byte range of one copy run
 */
struct CopyPlan {
    uint64_t input_base = 0;  /**< First input byte (input_seek * block_size) */
    uint64_t output_base = 0; /**< First output byte (output_seek * block_size) */
    uint64_t total_size = 0;  /**< Bytes to copy */
    uint64_t num_blocks = 0;  /**< ceil(total_size / block_size) */
};

/**
 * Work out what a run copies
 *
 * @param file_length Input file length in bytes
 * @param opts Run options (block_size must be > 0)
 * @throws SeekRangeError if the input seek lies beyond file_length
 */
[[nodiscard]] CopyPlan plan_copy(uint64_t file_length, const Options &opts);

/**
 * Length of an open file
 * @throws Error on fstat failure
 */
[[nodiscard]] uint64_t file_length(int fd);

/**
 * Copies a byte range between two files through a Ring
 *
 * Keeps up to opts.num_buffers() reads and writes in flight. Each buffer
 * cycles Free -> reading -> writing -> Free; short reads leave their
 * remainder in a backlog that is served before fresh ranges, short writes
 * are reissued from the same buffer until the range is committed.
 *
 * Example:
 * @code
 * fastdd::UringRing ring(256);
 * fastdd::Copier copier(ring, in_fd, out_fd, fastdd::Options().num_buffers(128));
 * uint64_t copied = copier.run();
 * @endcode
 */
class Copier {
  public:
    /**
     * @param ring Ring to drive (must have no registered buffers or files)
     * @param input_fd Source, open for reading
     * @param output_fd Destination, open for writing
     * @param opts Run options
     */
    Copier(Ring &ring, int input_fd, int output_fd, const Options &opts);

    Copier(const Copier &) = delete;
    Copier &operator=(const Copier &) = delete;

    /**
     * Copy the planned range
     *
     * Registered buffers and files are released before this returns or
     * throws, and the progress reporter (if enabled) has exited.
     *
     * @return Bytes copied (the plan's total_size)
     * @throws Error (EINVAL) on invalid options
     * @throws SeekRangeError, ResourceQueryError, RegistrationError,
     *         IoError, InvariantViolation as described in error.hpp
     */
    uint64_t run();

    /// Plan of the last run()
    [[nodiscard]] const CopyPlan &plan() const noexcept { return plan_; }

    /// Statistics of the last run()
    [[nodiscard]] const CopyStats &stats() const noexcept { return stats_; }

    /// Bytes written so far; safe to read from any thread
    [[nodiscard]] const std::atomic<uint64_t> &bytes_written() const noexcept {
        return bytes_written_;
    }

  private:
    void drive();
    void drain_in_flight() noexcept;
    void enqueue(const IoOp &op);
    void submit_read(size_t index, uint64_t offset, uint64_t size);
    void submit_write(size_t index, size_t buffer_offset, uint64_t offset, uint64_t size,
                      bool finishes_block);
    void on_read(size_t index, int32_t result);
    void on_write(size_t index, int32_t result);

    Ring &ring_;
    int input_fd_;
    int output_fd_;
    const Options opts_;
    CopyPlan plan_;
    CopyStats stats_;
    std::atomic<uint64_t> bytes_written_{0};

    /* Drive loop state, reset by run() */
    std::unique_ptr<BufferPool> pool_;
    size_t registered_ = 0;
    std::deque<Range> backlog_;
    uint64_t consumed_ = 0;
    uint64_t completed_blocks_ = 0;
    uint64_t in_flight_ = 0;
};

/**
 * Copy between two open files over a fresh io_uring ring
 *
 * Creates a UringRing of opts.ring_size() entries and runs a Copier.
 *
 * @return Bytes copied
 * @throws Error and subclasses, as Copier::run()
 */
uint64_t copy(int input_fd, int output_fd, const Options &opts);

} // namespace fastdd

#endif // FASTDD_COPIER_HPP
