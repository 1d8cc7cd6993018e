/**
 * @file ring.hpp
 * @brief Submission/completion ring interface
 *
 * The copy engine and the registrar only talk to this interface.
 * UringRing implements it over io_uring; tests supply their own.
 */

#ifndef FASTDD_RING_HPP
#define FASTDD_RING_HPP

#include <fastdd/buffer.hpp>

#include <cstdint>
#include <span>

#include <sys/uio.h>

namespace fastdd {

/**
 * Operation type
 */
enum class OpKind {
    Read,  /**< Read from file into buffer */
    Write  /**< Write from buffer to file */
};

/// Registered file slot of the copy source
inline constexpr int INPUT_FILE_INDEX = 0;
/// Registered file slot of the copy destination
inline constexpr int OUTPUT_FILE_INDEX = 1;

/**
 * One read or write to queue on a ring
 *
 * Files are always addressed by registered slot. A fixed op addresses
 * buffer.index() in the registered buffer table; the bytes it touches
 * are still the ones the view describes.
 */
struct IoOp {
    OpKind kind;
    int file_index;     /**< Registered file slot */
    BufferView buffer;  /**< Bytes to fill (read) or drain (write) */
    uint64_t offset;    /**< File offset */
    bool fixed;         /**< Use the registered buffer table */
    uint64_t user_data; /**< Echoed back in the completion */
};

/**
 * Completion queue entry
 */
struct Completion {
    uint64_t user_data; /**< From the originating IoOp */
    int32_t result;     /**< Bytes transferred, or negative errno */
};

/**
 * Asynchronous I/O ring
 *
 * Methods report failures by throwing Error. Not thread-safe.
 */
class Ring {
  public:
    virtual ~Ring() = default;

    /// Submission queue entries
    [[nodiscard]] virtual unsigned depth() const noexcept = 0;

    /**
     * Queue an operation without submitting it
     * @return False if the submission queue is full
     */
    [[nodiscard]] virtual bool prepare(const IoOp &op) = 0;

    /**
     * Submit queued operations without waiting
     * @return Number of operations handed to the kernel
     */
    virtual unsigned submit() = 0;

    /**
     * Submit queued operations and block for completions
     * @param wait_nr Completions to wait for
     */
    virtual void submit_and_wait(unsigned wait_nr) = 0;

    /// True if operations are queued but not yet submitted
    [[nodiscard]] virtual bool has_unsubmitted() const noexcept = 0;

    /**
     * Pop the next available completion
     * @return False if the completion queue is empty
     */
    [[nodiscard]] virtual bool next_completion(Completion &out) = 0;

    virtual void register_buffers(std::span<const iovec> bufs) = 0;
    virtual void unregister_buffers() = 0;
    virtual void register_files(std::span<const int> fds) = 0;
    virtual void unregister_files() = 0;
};

} // namespace fastdd

#endif // FASTDD_RING_HPP
