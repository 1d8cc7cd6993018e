/**
 * @file buffer.hpp
 * @brief Fixed buffer pool and per-buffer transfer ledger
 */

#ifndef FASTDD_BUFFER_HPP
#define FASTDD_BUFFER_HPP

#include <fastdd/fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include <sys/uio.h>

namespace fastdd {

/**
 * File byte range owned by a buffer for one phase of its transfer
 */
struct Range {
    uint64_t offset = 0; /**< File offset */
    uint64_t size = 0;   /**< Byte count */
};

/**
 * Active sub-range of a pool buffer
 *
 * A value type with no ownership: the pool owns the memory, the view
 * names which bytes of which buffer an operation targets.
 */
class BufferView {
  public:
    BufferView(size_t index, std::span<std::byte> bytes) noexcept
        : index_(index), bytes_(bytes) {}

    /// Pool index of the underlying buffer
    [[nodiscard]] size_t index() const noexcept { return index_; }

    /// First byte of the view
    [[nodiscard]] std::byte *data() const noexcept { return bytes_.data(); }

    /// Length of the view in bytes
    [[nodiscard]] size_t size() const noexcept { return bytes_.size(); }

    /// The viewed bytes
    [[nodiscard]] std::span<std::byte> span() const noexcept { return bytes_; }

  private:
    size_t index_;
    std::span<std::byte> bytes_;
};

/**
 * Fixed pool of equal-sized, page-aligned, zero-filled buffers
 *
 * Buffers are identified by index in [0, size()). The pool keeps a FIFO
 * of free indices and, per buffer, the read-phase and write-phase range
 * of its current transfer. It performs no I/O and takes no locks; only
 * the drive loop thread may touch it.
 */
class BufferPool {
  public:
    /// Buffer alignment (O_DIRECT friendly)
    static constexpr size_t ALIGNMENT = 4096;

    /**
     * Allocate the pool
     * @param count Number of buffers (> 0)
     * @param block_size Bytes per buffer (> 0)
     * @throws Error (EINVAL) on zero arguments, (ENOMEM) on allocation failure
     */
    BufferPool(size_t count, size_t block_size);

    BufferPool(const BufferPool &) = delete;
    BufferPool &operator=(const BufferPool &) = delete;

    /**
     * Take the oldest free buffer
     * @return Buffer index, or nullopt when every buffer is in use
     */
    [[nodiscard]] std::optional<size_t> acquire() noexcept;

    /**
     * Return a buffer to the back of the free queue
     * @param index Buffer index
     * @throws std::out_of_range on a bad index
     * @throws InvariantViolation if the buffer is already free
     */
    void release(size_t index);

    /**
     * Record the range a buffer is reading
     */
    void record_read(size_t index, uint64_t offset, uint64_t size);

    /**
     * Record the range a buffer is writing
     *
     * @param finishes_block True when this write carries the last bytes of
     *        its block (the read that filled the buffer was not short)
     */
    void record_write(size_t index, uint64_t offset, uint64_t size, bool finishes_block = true);

    [[nodiscard]] const Range &read_range(size_t index) const { return entry(index).read; }
    [[nodiscard]] const Range &write_range(size_t index) const { return entry(index).write; }
    [[nodiscard]] bool write_finishes_block(size_t index) const {
        return entry(index).finishes_block;
    }

    /**
     * View bytes [offset, offset + length) of a buffer
     * @throws std::out_of_range if the range exceeds the buffer
     */
    [[nodiscard]] BufferView view(size_t index, size_t offset, size_t length);

    /**
     * iovec table describing the first @p count buffers
     *
     * Used for kernel buffer registration; entry i maps buffer i.
     */
    [[nodiscard]] std::vector<iovec> iovecs(size_t count) const;

    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] size_t block_size() const noexcept { return block_size_; }
    [[nodiscard]] size_t free_count() const noexcept { return free_.size(); }

  private:
    struct Deleter {
        void operator()(std::byte *p) const noexcept { std::free(p); }
    };

    /* Ledger entry for one buffer */
    struct Entry {
        std::unique_ptr<std::byte, Deleter> memory;
        Range read;
        Range write;
        bool finishes_block = true;
        bool free = true;
    };

    const Entry &entry(size_t index) const;
    Entry &entry(size_t index);

    size_t block_size_;
    std::vector<Entry> entries_;
    std::deque<size_t> free_;
};

} // namespace fastdd

#endif // FASTDD_BUFFER_HPP
