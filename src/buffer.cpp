/**
 * @file buffer.cpp
 * @brief Fixed buffer pool and per-buffer transfer ledger
 */

#include <fastdd/buffer.hpp>
#include <fastdd/error.hpp>

#include <cstring>
#include <stdexcept>
#include <string>

namespace fastdd {

BufferPool::BufferPool(size_t count, size_t block_size)
    : block_size_(block_size)
{
    if (count == 0 || block_size == 0) {
        throw Error(EINVAL, "buffer pool needs a nonzero count and block size");
    }

    entries_.resize(count);
    for (size_t i = 0; i < count; i++) {
        void *p = nullptr;
        int ret = posix_memalign(&p, ALIGNMENT, block_size);
        if (ret != 0) {
            throw Error(ret, "posix_memalign");
        }
        memset(p, 0, block_size);
        entries_[i].memory.reset(static_cast<std::byte *>(p));
        free_.push_back(i);
    }
}

std::optional<size_t> BufferPool::acquire() noexcept {
    if (free_.empty()) return std::nullopt;

    size_t index = free_.front();
    free_.pop_front();
    entries_[index].free = false;
    return index;
}

void BufferPool::release(size_t index) {
    Entry &e = entry(index);
    if (e.free) {
        throw InvariantViolation("buffer " + std::to_string(index) + " released twice");
    }
    e.free = true;
    free_.push_back(index);
}

void BufferPool::record_read(size_t index, uint64_t offset, uint64_t size) {
    entry(index).read = Range{offset, size};
}

void BufferPool::record_write(size_t index, uint64_t offset, uint64_t size,
                              bool finishes_block) {
    Entry &e = entry(index);
    e.write = Range{offset, size};
    e.finishes_block = finishes_block;
}

BufferView BufferPool::view(size_t index, size_t offset, size_t length) {
    Entry &e = entry(index);
    if (offset > block_size_ || length > block_size_ - offset) {
        throw std::out_of_range("buffer view exceeds block size");
    }
    return BufferView(index, std::span<std::byte>(e.memory.get() + offset, length));
}

std::vector<iovec> BufferPool::iovecs(size_t count) const {
    if (count > entries_.size()) {
        throw std::out_of_range("iovec count exceeds pool size");
    }

    std::vector<iovec> iov(count);
    for (size_t i = 0; i < count; i++) {
        iov[i].iov_base = entries_[i].memory.get();
        iov[i].iov_len = block_size_;
    }
    return iov;
}

const BufferPool::Entry &BufferPool::entry(size_t index) const {
    if (index >= entries_.size()) {
        throw std::out_of_range("buffer index out of range");
    }
    return entries_[index];
}

BufferPool::Entry &BufferPool::entry(size_t index) {
    if (index >= entries_.size()) {
        throw std::out_of_range("buffer index out of range");
    }
    return entries_[index];
}

} // namespace fastdd
