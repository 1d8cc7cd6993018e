/**
 * @file uring.cpp
 * @brief io_uring implementation of the Ring interface
 */

#include <fastdd/uring.hpp>
#include <fastdd/error.hpp>

#include "log.h"

#include <climits>

namespace fastdd {

UringRing::UringRing(unsigned entries)
    : depth_(entries)
{
    if (entries == 0) {
        throw Error(EINVAL, "io_uring_queue_init: ring size must be greater than 0");
    }
    int ret = io_uring_queue_init(entries, &ring_, 0);
    if (ret < 0) {
        throw Error(-ret, "io_uring_queue_init");
    }
    log_printf(LogLevel::Debug, "ring created: fd=%d entries=%u", ring_.ring_fd, entries);
}

UringRing::~UringRing() {
    io_uring_queue_exit(&ring_);
}

bool UringRing::prepare(const IoOp &op) {
    if (op.buffer.size() > UINT_MAX) {
        throw Error(EINVAL, "operation length exceeds UINT_MAX");
    }

    struct io_uring_sqe *sqe = io_uring_get_sqe(&ring_);
    if (!sqe) return false;

    auto len = static_cast<unsigned>(op.buffer.size());
    auto buf_index = static_cast<int>(op.buffer.index());
    void *addr = op.buffer.data();

    if (op.kind == OpKind::Read) {
        if (op.fixed) {
            io_uring_prep_read_fixed(sqe, op.file_index, addr, len, op.offset, buf_index);
        } else {
            io_uring_prep_read(sqe, op.file_index, addr, len, op.offset);
        }
    } else {
        if (op.fixed) {
            io_uring_prep_write_fixed(sqe, op.file_index, addr, len, op.offset, buf_index);
        } else {
            io_uring_prep_write(sqe, op.file_index, addr, len, op.offset);
        }
    }
    sqe->flags |= IOSQE_FIXED_FILE;
    io_uring_sqe_set_data64(sqe, op.user_data);
    return true;
}

unsigned UringRing::submit() {
    int ret;
    do {
        ret = io_uring_submit(&ring_);
    } while (ret == -EINTR);

    if (ret < 0) {
        throw Error(-ret, "io_uring_submit");
    }
    return static_cast<unsigned>(ret);
}

void UringRing::submit_and_wait(unsigned wait_nr) {
    int ret;
    do {
        ret = io_uring_submit_and_wait(&ring_, wait_nr);
    } while (ret == -EINTR);

    if (ret < 0) {
        throw Error(-ret, "io_uring_submit_and_wait");
    }
}

bool UringRing::has_unsubmitted() const noexcept {
    return io_uring_sq_ready(&ring_) > 0;
}

bool UringRing::next_completion(Completion &out) {
    struct io_uring_cqe *cqe = nullptr;
    int ret = io_uring_peek_cqe(&ring_, &cqe);
    if (ret == -EAGAIN || !cqe) return false;
    if (ret < 0) {
        throw Error(-ret, "io_uring_peek_cqe");
    }

    out.user_data = io_uring_cqe_get_data64(cqe);
    out.result = cqe->res;
    io_uring_cqe_seen(&ring_, cqe);
    return true;
}

void UringRing::register_buffers(std::span<const iovec> bufs) {
    if (bufs.size() > static_cast<size_t>(UINT_MAX)) {
        throw Error(EINVAL, "buffer count exceeds UINT_MAX");
    }
    int ret = io_uring_register_buffers(&ring_, bufs.data(), static_cast<unsigned>(bufs.size()));
    if (ret < 0) {
        throw Error(-ret, "io_uring_register_buffers");
    }
}

void UringRing::unregister_buffers() {
    int ret = io_uring_unregister_buffers(&ring_);
    if (ret < 0) {
        throw Error(-ret, "io_uring_unregister_buffers");
    }
}

void UringRing::register_files(std::span<const int> fds) {
    if (fds.size() > static_cast<size_t>(UINT_MAX)) {
        throw Error(EINVAL, "file count exceeds UINT_MAX");
    }
    int ret = io_uring_register_files(&ring_, fds.data(), static_cast<unsigned>(fds.size()));
    if (ret < 0) {
        throw Error(-ret, "io_uring_register_files");
    }
}

void UringRing::unregister_files() {
    int ret = io_uring_unregister_files(&ring_);
    if (ret < 0) {
        throw Error(-ret, "io_uring_unregister_files");
    }
}

} // namespace fastdd
