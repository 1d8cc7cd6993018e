/**
 * @file copier.cpp
 * @brief Asynchronous copy engine
 *
 * Buffer life cycle:
 *
 *   Free -> ReadPending -(short)-> WritePending (remainder to backlog)
 *                       -(full)--> WritePending -(short)-> WritePending
 *                                               -(full)--> Free
 *
 * A buffer holds at most one outstanding operation, so its read and its
 * write never overlap. Reads from the backlog are issued before fresh
 * ranges.
 */

#include <fastdd/copier.hpp>
#include <fastdd/error.hpp>
#include <fastdd/progress.hpp>
#include <fastdd/registrar.hpp>
#include <fastdd/ring.hpp>
#include <fastdd/uring.hpp>

#include "internal.h"
#include "log.h"

#include <algorithm>
#include <array>
#include <cinttypes>
#include <limits>
#include <optional>
#include <string>

#include <sys/stat.h>

namespace fastdd {

CopyPlan plan_copy(uint64_t file_length, const Options &opts) {
    if (opts.block_size() == 0) {
        throw Error(EINVAL, "block size must be greater than 0");
    }

    const uint64_t bs = opts.block_size();
    const uint64_t max_blocks = std::numeric_limits<uint64_t>::max() / bs;
    if (opts.output_seek() > max_blocks) {
        throw Error(EOVERFLOW, "output seek offset");
    }

    CopyPlan plan;
    plan.output_base = opts.output_seek() * bs;
    if (opts.input_seek() > max_blocks) {
        throw SeekRangeError("input seek offset beyond input length " +
                             std::to_string(file_length));
    }
    plan.input_base = opts.input_seek() * bs;

    if (plan.input_base > file_length) {
        throw SeekRangeError("input seek offset " + std::to_string(plan.input_base) +
                             " beyond input length " + std::to_string(file_length));
    }

    plan.total_size = file_length - plan.input_base;
    if (auto count = opts.count(); count && *count <= max_blocks) {
        plan.total_size = std::min(plan.total_size, *count * bs);
    }
    plan.num_blocks = plan.total_size / bs + (plan.total_size % bs != 0 ? 1 : 0);
    return plan;
}

uint64_t file_length(int fd) {
    struct stat st {};
    if (fstat(fd, &st) != 0) {
        throw_errno("fstat");
    }
    return static_cast<uint64_t>(st.st_size);
}

Copier::Copier(Ring &ring, int input_fd, int output_fd, const Options &opts)
    : ring_(ring), input_fd_(input_fd), output_fd_(output_fd), opts_(opts) {}

uint64_t Copier::run() {
    opts_.validate();

    plan_ = plan_copy(file_length(input_fd_), opts_);
    stats_ = CopyStats{};
    bytes_written_.store(0, std::memory_order_relaxed);
    backlog_.clear();
    consumed_ = 0;
    completed_blocks_ = 0;
    in_flight_ = 0;

    log_printf(LogLevel::Info,
               "copy plan: %" PRIu64 " bytes in %" PRIu64 " blocks of %zu, input base %" PRIu64
               ", output base %" PRIu64,
               plan_.total_size, plan_.num_blocks, opts_.block_size(), plan_.input_base,
               plan_.output_base);

    if (plan_.total_size == 0) return 0;

    const int64_t start_ns = get_time_ns();

    uint64_t limit = opts_.memlock_limit() ? *opts_.memlock_limit() : fastdd::memlock_limit();
    registered_ = registrable_buffers(opts_.num_buffers(), opts_.block_size(), limit);
    if (registered_ < opts_.num_buffers()) {
        log_printf(LogLevel::Warning,
                   "memlock limit %" PRIu64 " bytes: registering %zu of %zu buffers, the rest "
                   "use unregistered I/O",
                   limit, registered_, opts_.num_buffers());
    }

    pool_ = std::make_unique<BufferPool>(opts_.num_buffers(), opts_.block_size());
    const std::array<int, 2> fds{input_fd_, output_fd_};
    Registration registration(ring_, *pool_, registered_, fds);
    stats_.registered_buffers = registered_;

    // Declared after the registration so it is joined first on unwind
    std::optional<ProgressReporter> reporter;
    if (opts_.progress()) {
        reporter.emplace(bytes_written_, plan_.total_size, opts_.progress_interval(),
                         opts_.progress_output());
    }

    try {
        drive();
    } catch (...) {
        drain_in_flight();
        throw;
    }

    registration.release();
    pool_.reset();
    if (reporter) reporter->finish();

    stats_.blocks_completed = completed_blocks_;
    stats_.bytes_copied = bytes_written_.load(std::memory_order_relaxed);
    stats_.elapsed_ns = get_time_ns() - start_ns;

    log_printf(LogLevel::Info,
               "copied %" PRIu64 " bytes: %" PRIu64 " reads (%" PRIu64 " short), %" PRIu64
               " writes (%" PRIu64 " short)",
               stats_.bytes_copied, stats_.reads_submitted, stats_.short_reads,
               stats_.writes_submitted, stats_.short_writes);
    return plan_.total_size;
}

void Copier::drive() {
    const uint64_t bs = opts_.block_size();

    // A block can finish while earlier pieces of it are still being written
    while (completed_blocks_ < plan_.num_blocks || in_flight_ > 0) {
        // Fill: put every free buffer to work
        while (pool_->free_count() > 0 && (!backlog_.empty() || consumed_ < plan_.total_size)) {
            Range range;
            if (!backlog_.empty()) {
                range = backlog_.front();
                backlog_.pop_front();
            } else {
                range.offset = plan_.input_base + consumed_;
                range.size = std::min(bs, plan_.total_size - consumed_);
                consumed_ += range.size;
            }

            auto index = pool_->acquire();
            submit_read(*index, range.offset, range.size);
        }

        // Drain: block only when nothing has completed yet
        if (in_flight_ == 0) {
            throw InvariantViolation("no operation in flight with " +
                                     std::to_string(plan_.num_blocks - completed_blocks_) +
                                     " blocks outstanding");
        }

        Completion cqe;
        while (!ring_.next_completion(cqe)) {
            ring_.submit_and_wait(1);
        }
        do {
            in_flight_--;
            size_t index = user_data_index(cqe.user_data);
            if (user_data_tag(cqe.user_data) == TAG_READ) {
                on_read(index, cqe.result);
            } else {
                on_write(index, cqe.result);
            }
        } while (ring_.next_completion(cqe));

        // Flush writes queued while draining
        if (ring_.has_unsubmitted()) {
            ring_.submit();
        }
    }

    uint64_t written = bytes_written_.load(std::memory_order_relaxed);
    if (written != plan_.total_size) {
        throw InvariantViolation("wrote " + std::to_string(written) + " of " +
                                 std::to_string(plan_.total_size) + " planned bytes");
    }
}

void Copier::drain_in_flight() noexcept {
    // The kernel may still touch the buffers; wait before they are freed
    try {
        Completion cqe;
        while (in_flight_ > 0) {
            if (ring_.next_completion(cqe)) {
                in_flight_--;
            } else {
                ring_.submit_and_wait(1);
            }
        }
    } catch (const Error &e) {
        log_printf(LogLevel::Error, "abandoning %" PRIu64 " in-flight operations: %s", in_flight_,
                   e.what());
    }
}

void Copier::enqueue(const IoOp &op) {
    while (!ring_.prepare(op)) {
        ring_.submit();
    }
    in_flight_++;
}

void Copier::submit_read(size_t index, uint64_t offset, uint64_t size) {
    pool_->record_read(index, offset, size);
    enqueue(IoOp{OpKind::Read, INPUT_FILE_INDEX, pool_->view(index, 0, size), offset,
                 index < registered_, encode_user_data(index, TAG_READ)});
    stats_.reads_submitted++;
}

void Copier::submit_write(size_t index, size_t buffer_offset, uint64_t offset, uint64_t size,
                          bool finishes_block) {
    pool_->record_write(index, offset, size, finishes_block);
    enqueue(IoOp{OpKind::Write, OUTPUT_FILE_INDEX, pool_->view(index, buffer_offset, size), offset,
                 index < registered_, encode_user_data(index, TAG_WRITE)});
    stats_.writes_submitted++;
}

void Copier::on_read(size_t index, int32_t result) {
    const Range rd = pool_->read_range(index);

    if (result < 0) {
        log_printf(LogLevel::Error, "read of %" PRIu64 " bytes at offset %" PRIu64 " failed: %d",
                   rd.size, rd.offset, result);
        throw IoError(-result, "read at offset " + std::to_string(rd.offset));
    }

    auto n = static_cast<uint64_t>(result);
    if (n > rd.size) {
        throw InvariantViolation("read returned " + std::to_string(n) + " bytes, " +
                                 std::to_string(rd.size) + " requested");
    }
    if (n == 0) {
        throw IoError(EIO, "unexpected end of input at offset " + std::to_string(rd.offset));
    }

    bool full = n == rd.size;
    if (!full) {
        backlog_.push_back(Range{rd.offset + n, rd.size - n});
        stats_.short_reads++;
        log_printf(LogLevel::Debug, "short read at %" PRIu64 ": %" PRIu64 " of %" PRIu64,
                   rd.offset, n, rd.size);
    }

    // Write what arrived now; the remainder is read again on its own
    submit_write(index, 0, plan_.output_base + rd.offset - plan_.input_base, n, full);
}

void Copier::on_write(size_t index, int32_t result) {
    const Range wr = pool_->write_range(index);

    if (result < 0) {
        log_printf(LogLevel::Error, "write of %" PRIu64 " bytes at offset %" PRIu64 " failed: %d",
                   wr.size, wr.offset, result);
        throw IoError(-result, "write at offset " + std::to_string(wr.offset));
    }

    auto n = static_cast<uint64_t>(result);
    if (n > wr.size) {
        throw InvariantViolation("write returned " + std::to_string(n) + " bytes, " +
                                 std::to_string(wr.size) + " requested");
    }
    if (n == 0) {
        throw IoError(EIO, "write made no progress at offset " + std::to_string(wr.offset));
    }

    bytes_written_.fetch_add(n, std::memory_order_relaxed);

    if (n < wr.size) {
        // The buffer's data starts where its read range maps into the output
        const Range rd = pool_->read_range(index);
        uint64_t origin = plan_.output_base + rd.offset - plan_.input_base;
        auto buffer_offset = static_cast<size_t>(wr.offset + n - origin);

        stats_.short_writes++;
        log_printf(LogLevel::Debug, "short write at %" PRIu64 ": %" PRIu64 " of %" PRIu64,
                   wr.offset, n, wr.size);
        submit_write(index, buffer_offset, wr.offset + n, wr.size - n,
                     pool_->write_finishes_block(index));
        return;
    }

    if (pool_->write_finishes_block(index)) {
        completed_blocks_++;
    }
    pool_->release(index);
}

uint64_t copy(int input_fd, int output_fd, const Options &opts) {
    opts.validate();
    UringRing ring(opts.ring_size());
    Copier copier(ring, input_fd, output_fd, opts);
    return copier.run();
}

} // namespace fastdd
