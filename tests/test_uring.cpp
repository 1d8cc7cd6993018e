/**
 * @file test_uring.cpp
 * @brief End-to-end copies over a real io_uring ring
 *
 * Exits with 77 (skipped) when the kernel refuses to create a ring.
 */

#include <fastdd.hpp>

#include "test_harness.hpp"

#include <array>
#include <random>
#include <vector>

static constexpr int SKIP_RETURN_CODE = 77;

// =============================================================================
// Ring Tests
// =============================================================================

TEST(ring_create) {
    fastdd::UringRing ring(8);
    ASSERT_GE(ring.depth(), 8u);
    ASSERT_GE(ring.fd(), 0);
    ASSERT(!ring.has_unsubmitted());

    fastdd::Completion cqe{};
    ASSERT(!ring.next_completion(cqe));
}

TEST(ring_rejects_zero_entries) {
    ASSERT_THROWS(fastdd::UringRing ring(0), fastdd::Error);
}

TEST(ring_fixed_read) {
    TempFile in(8192);
    fastdd::UringRing ring(4);
    fastdd::BufferPool pool(1, 8192);
    const std::array<int, 1> fds{in.fd()};
    fastdd::Registration reg(ring, pool, 1, fds);

    ASSERT(ring.prepare(fastdd::IoOp{fastdd::OpKind::Read, fastdd::INPUT_FILE_INDEX,
                                     pool.view(0, 0, 4096), 4096, true, 42}));
    ASSERT(ring.has_unsubmitted());
    ring.submit_and_wait(1);

    fastdd::Completion cqe{};
    ASSERT(ring.next_completion(cqe));
    ASSERT_EQ(cqe.user_data, 42u);
    ASSERT_EQ(cqe.result, 4096);

    auto bytes = pool.view(0, 0, 4096);
    for (size_t i = 0; i < bytes.size(); i++) {
        ASSERT(static_cast<char>(bytes.data()[i]) == pattern_byte(4096 + i));
    }
    reg.release();
}

TEST(ring_reports_errors_in_completion) {
    TempFile in(4096);
    int wronly = open(in.path(), O_WRONLY);
    ASSERT_GE(wronly, 0);

    fastdd::UringRing ring(4);
    fastdd::BufferPool pool(1, 4096);
    const std::array<int, 1> fds{wronly};
    fastdd::Registration reg(ring, pool, 0, fds);

    ASSERT(ring.prepare(fastdd::IoOp{fastdd::OpKind::Read, 0, pool.view(0, 0, 4096), 0, false, 7}));
    ring.submit_and_wait(1);

    fastdd::Completion cqe{};
    ASSERT(ring.next_completion(cqe));
    ASSERT_EQ(cqe.result, -EBADF);
    reg.release();
    close(wronly);
}

// =============================================================================
// Copy Tests
// =============================================================================

TEST(copy_five_mib) {
    TempFile in(5 * 1024 * 1024);
    TempFile out;

    uint64_t copied = fastdd::copy(in.fd(), out.fd(), fastdd::Options());
    ASSERT_EQ(copied, 5u * 1024 * 1024);

    auto data = out.contents();
    ASSERT_EQ(data.size(), 5u * 1024 * 1024);
    ASSERT(matches_pattern(data, 0, 0, data.size()));
}

TEST(copy_seek_and_count) {
    TempFile in(100 * 4096 + 5);
    TempFile out;

    fastdd::Options opts;
    opts.input_seek(10).output_seek(4).count(50).derive_shape(std::nullopt, size_t{8});

    uint64_t copied = fastdd::copy(in.fd(), out.fd(), opts);
    ASSERT_EQ(copied, 50 * 4096u);

    auto data = out.contents();
    ASSERT_EQ(data.size(), 54 * 4096u);
    ASSERT(matches_pattern(data, 4 * 4096, 10 * 4096, 50 * 4096));
}

TEST(copy_tail_of_file) {
    TempFile in(100 * 4096 + 5);
    TempFile out;

    fastdd::Options opts;
    opts.input_seek(99);

    ASSERT_EQ(fastdd::copy(in.fd(), out.fd(), opts), 4096u + 5);
    ASSERT(matches_pattern(out.contents(), 0, 99 * 4096, 4096 + 5));
}

TEST(copy_seek_beyond_eof) {
    TempFile in(4096);
    TempFile out;

    fastdd::Options opts;
    opts.input_seek(2);
    ASSERT_THROWS(fastdd::copy(in.fd(), out.fd(), opts), fastdd::SeekRangeError);
}

TEST(copy_random_shapes) {
    std::mt19937 rng(12345);
    const size_t block_sizes[] = {512, 4096, 65536, 1 << 20};

    for (int round = 0; round < 8; round++) {
        size_t len = std::uniform_int_distribution<size_t>(1, 3 * 1024 * 1024)(rng);
        size_t bs = block_sizes[std::uniform_int_distribution<size_t>(0, 3)(rng)];
        size_t bufs = std::uniform_int_distribution<size_t>(1, 32)(rng);

        TempFile in(len);
        TempFile out;

        fastdd::Options opts;
        opts.block_size(bs).derive_shape(std::nullopt, bufs);

        ASSERT_EQ(fastdd::copy(in.fd(), out.fd(), opts), len);
        ASSERT(matches_pattern(out.contents(), 0, 0, len));
    }
}

TEST(copy_memlock_fallback) {
    TempFile in(64 * 4096);
    TempFile out;

    fastdd::Options opts;
    opts.num_buffers(16).ring_size(32).memlock_limit(4 * 4096);

    fastdd::UringRing ring(opts.ring_size());
    fastdd::Copier copier(ring, in.fd(), out.fd(), opts);
    ASSERT_EQ(copier.run(), 64 * 4096u);
    ASSERT_EQ(copier.stats().registered_buffers, 3u);
    ASSERT(matches_pattern(out.contents(), 0, 0, 64 * 4096));

    // No registration at all
    TempFile out2;
    opts.memlock_limit(0);
    fastdd::UringRing ring2(opts.ring_size());
    fastdd::Copier copier2(ring2, in.fd(), out2.fd(), opts);
    ASSERT_EQ(copier2.run(), 64 * 4096u);
    ASSERT_EQ(copier2.stats().registered_buffers, 0u);
    ASSERT(matches_pattern(out2.contents(), 0, 0, 64 * 4096));
}

TEST(copy_with_progress) {
    TempFile in(2 * 1024 * 1024);
    TempFile out;

    fastdd::Options opts;
    opts.progress().progress_interval(std::chrono::milliseconds(5));

    fastdd::UringRing ring(opts.ring_size());
    fastdd::Copier copier(ring, in.fd(), out.fd(), opts);
    ASSERT_EQ(copier.run(), 2u * 1024 * 1024);
    ASSERT_EQ(copier.bytes_written().load(), 2u * 1024 * 1024);
}

// =============================================================================
// Main
// =============================================================================

int main() {
    try {
        fastdd::UringRing probe(2);
    } catch (const fastdd::Error &e) {
        printf("io_uring unavailable (%s), skipping\n", e.what());
        return SKIP_RETURN_CODE;
    }

    printf("Running fastdd io_uring tests...\n");

    RUN_TEST(ring_create);
    RUN_TEST(ring_rejects_zero_entries);
    RUN_TEST(ring_fixed_read);
    RUN_TEST(ring_reports_errors_in_completion);
    RUN_TEST(copy_five_mib);
    RUN_TEST(copy_seek_and_count);
    RUN_TEST(copy_tail_of_file);
    RUN_TEST(copy_seek_beyond_eof);
    RUN_TEST(copy_random_shapes);
    RUN_TEST(copy_memlock_fallback);
    RUN_TEST(copy_with_progress);

    printf("\n%d tests passed, %d failed\n", tests_passed, tests_failed);
    return tests_failed > 0 ? 1 : 0;
}
