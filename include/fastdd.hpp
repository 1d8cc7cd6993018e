/**
 * @file fastdd.hpp
 * @brief Main header for fastdd
 *
 * fastdd copies a byte range between two files by keeping many reads and
 * writes in flight on an io_uring ring, through a fixed pool of reusable
 * (and, within the RLIMIT_MEMLOCK budget, kernel-registered) buffers.
 *
 * Example:
 * @code
 * #include <fastdd.hpp>
 *
 * int main() {
 *     int in = open("src.bin", O_RDWR);
 *     int out = open("dst.bin", O_RDWR | O_CREAT, 0644);
 *
 *     fastdd::Options opts;
 *     opts.block_size(1 << 20).num_buffers(64).ring_size(128);
 *
 *     try {
 *         uint64_t n = fastdd::copy(in, out, opts);
 *         std::printf("copied %llu bytes\n", static_cast<unsigned long long>(n));
 *     } catch (const fastdd::Error &e) {
 *         std::fprintf(stderr, "%s\n", e.what());
 *     }
 * }
 * @endcode
 */

#ifndef FASTDD_HPP
#define FASTDD_HPP

#include <fastdd/fwd.hpp>
#include <fastdd/error.hpp>
#include <fastdd/log.hpp>
#include <fastdd/syslog.hpp>
#include <fastdd/options.hpp>
#include <fastdd/stats.hpp>
#include <fastdd/buffer.hpp>
#include <fastdd/ring.hpp>
#include <fastdd/uring.hpp>
#include <fastdd/registrar.hpp>
#include <fastdd/progress.hpp>
#include <fastdd/copier.hpp>

#endif // FASTDD_HPP
