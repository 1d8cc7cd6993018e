/**
 * @file test_harness.hpp
 * @brief Minimal test macros and file helpers shared by the fastdd tests
 */

#ifndef FASTDD_TEST_HARNESS_HPP
#define FASTDD_TEST_HARNESS_HPP

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name) void test_##name()
#define RUN_TEST(name)                                                                             \
    do {                                                                                           \
        printf("  %-44s", #name);                                                                  \
        fflush(stdout);                                                                            \
        try {                                                                                      \
            test_##name();                                                                         \
            printf(" OK\n");                                                                       \
            tests_passed++;                                                                        \
        } catch (const std::exception &e) {                                                        \
            printf(" FAIL: %s\n", e.what());                                                       \
            tests_failed++;                                                                        \
        } catch (...) {                                                                            \
            printf(" FAIL: unknown exception\n");                                                  \
            tests_failed++;                                                                        \
        }                                                                                          \
    } while (0)

#define ASSERT(cond)                                                                               \
    do {                                                                                           \
        if (!(cond)) {                                                                             \
            throw std::runtime_error("Assertion failed: " #cond);                                  \
        }                                                                                          \
    } while (0)

#define ASSERT_EQ(a, b)                                                                            \
    do {                                                                                           \
        if ((a) != (b)) {                                                                          \
            throw std::runtime_error("Assertion failed: " #a " == " #b);                           \
        }                                                                                          \
    } while (0)

#define ASSERT_NE(a, b)                                                                            \
    do {                                                                                           \
        if ((a) == (b)) {                                                                          \
            throw std::runtime_error("Assertion failed: " #a " != " #b);                           \
        }                                                                                          \
    } while (0)

#define ASSERT_GT(a, b)                                                                            \
    do {                                                                                           \
        if (!((a) > (b))) {                                                                        \
            throw std::runtime_error("Assertion failed: " #a " > " #b);                            \
        }                                                                                          \
    } while (0)

#define ASSERT_GE(a, b)                                                                            \
    do {                                                                                           \
        if (!((a) >= (b))) {                                                                       \
            throw std::runtime_error("Assertion failed: " #a " >= " #b);                           \
        }                                                                                          \
    } while (0)

#define ASSERT_THROWS(expr, exc_type)                                                              \
    do {                                                                                           \
        bool caught = false;                                                                       \
        try {                                                                                      \
            expr;                                                                                  \
        } catch (const exc_type &) {                                                               \
            caught = true;                                                                         \
        } catch (...) {                                                                            \
        }                                                                                          \
        if (!caught) {                                                                             \
            throw std::runtime_error("Expected exception " #exc_type " not thrown");               \
        }                                                                                          \
    } while (0)

// =============================================================================
// Helper: temporary files with a position-dependent pattern
// =============================================================================

/* Byte stored at offset i of every pattern file */
inline char pattern_byte(uint64_t i) {
    return static_cast<char>((i * 2654435761u) >> 13);
}

class TempFile {
  public:
    explicit TempFile(size_t size = 0) {
        snprintf(path_, sizeof(path_), "/tmp/fastdd_test_XXXXXX");
        fd_ = mkstemp(path_);
        if (fd_ < 0) {
            throw std::runtime_error("Failed to create temp file");
        }

        if (size > 0) {
            std::vector<char> buf(size);
            for (size_t i = 0; i < size; i++) {
                buf[i] = pattern_byte(i);
            }
            ssize_t n = ::write(fd_, buf.data(), size);
            if (n != static_cast<ssize_t>(size)) {
                throw std::runtime_error("Failed to write test data");
            }
            fsync(fd_);
        }
    }

    TempFile(const TempFile &) = delete;
    TempFile &operator=(const TempFile &) = delete;

    ~TempFile() {
        if (fd_ >= 0) close(fd_);
        unlink(path_);
    }

    int fd() const { return fd_; }
    const char *path() const { return path_; }

    // Whole file contents
    std::vector<char> contents() const {
        struct stat st {};
        if (fstat(fd_, &st) != 0) {
            throw std::runtime_error("Failed to stat temp file");
        }
        std::vector<char> buf(static_cast<size_t>(st.st_size));
        size_t done = 0;
        while (done < buf.size()) {
            ssize_t n = pread(fd_, buf.data() + done, buf.size() - done, static_cast<off_t>(done));
            if (n <= 0) {
                throw std::runtime_error("Failed to read temp file");
            }
            done += static_cast<size_t>(n);
        }
        return buf;
    }

  private:
    char path_[64];
    int fd_ = -1;
};

/* True if out[out_off, out_off + len) holds the pattern of in_off onward */
inline bool matches_pattern(const std::vector<char> &out, uint64_t out_off, uint64_t in_off,
                            uint64_t len) {
    if (out.size() < out_off + len) return false;
    for (uint64_t i = 0; i < len; i++) {
        if (out[out_off + i] != pattern_byte(in_off + i)) return false;
    }
    return true;
}

#endif // FASTDD_TEST_HARNESS_HPP
