/**
 * @file log_handler.cpp
 * @brief Demonstrate a custom fastdd log handler
 *
 * Installs a callback that prefixes every library message with a
 * millisecond timestamp and severity, then runs a copy small enough to
 * force the memlock fallback so the handler has something to report.
 *
 * Run: ./examples/cpp/log_handler
 */

#include <fastdd.hpp>

#include <chrono>
#include <fcntl.h>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <unistd.h>

constexpr auto SRC_FILE = "/tmp/fastdd_log_src.dat";
constexpr auto DST_FILE = "/tmp/fastdd_log_dst.dat";
constexpr size_t FILE_SIZE = 256 * 1024;

int main() {
    std::cout << "fastdd Log Handler Example\n";
    std::cout << "==========================\n\n";

    // --- Step 1: Install log handler with lambda -------------------------
    fastdd::set_log_handler([](fastdd::LogLevel level, std::string_view msg) {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::tm tm{};
        localtime_r(&time_t_now, &tm);

        std::cerr << std::put_time(&tm, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
                  << ms.count() << " [myapp] " << fastdd::log_level_name(level) << ": " << msg
                  << '\n';
    });

    fastdd::log_emit(fastdd::LogLevel::Info, "log handler installed");

    int in = -1;
    int out = -1;
    int status = 0;

    try {
        // --- Step 2: Create source file -----------------------------------
        {
            std::ofstream f(SRC_FILE, std::ios::binary);
            if (!f) throw fastdd::Error(EIO, "create source file");
            std::string data(FILE_SIZE, 'A');
            f.write(data.data(), static_cast<std::streamsize>(data.size()));
        }

        in = open(SRC_FILE, O_RDWR);
        if (in < 0) fastdd::throw_errno("open source");
        out = open(DST_FILE, O_RDWR | O_CREAT | O_TRUNC, 0644);
        if (out < 0) fastdd::throw_errno("open destination");

        // --- Step 3: Copy with a tiny pinned-memory budget -----------------
        fastdd::Options opts;
        opts.block_size(16 * 1024).num_buffers(8).ring_size(16).memlock_limit(64 * 1024);

        uint64_t copied = fastdd::copy(in, out, opts);
        fastdd::log_emit(fastdd::LogLevel::Notice, "copied " + std::to_string(copied) + " bytes");
    } catch (const fastdd::Error &e) {
        fastdd::log_emit(fastdd::LogLevel::Error, std::string("fastdd error: ") + e.what());
        status = 1;
    }

    if (in >= 0) close(in);
    if (out >= 0) close(out);
    unlink(SRC_FILE);
    unlink(DST_FILE);

    fastdd::clear_log_handler();
    return status;
}
