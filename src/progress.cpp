/**
 * @file progress.cpp
 * @brief Background progress display
 */

#include <fastdd/progress.hpp>

#include <algorithm>

namespace fastdd {

/* Longest the reporter sleeps before re-checking the stop flag */
static constexpr std::chrono::milliseconds STOP_POLL_INTERVAL{50};

std::string format_progress(uint64_t bytes, uint64_t total) {
    if (total == 0) return "\rProgress: N/A";

    char line[64];
    double pct = static_cast<double>(bytes) / static_cast<double>(total) * 100.0;
    snprintf(line, sizeof(line), "\rProgress: %.2f%%", pct);
    return line;
}

ProgressReporter::ProgressReporter(const std::atomic<uint64_t> &bytes, uint64_t total,
                                   std::chrono::milliseconds interval, FILE *out)
    : bytes_(bytes), total_(total), interval_(interval), out_(out), thread_([this] { run(); }) {}

void ProgressReporter::stop() noexcept {
    stop_.store(true, std::memory_order_relaxed);
    if (thread_.joinable()) thread_.join();
}

void ProgressReporter::finish() {
    stop();
    fprintf(out_, "\rProgress: 100.00%% done\n");
    fflush(out_);
}

void ProgressReporter::run() {
    while (!stop_.load(std::memory_order_relaxed)) {
        std::string line = format_progress(bytes_.load(std::memory_order_relaxed), total_);
        fputs(line.c_str(), out_);
        fflush(out_);
        lines_.fetch_add(1, std::memory_order_relaxed);

        auto deadline = std::chrono::steady_clock::now() + interval_;
        while (!stop_.load(std::memory_order_relaxed)) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) break;
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            std::this_thread::sleep_for(std::min(left, STOP_POLL_INTERVAL));
        }
    }
}

} // namespace fastdd
