/**
 * @file progress.hpp
 * @brief Background progress display
 */

#ifndef FASTDD_PROGRESS_HPP
#define FASTDD_PROGRESS_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>
#include <thread>

namespace fastdd {

/**
 * Render one progress line
 *
 * @return "\rProgress: NN.NN%", or "\rProgress: N/A" when total is zero
 */
[[nodiscard]] std::string format_progress(uint64_t bytes, uint64_t total);

/**
 * Periodically prints the share of bytes written
 *
 * Runs on its own thread and only reads the counter it is given. The
 * reporter stops when stop() or finish() is called, or when destroyed.
 */
class ProgressReporter {
  public:
    /**
     * Start the reporter thread
     *
     * @param bytes Counter incremented by the copy engine
     * @param total Bytes the run will copy
     * @param interval Time between lines
     * @param out Stream to render to (not closed)
     */
    ProgressReporter(const std::atomic<uint64_t> &bytes, uint64_t total,
                     std::chrono::milliseconds interval = std::chrono::seconds(1),
                     FILE *out = stderr);

    ProgressReporter(const ProgressReporter &) = delete;
    ProgressReporter &operator=(const ProgressReporter &) = delete;

    ~ProgressReporter() { stop(); }

    /// Signal the thread and wait for it to exit. Idempotent.
    void stop() noexcept;

    /// stop(), then print the final "100.00% done" line
    void finish();

    /// Lines rendered so far
    [[nodiscard]] uint64_t lines() const noexcept { return lines_.load(std::memory_order_relaxed); }

  private:
    void run();

    const std::atomic<uint64_t> &bytes_;
    uint64_t total_;
    std::chrono::milliseconds interval_;
    FILE *out_;
    std::atomic<bool> stop_{false};
    std::atomic<uint64_t> lines_{0};
    std::thread thread_;
};

} // namespace fastdd

#endif // FASTDD_PROGRESS_HPP
