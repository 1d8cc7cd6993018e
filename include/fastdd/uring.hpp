/**
 * @file uring.hpp
 * @brief io_uring implementation of the Ring interface
 */

#ifndef FASTDD_URING_HPP
#define FASTDD_URING_HPP

#include <fastdd/ring.hpp>

#include <liburing.h>

namespace fastdd {

/**
 * Ring backed by one io_uring instance
 *
 * Non-copyable and non-movable: the kernel maps the ring memory into
 * this object.
 */
class UringRing final : public Ring {
  public:
    /**
     * Create the ring
     * @param entries Submission queue depth (> 0)
     * @throws Error on io_uring_queue_init failure
     */
    explicit UringRing(unsigned entries);

    UringRing(const UringRing &) = delete;
    UringRing &operator=(const UringRing &) = delete;
    UringRing(UringRing &&) = delete;
    UringRing &operator=(UringRing &&) = delete;

    ~UringRing() override;

    [[nodiscard]] unsigned depth() const noexcept override { return depth_; }
    [[nodiscard]] bool prepare(const IoOp &op) override;
    unsigned submit() override;
    void submit_and_wait(unsigned wait_nr) override;
    [[nodiscard]] bool has_unsubmitted() const noexcept override;
    [[nodiscard]] bool next_completion(Completion &out) override;

    void register_buffers(std::span<const iovec> bufs) override;
    void unregister_buffers() override;
    void register_files(std::span<const int> fds) override;
    void unregister_files() override;

    /// Ring file descriptor
    [[nodiscard]] int fd() const noexcept { return ring_.ring_fd; }

  private:
    struct io_uring ring_ {};
    unsigned depth_;
};

} // namespace fastdd

#endif // FASTDD_URING_HPP
