/**
 * @file registrar.hpp
 * @brief Pinned-memory budget and ring registration
 */

#ifndef FASTDD_REGISTRAR_HPP
#define FASTDD_REGISTRAR_HPP

#include <fastdd/fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

namespace fastdd {

/**
 * Query the RLIMIT_MEMLOCK soft limit
 *
 * @return Limit in bytes (UINT64_MAX when unlimited)
 * @throws ResourceQueryError if the limit cannot be read
 */
[[nodiscard]] uint64_t memlock_limit();

/**
 * Number of buffers that may be registered under a pinned-memory budget
 *
 * When the full pool fits strictly below the budget every buffer is
 * registered. Otherwise one buffer less than the budget holds is used.
 * The result r always satisfies r * block_size < limit.
 *
 * @param num_buffers Pool size
 * @param block_size Bytes per buffer (> 0)
 * @param limit Pinned-memory budget in bytes
 */
[[nodiscard]] size_t registrable_buffers(size_t num_buffers, size_t block_size,
                                         uint64_t limit) noexcept;

/**
 * Buffers and files registered with a ring for the lifetime of a run
 *
 * Registers the first @p buffers pool buffers (none when zero) and the
 * given file descriptors on construction. Unregisters on release(), or
 * from the destructor on any other exit path.
 */
class Registration {
  public:
    /**
     * @param ring Ring to register with
     * @param pool Buffer pool; buffers [0, buffers) become fixed buffers
     * @param buffers Number of buffers to register (<= pool.size())
     * @param fds File descriptors; fds[i] becomes registered slot i
     * @throws RegistrationError if the kernel rejects either table
     */
    Registration(Ring &ring, const BufferPool &pool, size_t buffers, std::span<const int> fds);

    Registration(const Registration &) = delete;
    Registration &operator=(const Registration &) = delete;

    ~Registration();

    /**
     * Unregister now, reporting failure
     * @throws RegistrationError if unregistration fails
     */
    void release();

    /// Buffers in the registered table
    [[nodiscard]] size_t registered_buffers() const noexcept { return buffers_; }

  private:
    Ring &ring_;
    size_t buffers_;
    bool buffers_registered_ = false;
    bool files_registered_ = false;
};

} // namespace fastdd

#endif // FASTDD_REGISTRAR_HPP
