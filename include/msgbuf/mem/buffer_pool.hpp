// =============================================================
// File: include/msgbuf/mem/buffer_pool.hpp
// =============================================================
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>

#include "msgbuf/compat/expected.hpp"
#include "msgbuf/mem/buffer_error.hpp"
#include "msgbuf/mem/size_class.hpp"

namespace msgbuf::mem {

/**
 * @file buffer_pool.hpp
 * @brief Size-classed pool of reusable native buffers.
 *
 * Design:
 *  - 19 power-of-two classes (16 B .. 4 MiB); a request is rounded *up* to the
 *    first class that fits and the buffer reports that class's true capacity.
 *  - Each class owns an independent lock-free LIFO of idle buffers and its own
 *    counters. There is no pool-wide lock; classes never contend.
 *  - Pooled memory only grows during traffic. It is freed by clear() or by the
 *    pool's destructor, never by rent()/give_back().
 *  - Requests above 4 MiB get an unpooled "oversize" buffer that is freed on
 *    return and counted as a miss. Live oversize regions are registered so a
 *    second return is refused instead of freeing twice.
 *
 * Thread roles:
 *  - rent()/give_back()/statistics(): any number of threads, no external locking.
 *  - prewarm()/set_capacity(): administrative, thread-safe but not meant for the
 *    hot path.
 *  - clear(): only while no other thread is renting or returning.
 *
 * The pool must outlive every buffer it handed out.
 */

class BufferPool;

/**
 * @brief Descriptor of one rented region.
 *
 * Trivially copyable so it can ride inside a MessageHandle or a queue slot.
 * The descriptor does not own memory; give it back to the pool exactly once.
 */
class PooledBuffer final {
public:
  PooledBuffer() noexcept = default;

  /// @brief Start of the region (capacity() bytes are addressable).
  std::byte* data() const noexcept { return data_; }

  /// @brief True capacity of the region (the class capacity, or the exact oversize length).
  std::size_t capacity() const noexcept { return capacity_; }

  /// @brief Used length requested by the caller (<= capacity()).
  std::size_t size() const noexcept { return size_; }

  /**
   * @brief Change the used length.
   * @return false (and no change) if @p n exceeds capacity().
   */
  bool set_size(std::size_t n) noexcept {
    if (n > capacity_) return false;
    size_ = n;
    return true;
  }

  /// @brief Owning class, or kOversizeClass.
  SizeClassIndex size_class() const noexcept { return class_; }

  bool oversize() const noexcept { return class_ == kOversizeClass; }

  explicit operator bool() const noexcept { return data_ != nullptr; }

private:
  friend class BufferPool;

  PooledBuffer(std::byte* data, std::size_t capacity, std::size_t size,
               SizeClassIndex cls, std::uint32_t slot) noexcept
    : data_(data), capacity_(capacity), size_(size), class_(cls), slot_(slot) {}

  std::byte*     data_{nullptr};
  std::size_t    capacity_{0};
  std::size_t    size_{0};
  SizeClassIndex class_{kOversizeClass};
  std::uint32_t  slot_{0};
};

/**
 * @brief Pool-wide counters (eventually-consistent snapshot).
 *
 * Invariant at quiescence: rents == hits + misses.
 */
struct PoolStatistics {
  std::uint64_t rents{0};     ///< Successful rent() calls
  std::uint64_t returns{0};   ///< Successful give_back() calls
  std::uint64_t hits{0};      ///< Rents served from an idle buffer
  std::uint64_t misses{0};    ///< Rents that allocated (includes oversize)
  std::uint64_t oversize{0};  ///< Rents above the top class

  /// @brief Buffers currently held by callers.
  std::int64_t outstanding() const noexcept {
    return static_cast<std::int64_t>(rents) - static_cast<std::int64_t>(returns);
  }

  /// @brief hits / (hits + misses), 0.0 before the first rent.
  double hit_rate() const noexcept {
    const auto total = hits + misses;
    return total == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(total);
  }
};

/// @brief Counters and occupancy of one size class.
struct ClassStatistics {
  std::size_t   capacity{0}; ///< Class capacity in bytes
  std::uint64_t rents{0};
  std::uint64_t returns{0};
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t owned{0};    ///< Buffers with live memory (idle + outstanding)
  std::uint64_t idle{0};     ///< Buffers waiting in the class stack
};

class BufferPool {
public:
  BufferPool();
  ~BufferPool();

  BufferPool(const BufferPool&)            = delete;
  BufferPool& operator=(const BufferPool&) = delete;
  BufferPool(BufferPool&&)                 = delete;
  BufferPool& operator=(BufferPool&&)      = delete;

  /**
   * @brief Rent a buffer able to hold @p n bytes.
   * @param n Requested used length (> 0).
   * @return Buffer with size() == n and capacity() == the class capacity;
   *         InvalidSize for n == 0; AllocationFailure if a miss cannot allocate.
   */
  msgbuf_detail::expected<PooledBuffer, BufferError> rent(std::size_t n) noexcept;

  /**
   * @brief Return a rented buffer to its class.
   * @return DoubleRelease if the buffer is already idle or, for oversize, already
   *         freed (state untouched); UnknownSizeClass for a descriptor this pool
   *         does not currently hold.
   */
  msgbuf_detail::expected<void, BufferError> give_back(const PooledBuffer& buffer) noexcept;

  /**
   * @brief Allocate @p count additional idle buffers in the class holding @p class_bytes.
   * @return Number of buffers created; UnknownSizeClass outside the ladder;
   *         AllocationFailure if memory ran out (buffers created so far stay).
   */
  msgbuf_detail::expected<std::size_t, BufferError> prewarm(std::size_t class_bytes,
                                                            std::size_t count);

  /// @brief Prewarm several classes; the whole plan is validated before anything is allocated.
  msgbuf_detail::expected<std::size_t, BufferError> prewarm(
      const std::map<std::size_t, std::size_t>& plan);

  /**
   * @brief Grow the class holding @p class_bytes until it owns at least @p total buffers.
   * @return Number of buffers created (0 if already at or above @p total). Never shrinks.
   */
  msgbuf_detail::expected<std::size_t, BufferError> set_capacity(std::size_t class_bytes,
                                                                 std::size_t total);

  /**
   * @brief Free the memory of every idle buffer.
   * @pre No concurrent rent()/give_back(). Outstanding buffers are unaffected.
   * @return Number of buffers freed.
   */
  std::size_t clear() noexcept;

  /// @brief Lock-free snapshot of pool-wide counters.
  PoolStatistics statistics() const noexcept;

  /// @brief Snapshot of the class holding @p class_bytes.
  msgbuf_detail::expected<ClassStatistics, BufferError> class_statistics(
      std::size_t class_bytes) const noexcept;

private:
  struct Shelf;

  msgbuf_detail::expected<std::uint32_t, BufferError> create(Shelf& shelf, SizeClassIndex cls) noexcept;
  msgbuf_detail::expected<PooledBuffer, BufferError> rent_oversize(std::size_t n) noexcept;
  msgbuf_detail::expected<void, BufferError> give_back_oversize(const PooledBuffer& buffer) noexcept;

  std::unique_ptr<Shelf[]> shelves_;   ///< One per size class

  struct OversizeShelf;
  std::unique_ptr<OversizeShelf> oversize_;
};

} // namespace msgbuf::mem
