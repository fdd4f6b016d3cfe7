/**
 * @file spsc_queue.hpp
 * @brief Single-producer/single-consumer ring buffer (owning, exception-free hot path).
 *
 * Used to post completion work between exactly two threads, e.g. a sending
 * thread handing MessageHandles to a transport I/O thread.
 *
 * Design goals:
 *  - push/pop return bool; no allocation after construction.
 *  - Elements are constructed in place on push and destroyed on pop, so
 *    move-only, non-trivial types (MessageHandle) are safe.
 *  - Acquire/release pairs only; indices padded to avoid false sharing.
 *
 * Construction:
 *  - SpscQueue<T>::with_capacity(capacity_pow2). One slot stays open, so the
 *    usable depth is capacity - 1.
 *
 * @tparam T Element type. Must be nothrow-move-constructible.
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <type_traits>
#include <utility>

#include "msgbuf/compat/expected.hpp"
#include "msgbuf/mem/cache_line.hpp"

namespace msgbuf::mem {

/**
 * @brief Error codes reported by the factory (setup time only).
 * These errors are never produced during hot path operations.
 */
enum class SpscError : std::uint8_t {
  CapacityTooSmall = 1,      ///< Capacity must be at least 2
  CapacityNotPowerOfTwo,     ///< Capacity must be power-of-two
  AllocationFailed           ///< Aligned allocation failed
};

const char* to_string(SpscError e) noexcept;

template <class T>
class SpscQueue final {
  static_assert(std::is_nothrow_move_constructible_v<T>,
                "SpscQueue elements must be nothrow-move-constructible");
  static_assert(std::atomic<std::size_t>::is_always_lock_free,
                "std::atomic<size_t> must be lock-free on this target");

public:
  using value_type = T;

  /// @brief Empty shell (use the factory).
  SpscQueue() noexcept = default;

  /**
   * @brief Factory: validates input and allocates once.
   * @param capacity_pow2 Ring capacity (power-of-two, >= 2).
   */
  static msgbuf_detail::expected<SpscQueue, SpscError>
  with_capacity(std::size_t capacity_pow2) noexcept {
    if (capacity_pow2 < 2) {
      return msgbuf_detail::unexpected(SpscError::CapacityTooSmall);
    }
    if ((capacity_pow2 & (capacity_pow2 - 1)) != 0) {
      return msgbuf_detail::unexpected(SpscError::CapacityNotPowerOfTwo);
    }

    void* raw = ::operator new[](capacity_pow2 * sizeof(Cell), std::align_val_t(alignof(Cell)),
                                 std::nothrow);
    if (raw == nullptr) {
      return msgbuf_detail::unexpected(SpscError::AllocationFailed);
    }

    SpscQueue q;
    q.cells_    = static_cast<Cell*>(raw);
    q.capacity_ = capacity_pow2;
    q.mask_     = capacity_pow2 - 1;
    return q;
  }

  SpscQueue(const SpscQueue&)            = delete;
  SpscQueue& operator=(const SpscQueue&) = delete;

  /// @brief Move (never while the other side is running).
  SpscQueue(SpscQueue&& other) noexcept { take(other); }

  SpscQueue& operator=(SpscQueue&& other) noexcept {
    if (this != &other) {
      destroy();
      take(other);
    }
    return *this;
  }

  ~SpscQueue() { destroy(); }

  /**
   * @brief Producer: move @p v into the ring.
   * @return false if the ring is full (@p v is left untouched).
   */
  bool push(T&& v) noexcept {
    const std::size_t t = tail_.load(std::memory_order_relaxed);
    const std::size_t n = (t + 1) & mask_;
    if (n == head_.load(std::memory_order_acquire)) {
      return false; // full
    }
    ::new (static_cast<void*>(cells_[t].bytes)) T(std::move(v));
    tail_.store(n, std::memory_order_release);
    return true;
  }

  /// @brief Producer: copy-push for copyable element types.
  bool push(const T& v) noexcept(std::is_nothrow_copy_constructible_v<T>)
    requires std::is_copy_constructible_v<T> {
    const std::size_t t = tail_.load(std::memory_order_relaxed);
    const std::size_t n = (t + 1) & mask_;
    if (n == head_.load(std::memory_order_acquire)) {
      return false;
    }
    ::new (static_cast<void*>(cells_[t].bytes)) T(v);
    tail_.store(n, std::memory_order_release);
    return true;
  }

  /**
   * @brief Consumer: move the oldest element into @p out.
   * @return false if the ring is empty.
   */
  bool pop(T& out) noexcept(std::is_nothrow_move_assignable_v<T>) {
    const std::size_t h = head_.load(std::memory_order_relaxed);
    if (h == tail_.load(std::memory_order_acquire)) {
      return false; // empty
    }
    T* slot = slot_ptr(h);
    out = std::move(*slot);
    slot->~T();
    head_.store((h + 1) & mask_, std::memory_order_release);
    return true;
  }

  bool empty() const noexcept {
    return head_.load(std::memory_order_acquire) ==
           tail_.load(std::memory_order_acquire);
  }

  bool full() const noexcept {
    const auto t = tail_.load(std::memory_order_acquire);
    return ((t + 1) & mask_) == head_.load(std::memory_order_acquire);
  }

  std::size_t capacity() const noexcept { return capacity_; }

  /// @brief Approximate size (not linearizable across threads).
  std::size_t approx_size() const noexcept {
    const auto t = tail_.load(std::memory_order_acquire);
    const auto h = head_.load(std::memory_order_acquire);
    return (t + capacity_ - h) & mask_;
  }

private:
  struct Cell {
    alignas(T) unsigned char bytes[sizeof(T)];
  };

  /// Live element in cell @p i (constructed by push, not yet popped).
  T* slot_ptr(std::size_t i) noexcept {
    return std::launder(reinterpret_cast<T*>(cells_[i].bytes));
  }

  void take(SpscQueue& other) noexcept {
    head_.store(other.head_.load(std::memory_order_relaxed), std::memory_order_relaxed);
    tail_.store(other.tail_.load(std::memory_order_relaxed), std::memory_order_relaxed);
    cells_    = std::exchange(other.cells_, nullptr);
    capacity_ = std::exchange(other.capacity_, 0);
    mask_     = std::exchange(other.mask_, 0);
    other.head_.store(0, std::memory_order_relaxed);
    other.tail_.store(0, std::memory_order_relaxed);
  }

  /// Destroy queued elements, then the storage.
  void destroy() noexcept {
    if (cells_ == nullptr) return;
    std::size_t h = head_.load(std::memory_order_relaxed);
    const std::size_t t = tail_.load(std::memory_order_relaxed);
    while (h != t) {
      slot_ptr(h)->~T();
      h = (h + 1) & mask_;
    }
    ::operator delete[](cells_, std::align_val_t(alignof(Cell)));
    cells_ = nullptr;
  }

  // Producer/consumer indices on separate cache lines (avoid false sharing)
  alignas(kCacheLine) std::atomic<std::size_t> head_{0}; ///< Consumer index
  alignas(kCacheLine) std::atomic<std::size_t> tail_{0}; ///< Producer index

  alignas(kCacheLine) Cell* cells_   = nullptr;
  std::size_t               capacity_ = 0;
  std::size_t               mask_     = 0;
};

} // namespace msgbuf::mem
