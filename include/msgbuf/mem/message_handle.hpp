// =============================================================
// File: include/msgbuf/mem/message_handle.hpp
// =============================================================
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>

#include "msgbuf/compat/expected.hpp"
#include "msgbuf/mem/buffer_error.hpp"
#include "msgbuf/mem/buffer_pool.hpp"

namespace msgbuf::mem {

/**
 * @file message_handle.hpp
 * @brief Single-owner wrapper around one message buffer with exactly-once release.
 *
 * Three owner kinds:
 *  - Pooled:      the region is a PooledBuffer; release gives it back to its pool.
 *  - External:    caller-managed memory handed over zero-copy; release invokes the
 *                 release callback (the transport fires it on completion).
 *  - CallerOwned: a plain view; release does nothing.
 *
 * The release flag is a one-shot atomic exchange. Whichever thread flips it
 * first runs the release action; every later release() reports DoubleRelease
 * and every later accessor reports UseAfterRelease. A moved-from handle counts
 * as released.
 *
 * Single-writer: one thread owns the handle between construction and release
 * (ownership may move to a transport thread together with the handle).
 */

enum class OwnerKind : std::uint8_t {
  CallerOwned = 0, ///< No release action
  Pooled,          ///< Return to BufferPool
  External         ///< Invoke release callback
};

const char* to_string(OwnerKind k) noexcept;

/// @brief Release action for External handles; receives the region and its length.
using ReleaseCallback = std::function<void(std::byte* data, std::size_t size)>;

class MessageHandle final {
public:
  /// @brief Empty, already-released handle (use the factories).
  MessageHandle() noexcept = default;

  /**
   * @brief Pool-owned handle of @p n bytes (contents unspecified).
   * @return InvalidSize for n == 0; AllocationFailure from the pool.
   */
  static msgbuf_detail::expected<MessageHandle, BufferError>
  from_length(BufferPool& pool, std::size_t n) noexcept;

  /**
   * @brief Pool-owned handle holding a copy of @p bytes (one linear memcpy).
   * @return InvalidSize for an empty span.
   */
  static msgbuf_detail::expected<MessageHandle, BufferError>
  from_data(BufferPool& pool, std::span<const std::byte> bytes) noexcept;

  /**
   * @brief Wrap caller-managed memory without copying.
   * @param data Region start (must not be nullptr).
   * @param n Region length (> 0).
   * @param on_release Invoked exactly once, on the releasing thread.
   * @return InvalidSize for a null region or n == 0; the callback is not invoked.
   */
  static msgbuf_detail::expected<MessageHandle, BufferError>
  zero_copy(std::byte* data, std::size_t n, ReleaseCallback on_release) noexcept;

  /// @brief Non-owning view; release is a no-op. InvalidSize for a null region or n == 0.
  static msgbuf_detail::expected<MessageHandle, BufferError>
  borrowed(std::byte* data, std::size_t n) noexcept;

  MessageHandle(const MessageHandle&)            = delete;
  MessageHandle& operator=(const MessageHandle&) = delete;

  MessageHandle(MessageHandle&& other) noexcept;
  MessageHandle& operator=(MessageHandle&& other) noexcept;

  /// @brief Releases the handle if it is still live.
  ~MessageHandle();

  /**
   * @brief Run the owner-kind release action exactly once.
   * @return DoubleRelease on any call after the first (nothing else happens),
   *         or the pool's error if give_back() refused the buffer.
   */
  msgbuf_detail::expected<void, BufferError> release() noexcept;

  /// @brief Mutable view of the used length. UseAfterRelease once released.
  msgbuf_detail::expected<std::span<std::byte>, BufferError> data() noexcept;

  /// @brief Read-only view of the used length. UseAfterRelease once released.
  msgbuf_detail::expected<std::span<const std::byte>, BufferError> cdata() const noexcept;

  /**
   * @brief Change the used length within capacity().
   * @return InvalidSize past capacity; UseAfterRelease once released.
   */
  msgbuf_detail::expected<void, BufferError> resize(std::size_t n) noexcept;

  std::size_t size() const noexcept { return size_; }
  std::size_t capacity() const noexcept { return capacity_; }
  OwnerKind   owner() const noexcept { return owner_; }
  std::uint64_t id() const noexcept { return id_; }

  bool released() const noexcept { return released_.load(std::memory_order_acquire); }

private:
  MessageHandle(std::byte* data, std::size_t size, std::size_t capacity,
                OwnerKind owner) noexcept;

  /// Release action; caller already won the one-shot flag.
  msgbuf_detail::expected<void, BufferError> dispatch_release() noexcept;

  void steal(MessageHandle& other) noexcept;

  std::byte*         data_{nullptr};
  std::size_t        size_{0};
  std::size_t        capacity_{0};
  OwnerKind          owner_{OwnerKind::CallerOwned};
  std::uint64_t      id_{0};
  BufferPool*        pool_{nullptr};   ///< Pooled only
  PooledBuffer       buffer_{};        ///< Pooled only
  ReleaseCallback    on_release_{};    ///< External only
  std::atomic<bool>  released_{true};
};

} // namespace msgbuf::mem
