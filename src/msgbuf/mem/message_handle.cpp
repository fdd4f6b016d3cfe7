// =============================================================
// File: src/msgbuf/mem/message_handle.cpp
// =============================================================
#include "msgbuf/mem/message_handle.hpp"

#include <cstring>
#include <utility>

#include "msgbuf/obs/observability.hpp"

namespace msgbuf::mem {

namespace {

std::uint64_t next_handle_id() noexcept {
  static std::atomic<std::uint64_t> counter{0};
  return counter.fetch_add(1, std::memory_order_relaxed) + 1;
}

} // namespace

const char* to_string(OwnerKind k) noexcept {
  switch (k) {
    case OwnerKind::CallerOwned: return "caller_owned";
    case OwnerKind::Pooled:      return "pooled";
    case OwnerKind::External:    return "external";
  }
  return "unknown";
}

MessageHandle::MessageHandle(std::byte* data, std::size_t size, std::size_t capacity,
                             OwnerKind owner) noexcept
  : data_(data), size_(size), capacity_(capacity), owner_(owner),
    id_(next_handle_id()), released_(false) {}

msgbuf_detail::expected<MessageHandle, BufferError>
MessageHandle::from_length(BufferPool& pool, std::size_t n) noexcept {
  auto buf = pool.rent(n);
  if (!buf) {
    return msgbuf_detail::unexpected(buf.error());
  }
  MessageHandle h(buf->data(), n, buf->capacity(), OwnerKind::Pooled);
  h.pool_   = &pool;
  h.buffer_ = *buf;
  return h;
}

msgbuf_detail::expected<MessageHandle, BufferError>
MessageHandle::from_data(BufferPool& pool, std::span<const std::byte> bytes) noexcept {
  auto h = from_length(pool, bytes.size());
  if (h) {
    std::memcpy(h->data_, bytes.data(), bytes.size());
  }
  return h;
}

msgbuf_detail::expected<MessageHandle, BufferError>
MessageHandle::zero_copy(std::byte* data, std::size_t n, ReleaseCallback on_release) noexcept {
  if (data == nullptr || n == 0) {
    return msgbuf_detail::unexpected(BufferError::InvalidSize);
  }
  MessageHandle h(data, n, n, OwnerKind::External);
  h.on_release_ = std::move(on_release);
  return h;
}

msgbuf_detail::expected<MessageHandle, BufferError>
MessageHandle::borrowed(std::byte* data, std::size_t n) noexcept {
  if (data == nullptr || n == 0) {
    return msgbuf_detail::unexpected(BufferError::InvalidSize);
  }
  return MessageHandle(data, n, n, OwnerKind::CallerOwned);
}

void MessageHandle::steal(MessageHandle& other) noexcept {
  data_       = other.data_;
  size_       = other.size_;
  capacity_   = other.capacity_;
  owner_      = other.owner_;
  id_         = other.id_;
  pool_       = other.pool_;
  buffer_     = other.buffer_;
  on_release_ = std::move(other.on_release_);
  released_.store(other.released_.exchange(true, std::memory_order_acq_rel),
                  std::memory_order_release);

  other.data_     = nullptr;
  other.size_     = 0;
  other.capacity_ = 0;
  other.pool_     = nullptr;
  other.buffer_   = PooledBuffer{};
}

MessageHandle::MessageHandle(MessageHandle&& other) noexcept {
  steal(other);
}

MessageHandle& MessageHandle::operator=(MessageHandle&& other) noexcept {
  if (this != &other) {
    if (!released_.exchange(true, std::memory_order_acq_rel)) {
      if (auto r = dispatch_release(); !r) {
        obs::logger()->error("MessageHandle {}: release on reassignment failed: {}",
                             id_, to_string(r.error()));
      }
    }
    steal(other);
  }
  return *this;
}

MessageHandle::~MessageHandle() {
  if (!released_.exchange(true, std::memory_order_acq_rel)) {
    if (auto r = dispatch_release(); !r) {
      obs::logger()->error("MessageHandle {}: release on destruction failed: {}",
                           id_, to_string(r.error()));
    }
  }
}

msgbuf_detail::expected<void, BufferError> MessageHandle::release() noexcept {
  if (released_.exchange(true, std::memory_order_acq_rel)) {
    obs::logger()->error("MessageHandle {} ({}): double release", id_, to_string(owner_));
    return msgbuf_detail::unexpected(BufferError::DoubleRelease);
  }
  return dispatch_release();
}

msgbuf_detail::expected<void, BufferError> MessageHandle::dispatch_release() noexcept {
  switch (owner_) {
    case OwnerKind::Pooled:
      return pool_->give_back(buffer_);
    case OwnerKind::External:
      // Callbacks must not throw; they run on whichever thread released.
      if (on_release_) {
        on_release_(data_, size_);
        on_release_ = nullptr;
      }
      return {};
    case OwnerKind::CallerOwned:
      return {};
  }
  return {};
}

msgbuf_detail::expected<std::span<std::byte>, BufferError> MessageHandle::data() noexcept {
  if (released()) {
    obs::logger()->error("MessageHandle {}: data() after release", id_);
    return msgbuf_detail::unexpected(BufferError::UseAfterRelease);
  }
  return std::span<std::byte>(data_, size_);
}

msgbuf_detail::expected<std::span<const std::byte>, BufferError>
MessageHandle::cdata() const noexcept {
  if (released()) {
    obs::logger()->error("MessageHandle {}: cdata() after release", id_);
    return msgbuf_detail::unexpected(BufferError::UseAfterRelease);
  }
  return std::span<const std::byte>(data_, size_);
}

msgbuf_detail::expected<void, BufferError> MessageHandle::resize(std::size_t n) noexcept {
  if (released()) {
    return msgbuf_detail::unexpected(BufferError::UseAfterRelease);
  }
  if (n > capacity_) {
    return msgbuf_detail::unexpected(BufferError::InvalidSize);
  }
  size_ = n;
  if (owner_ == OwnerKind::Pooled) {
    buffer_.set_size(n);
  }
  return {};
}

} // namespace msgbuf::mem
