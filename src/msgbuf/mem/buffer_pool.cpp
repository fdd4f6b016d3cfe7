// =============================================================
// File: src/msgbuf/mem/buffer_pool.cpp
// =============================================================
#include "msgbuf/mem/buffer_pool.hpp"

#include <atomic>
#include <new>

#include "msgbuf/config/constants.hpp"
#include "msgbuf/mem/cache_line.hpp"
#include "msgbuf/mem/slot_table.hpp"
#include "msgbuf/obs/observability.hpp"

namespace msgbuf::mem {

namespace {

constexpr std::align_val_t kAlign{config::constants::POOL_BUFFER_ALIGNMENT};

std::byte* allocate_region(std::size_t bytes) noexcept {
  return static_cast<std::byte*>(::operator new(bytes, kAlign, std::nothrow));
}

void free_region(std::byte* p) noexcept {
  ::operator delete(p, kAlign);
}

} // namespace

/**
 * @brief One size class: slot table, idle/vacant stacks and counters.
 *
 * `idle` holds slots with memory ready to rent. `vacant` holds slots whose
 * memory was released by clear(); a miss refills one of those before growing
 * the table. Counters sit on their own cache line per class.
 */
struct alignas(kCacheLine) BufferPool::Shelf {
  SlotTable  table;
  IndexStack idle{table};
  IndexStack vacant{table};

  alignas(kCacheLine) std::atomic<std::uint64_t> rents{0};
  std::atomic<std::uint64_t> returns{0};
  std::atomic<std::uint64_t> hits{0};
  std::atomic<std::uint64_t> misses{0};
  std::atomic<std::uint64_t> owned{0};
  std::atomic<std::int64_t>  idle_count{0};
};

/**
 * @brief Registry of live oversize regions.
 *
 * Each outstanding oversize buffer occupies one slot whose `data` holds the
 * region. A return frees the region only if it swaps that exact pointer out,
 * so a second return of the same descriptor frees nothing.
 */
struct alignas(kCacheLine) BufferPool::OversizeShelf {
  SlotTable  table;
  IndexStack vacant{table};

  alignas(kCacheLine) std::atomic<std::uint64_t> rents{0};
  std::atomic<std::uint64_t> returns{0};
};

BufferPool::BufferPool()
  : shelves_(new Shelf[kSizeClassCount]),
    oversize_(std::make_unique<OversizeShelf>()) {}

BufferPool::~BufferPool() {
  std::size_t leaked = 0;
  for (std::size_t c = 0; c < kSizeClassCount; ++c) {
    shelves_[c].table.for_each([&](Slot& slot) {
      std::byte* p = slot.data.exchange(nullptr, std::memory_order_relaxed);
      if (p == nullptr) return;
      if (slot.leased.load(std::memory_order_relaxed) != 0) ++leaked;
      free_region(p);
    });
  }
  oversize_->table.for_each([&](Slot& slot) {
    if (std::byte* p = slot.data.exchange(nullptr, std::memory_order_relaxed)) {
      ++leaked;
      free_region(p);
    }
  });
  if (leaked != 0) {
    obs::logger()->warn("BufferPool destroyed with {} buffer(s) still rented", leaked);
  }
}

msgbuf_detail::expected<std::uint32_t, BufferError>
BufferPool::create(Shelf& shelf, SizeClassIndex cls) noexcept {
  auto idx = shelf.vacant.pop();
  if (!idx) {
    idx = shelf.table.append();
    if (!idx) {
      return msgbuf_detail::unexpected(BufferError::AllocationFailure);
    }
  }

  Slot& slot = shelf.table.at(*idx);
  std::byte* region = allocate_region(class_capacity(cls));
  if (region == nullptr) {
    shelf.vacant.push(*idx);
    return msgbuf_detail::unexpected(BufferError::AllocationFailure);
  }
  slot.data.store(region, std::memory_order_relaxed);
  shelf.owned.fetch_add(1, std::memory_order_relaxed);
  return *idx;
}

msgbuf_detail::expected<PooledBuffer, BufferError> BufferPool::rent(std::size_t n) noexcept {
  if (n == 0) {
    return msgbuf_detail::unexpected(BufferError::InvalidSize);
  }
  const auto cls = class_for(n);
  if (!cls) {
    return rent_oversize(n);
  }

  Shelf& shelf = shelves_[*cls];
  if (const auto idx = shelf.idle.pop()) {
    Slot& slot = shelf.table.at(*idx);
    slot.leased.store(1, std::memory_order_relaxed);
    shelf.idle_count.fetch_sub(1, std::memory_order_relaxed);
    shelf.hits.fetch_add(1, std::memory_order_relaxed);
    shelf.rents.fetch_add(1, std::memory_order_relaxed);
    return PooledBuffer(slot.data.load(std::memory_order_relaxed), class_capacity(*cls), n, *cls, *idx);
  }

  auto created = create(shelf, *cls);
  if (!created) {
    obs::logger()->error("BufferPool: allocation of {}-byte class buffer failed",
                         class_capacity(*cls));
    return msgbuf_detail::unexpected(created.error());
  }
  Slot& slot = shelf.table.at(*created);
  slot.leased.store(1, std::memory_order_relaxed);
  shelf.misses.fetch_add(1, std::memory_order_relaxed);
  shelf.rents.fetch_add(1, std::memory_order_relaxed);
  return PooledBuffer(slot.data.load(std::memory_order_relaxed), class_capacity(*cls), n, *cls,
                      *created);
}

msgbuf_detail::expected<PooledBuffer, BufferError> BufferPool::rent_oversize(std::size_t n) noexcept {
  std::byte* p = allocate_region(n);
  if (p == nullptr) {
    obs::logger()->error("BufferPool: oversize allocation of {} bytes failed", n);
    return msgbuf_detail::unexpected(BufferError::AllocationFailure);
  }
  OversizeShelf& shelf = *oversize_;
  auto idx = shelf.vacant.pop();
  if (!idx) {
    idx = shelf.table.append();
    if (!idx) {
      free_region(p);
      obs::logger()->error("BufferPool: oversize registry exhausted");
      return msgbuf_detail::unexpected(BufferError::AllocationFailure);
    }
  }
  shelf.table.at(*idx).data.store(p, std::memory_order_release);
  shelf.rents.fetch_add(1, std::memory_order_relaxed);
  return PooledBuffer(p, n, n, kOversizeClass, *idx);
}

msgbuf_detail::expected<void, BufferError> BufferPool::give_back(const PooledBuffer& buffer) noexcept {
  if (!buffer) {
    return msgbuf_detail::unexpected(BufferError::UnknownSizeClass);
  }
  if (buffer.oversize()) {
    return give_back_oversize(buffer);
  }
  if (buffer.class_ >= kSizeClassCount) {
    return msgbuf_detail::unexpected(BufferError::UnknownSizeClass);
  }

  Shelf& shelf = shelves_[buffer.class_];
  if (!shelf.table.contains(buffer.slot_)) {
    return msgbuf_detail::unexpected(BufferError::UnknownSizeClass);
  }
  Slot& slot = shelf.table.at(buffer.slot_);
  if (slot.data.load(std::memory_order_relaxed) != buffer.data_) {
    return msgbuf_detail::unexpected(BufferError::UnknownSizeClass);
  }
  // One-shot: only the caller that flips 1 -> 0 may push the slot.
  if (slot.leased.exchange(0, std::memory_order_acq_rel) != 1) {
    obs::logger()->error("BufferPool: double return of {}-byte buffer {}",
                         buffer.capacity_, static_cast<const void*>(buffer.data_));
    return msgbuf_detail::unexpected(BufferError::DoubleRelease);
  }

  shelf.idle.push(buffer.slot_);
  shelf.idle_count.fetch_add(1, std::memory_order_relaxed);
  shelf.returns.fetch_add(1, std::memory_order_relaxed);
  return {};
}

msgbuf_detail::expected<void, BufferError>
BufferPool::give_back_oversize(const PooledBuffer& buffer) noexcept {
  OversizeShelf& shelf = *oversize_;
  if (!shelf.table.contains(buffer.slot_)) {
    return msgbuf_detail::unexpected(BufferError::UnknownSizeClass);
  }
  Slot& slot = shelf.table.at(buffer.slot_);
  std::byte* live = buffer.data_;
  if (!slot.data.compare_exchange_strong(live, nullptr, std::memory_order_acq_rel,
                                         std::memory_order_acquire)) {
    if (live == nullptr) {
      obs::logger()->error("BufferPool: double return of {}-byte oversize buffer {}",
                           buffer.capacity_, static_cast<const void*>(buffer.data_));
      return msgbuf_detail::unexpected(BufferError::DoubleRelease);
    }
    // Slot now holds another region: the descriptor is stale or from another pool.
    return msgbuf_detail::unexpected(BufferError::UnknownSizeClass);
  }
  free_region(buffer.data_);
  shelf.vacant.push(buffer.slot_);
  shelf.returns.fetch_add(1, std::memory_order_relaxed);
  return {};
}

msgbuf_detail::expected<std::size_t, BufferError>
BufferPool::prewarm(std::size_t class_bytes, std::size_t count) {
  const auto cls = class_for(class_bytes);
  if (!cls) {
    return msgbuf_detail::unexpected(BufferError::UnknownSizeClass);
  }

  Shelf& shelf = shelves_[*cls];
  std::size_t made = 0;
  for (; made < count; ++made) {
    auto idx = create(shelf, *cls);
    if (!idx) {
      obs::logger()->error("BufferPool: prewarm of {}-byte class stopped after {} of {} buffers",
                           class_capacity(*cls), made, count);
      return msgbuf_detail::unexpected(idx.error());
    }
    shelf.idle.push(*idx);
    shelf.idle_count.fetch_add(1, std::memory_order_relaxed);
  }
  obs::logger()->debug("BufferPool: prewarmed {} x {} B", made, class_capacity(*cls));
  return made;
}

msgbuf_detail::expected<std::size_t, BufferError>
BufferPool::prewarm(const std::map<std::size_t, std::size_t>& plan) {
  for (const auto& entry : plan) {
    if (!class_for(entry.first)) {
      return msgbuf_detail::unexpected(BufferError::UnknownSizeClass);
    }
  }
  std::size_t total = 0;
  for (const auto& [bytes, count] : plan) {
    auto made = prewarm(bytes, count);
    if (!made) {
      return made;
    }
    total += *made;
  }
  obs::logger()->info("BufferPool: prewarmed {} buffers across {} classes", total, plan.size());
  return total;
}

msgbuf_detail::expected<std::size_t, BufferError>
BufferPool::set_capacity(std::size_t class_bytes, std::size_t total) {
  const auto cls = class_for(class_bytes);
  if (!cls) {
    return msgbuf_detail::unexpected(BufferError::UnknownSizeClass);
  }
  const auto owned = shelves_[*cls].owned.load(std::memory_order_relaxed);
  if (owned >= total) {
    return std::size_t{0};
  }
  obs::logger()->info("BufferPool: growing {} B class from {} to {} buffers",
                      class_capacity(*cls), owned, total);
  return prewarm(class_capacity(*cls), static_cast<std::size_t>(total - owned));
}

std::size_t BufferPool::clear() noexcept {
  std::size_t freed = 0;
  std::size_t bytes = 0;
  for (SizeClassIndex c = 0; c < kSizeClassCount; ++c) {
    Shelf& shelf = shelves_[c];
    while (const auto idx = shelf.idle.pop()) {
      Slot& slot = shelf.table.at(*idx);
      free_region(slot.data.exchange(nullptr, std::memory_order_relaxed));
      shelf.vacant.push(*idx);
      shelf.idle_count.fetch_sub(1, std::memory_order_relaxed);
      shelf.owned.fetch_sub(1, std::memory_order_relaxed);
      ++freed;
      bytes += class_capacity(c);
    }
  }
  obs::logger()->info("BufferPool: cleared {} idle buffers ({} bytes)", freed, bytes);
  return freed;
}

PoolStatistics BufferPool::statistics() const noexcept {
  PoolStatistics s;
  for (std::size_t c = 0; c < kSizeClassCount; ++c) {
    const Shelf& shelf = shelves_[c];
    s.rents   += shelf.rents.load(std::memory_order_relaxed);
    s.returns += shelf.returns.load(std::memory_order_relaxed);
    s.hits    += shelf.hits.load(std::memory_order_relaxed);
    s.misses  += shelf.misses.load(std::memory_order_relaxed);
  }
  s.oversize = oversize_->rents.load(std::memory_order_relaxed);
  s.rents   += s.oversize;
  s.misses  += s.oversize;
  s.returns += oversize_->returns.load(std::memory_order_relaxed);
  return s;
}

msgbuf_detail::expected<ClassStatistics, BufferError>
BufferPool::class_statistics(std::size_t class_bytes) const noexcept {
  const auto cls = class_for(class_bytes);
  if (!cls) {
    return msgbuf_detail::unexpected(BufferError::UnknownSizeClass);
  }
  const Shelf& shelf = shelves_[*cls];
  ClassStatistics cs;
  cs.capacity = class_capacity(*cls);
  cs.rents    = shelf.rents.load(std::memory_order_relaxed);
  cs.returns  = shelf.returns.load(std::memory_order_relaxed);
  cs.hits     = shelf.hits.load(std::memory_order_relaxed);
  cs.misses   = shelf.misses.load(std::memory_order_relaxed);
  cs.owned    = shelf.owned.load(std::memory_order_relaxed);
  const auto idle = shelf.idle_count.load(std::memory_order_relaxed);
  cs.idle     = idle < 0 ? 0 : static_cast<std::uint64_t>(idle);
  return cs;
}

} // namespace msgbuf::mem
