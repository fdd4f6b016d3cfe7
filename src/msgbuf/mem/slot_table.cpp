/**
 * @file slot_table.cpp
 * @brief Segment installation and the tagged Treiber stack.
 */
#include "msgbuf/mem/slot_table.hpp"

#include <bit>
#include <new>

namespace msgbuf::mem {

SlotTable::~SlotTable() {
  for (auto& seg : segments_) {
    delete[] seg.load(std::memory_order_relaxed);
  }
}

void SlotTable::locate(std::uint32_t idx, std::size_t& seg, std::uint32_t& off) noexcept {
  // Segment k starts at base * (2^k - 1).
  const std::uint64_t q = std::uint64_t{idx} / kBaseSegment + 1;
  seg = static_cast<std::size_t>(std::bit_width(q) - 1);
  off = static_cast<std::uint32_t>(
      std::uint64_t{idx} - std::uint64_t{kBaseSegment} * ((std::uint64_t{1} << seg) - 1));
}

std::optional<std::uint32_t> SlotTable::append() noexcept {
  const std::uint32_t idx = next_index_.fetch_add(1, std::memory_order_relaxed);
  if (idx == kNilSlot || idx >= max_slots()) {
    return std::nullopt;
  }

  std::size_t k = 0;
  std::uint32_t off = 0;
  locate(idx, k, off);

  if (segments_[k].load(std::memory_order_acquire) == nullptr) {
    Slot* fresh = new (std::nothrow) Slot[segment_length(k)];
    if (fresh == nullptr) {
      return std::nullopt;
    }
    Slot* expected = nullptr;
    if (!segments_[k].compare_exchange_strong(expected, fresh,
                                              std::memory_order_acq_rel,
                                              std::memory_order_acquire)) {
      delete[] fresh; // another thread installed it first
    }
  }
  return idx;
}

bool SlotTable::contains(std::uint32_t idx) const noexcept {
  if (idx >= next_index_.load(std::memory_order_acquire) || idx >= max_slots()) {
    return false;
  }
  std::size_t k = 0;
  std::uint32_t off = 0;
  locate(idx, k, off);
  return segments_[k].load(std::memory_order_acquire) != nullptr;
}

Slot& SlotTable::at(std::uint32_t idx) noexcept {
  std::size_t k = 0;
  std::uint32_t off = 0;
  locate(idx, k, off);
  return segments_[k].load(std::memory_order_acquire)[off];
}

const Slot& SlotTable::at(std::uint32_t idx) const noexcept {
  std::size_t k = 0;
  std::uint32_t off = 0;
  locate(idx, k, off);
  return segments_[k].load(std::memory_order_acquire)[off];
}

void IndexStack::push(std::uint32_t idx) noexcept {
  Slot& slot = table_->at(idx);
  std::uint64_t old = head_.load(std::memory_order_relaxed);
  std::uint64_t desired = 0;
  do {
    slot.next.store(index_of(old), std::memory_order_relaxed);
    desired = pack(tag_of(old) + 1, idx);
  } while (!head_.compare_exchange_weak(old, desired,
                                        std::memory_order_release,
                                        std::memory_order_relaxed));
}

std::optional<std::uint32_t> IndexStack::pop() noexcept {
  std::uint64_t old = head_.load(std::memory_order_acquire);
  for (;;) {
    const std::uint32_t idx = index_of(old);
    if (idx == kNilSlot) {
      return std::nullopt;
    }
    // Slots are never freed while the table lives, so reading a link that a
    // racing thread is rewriting is harmless: the tag makes our CAS fail.
    const std::uint32_t next = table_->at(idx).next.load(std::memory_order_relaxed);
    if (head_.compare_exchange_weak(old, pack(tag_of(old) + 1, next),
                                    std::memory_order_acq_rel,
                                    std::memory_order_acquire)) {
      return idx;
    }
  }
}

} // namespace msgbuf::mem
