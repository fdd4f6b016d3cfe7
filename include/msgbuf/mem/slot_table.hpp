#pragma once
/**
 * @file slot_table.hpp
 * @brief Lock-free building blocks behind one size class of BufferPool.
 *
 * SlotTable is an append-only, segmented array of Slot records. Segments are
 * installed with a single CAS and are never moved or freed until the table is
 * destroyed, so a Slot reference stays valid for the table's lifetime and may
 * be read by any thread that learned its index.
 *
 * IndexStack is a Treiber stack of slot indices. The head packs a 32-bit ABA
 * tag next to the 32-bit index in one 64-bit word; every successful push/pop
 * bumps the tag, so a head that was popped and re-pushed in between cannot be
 * mistaken for the one a racing thread observed.
 *
 * Both are LIFO on purpose: the last-returned buffer is served first, which
 * keeps the head CAS the only contended word. The price is cross-thread cache
 * locality (a buffer just returned by thread B may be rented by thread A with
 * cold lines). That trade was measured against a FIFO ring and kept.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace msgbuf::mem {

/// Sentinel index meaning "no slot".
inline constexpr std::uint32_t kNilSlot = 0xFFFFFFFFu;

/**
 * @brief Bookkeeping for one pooled buffer.
 *
 * A slot belongs to at most one IndexStack at a time; `next` is that stack's
 * link. `leased` is 1 while a caller holds the buffer and is the pool's own
 * double-return guard. Oversize slots leave `leased` alone: the region pointer
 * itself is swapped to nullptr by the one return that frees it.
 */
struct Slot {
  std::atomic<std::byte*>    data{nullptr};     ///< Owned region; nullptr once cleared
  std::atomic<std::uint32_t> next{kNilSlot};    ///< Stack link
  std::atomic<std::uint8_t>  leased{0};         ///< 1 while rented
};

class SlotTable {
public:
  SlotTable() noexcept = default;
  ~SlotTable();

  SlotTable(const SlotTable&)            = delete;
  SlotTable& operator=(const SlotTable&) = delete;

  /**
   * @brief Reserve a fresh slot.
   * @return Its index, or std::nullopt if a segment could not be allocated or
   *         the table is exhausted.
   */
  std::optional<std::uint32_t> append() noexcept;

  /// @brief True if @p idx names a slot whose segment is installed.
  bool contains(std::uint32_t idx) const noexcept;

  /// @brief Slot by index. @p idx must come from append().
  Slot&       at(std::uint32_t idx) noexcept;
  const Slot& at(std::uint32_t idx) const noexcept;

  /// @brief Visit every installed slot (teardown / diagnostics; not concurrent-safe).
  template <class Fn>
  void for_each(Fn&& fn) {
    for (std::size_t k = 0; k < kMaxSegments; ++k) {
      Slot* seg = segments_[k].load(std::memory_order_acquire);
      if (seg == nullptr) continue;
      const std::uint32_t n = segment_length(k);
      for (std::uint32_t i = 0; i < n; ++i) fn(seg[i]);
    }
  }

  /// Upper bound on slots a table can ever hold.
  static constexpr std::uint64_t max_slots() noexcept {
    return std::uint64_t{kBaseSegment} * ((std::uint64_t{1} << kMaxSegments) - 1);
  }

private:
  static constexpr std::uint32_t kBaseSegment = 64;  ///< Slots in segment 0; segment k holds 64 << k
  static constexpr std::size_t   kMaxSegments = 24;

  static constexpr std::uint32_t segment_length(std::size_t k) noexcept {
    return kBaseSegment << k;
  }

  /// Map a flat index to (segment, offset).
  static void locate(std::uint32_t idx, std::size_t& seg, std::uint32_t& off) noexcept;

  std::atomic<Slot*>         segments_[kMaxSegments]{};
  std::atomic<std::uint32_t> next_index_{0};
};

class IndexStack {
public:
  explicit IndexStack(SlotTable& table) noexcept : table_(&table) {}

  IndexStack(const IndexStack&)            = delete;
  IndexStack& operator=(const IndexStack&) = delete;

  /// @brief Push a slot that is in no other stack. Lock-free.
  void push(std::uint32_t idx) noexcept;

  /// @brief Pop the most recently pushed slot. Lock-free.
  std::optional<std::uint32_t> pop() noexcept;

  bool empty() const noexcept {
    return index_of(head_.load(std::memory_order_acquire)) == kNilSlot;
  }

private:
  static constexpr std::uint64_t pack(std::uint32_t tag, std::uint32_t idx) noexcept {
    return (std::uint64_t{tag} << 32) | idx;
  }
  static constexpr std::uint32_t index_of(std::uint64_t word) noexcept {
    return static_cast<std::uint32_t>(word);
  }
  static constexpr std::uint32_t tag_of(std::uint64_t word) noexcept {
    return static_cast<std::uint32_t>(word >> 32);
  }

  static_assert(std::atomic<std::uint64_t>::is_always_lock_free,
                "IndexStack needs a lock-free 64-bit CAS");

  SlotTable*                 table_;
  std::atomic<std::uint64_t> head_{pack(0, kNilSlot)};
};

} // namespace msgbuf::mem
