#pragma once
/**
 * @file size_class.hpp
 * @brief Power-of-two capacity ladder used by BufferPool.
 *
 * Class i holds buffers of exactly (POOL_MIN_CLASS_BYTES << i) bytes. A request
 * of n bytes maps to the smallest class whose capacity is >= n; it is never
 * rounded down.
 */

#include <bit>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "msgbuf/config/constants.hpp"

namespace msgbuf::mem {

using SizeClassIndex = std::uint32_t;

/// Number of rungs on the ladder (16 B .. 4 MiB).
inline constexpr std::size_t kSizeClassCount = config::constants::POOL_CLASS_COUNT;

/// Class index carried by buffers larger than the top rung.
inline constexpr SizeClassIndex kOversizeClass = 0xFFFFFFFFu;

/// @brief Capacity in bytes of class @p idx (idx < kSizeClassCount).
constexpr std::size_t class_capacity(SizeClassIndex idx) noexcept {
  return config::constants::POOL_MIN_CLASS_BYTES << idx;
}

/**
 * @brief Smallest class able to hold @p n bytes.
 * @return std::nullopt when n == 0 or n exceeds the top rung.
 */
constexpr std::optional<SizeClassIndex> class_for(std::size_t n) noexcept {
  if (n == 0 || n > config::constants::POOL_MAX_CLASS_BYTES) {
    return std::nullopt;
  }
  if (n <= config::constants::POOL_MIN_CLASS_BYTES) {
    return SizeClassIndex{0};
  }
  // ceil(log2(n)) == bit_width(n - 1) for n >= 2
  const auto shift = static_cast<SizeClassIndex>(std::bit_width(n - 1));
  return shift - config::constants::POOL_MIN_CLASS_SHIFT;
}

static_assert(class_capacity(0) == 16);
static_assert(class_capacity(kSizeClassCount - 1) == 4u * 1024 * 1024);
static_assert(*class_for(17) == 1);
static_assert(*class_for(64) == 2);
static_assert(*class_for(65) == 3);

} // namespace msgbuf::mem
