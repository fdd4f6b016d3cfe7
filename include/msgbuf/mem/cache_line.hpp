#pragma once

#include <cstddef>

namespace msgbuf::mem {

/// Cache line size hint (adjust per platform if needed).
inline constexpr std::size_t kCacheLine = 64;

} // namespace msgbuf::mem
