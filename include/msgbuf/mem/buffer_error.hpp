#pragma once
/**
 * @file buffer_error.hpp
 * @brief Error codes shared by BufferPool and MessageHandle.
 */

#include <cstdint>

namespace msgbuf::mem {

/**
 * @enum BufferError
 * @brief Failure kinds reported through msgbuf_detail::expected.
 *
 * UseAfterRelease / DoubleRelease are programmer errors: the call that detects
 * them returns the code and leaves every counter and buffer untouched.
 */
enum class BufferError : std::uint8_t {
  InvalidSize = 1,     ///< Zero-length request, or resize past capacity
  AllocationFailure,   ///< Native allocation returned nullptr
  UseAfterRelease,     ///< Accessor called on a released (or moved-from) handle
  DoubleRelease,       ///< Second release of one handle / buffer
  UnknownSizeClass     ///< Administrative call outside the class ladder
};

/// @brief Stable lowercase label for logs and test failure messages.
const char* to_string(BufferError e) noexcept;

} // namespace msgbuf::mem
