#pragma once
/**
 * @file io_error.hpp
 * @brief Error codes of the readiness layer.
 */

#include <cstdint>

namespace msgbuf::io {

/**
 * @enum IoError
 * @brief Failures reported by ReadinessMultiplexer and WakeEndpoint.
 * @note A poll() timeout is not an error: it is a successful 0.
 */
enum class IoError : std::uint8_t {
    InvalidCapacity = 1, ///< Multiplexer built with capacity 0
    CapacityExceeded,    ///< Registration table full
    InvalidRef,          ///< EndpointRef not issued by this multiplexer (or cleared)
    InvalidEndpoint,     ///< Endpoint has no usable descriptor
    SystemError          ///< A syscall failed; errno is logged
};

const char* to_string(IoError e) noexcept;

} // namespace msgbuf::io
