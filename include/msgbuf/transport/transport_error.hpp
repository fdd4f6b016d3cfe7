#pragma once
/**
 * @file transport_error.hpp
 * @brief Error codes of the transport seam (RawTransport, AsyncSender, Courier).
 */

#include <cstdint>

namespace msgbuf::transport {

enum class TransportError : std::uint8_t {
    WouldBlock = 1,   ///< Non-blocking call found nothing to do (or the send ring is full)
    Closed,           ///< Peer closed the connection
    MessageTooLarge,  ///< Message exceeds what the transport or receiver accepts
    SystemError,      ///< A syscall failed; errno is logged
    BufferError,      ///< Pool/handle failure; the BufferError is logged
    InvalidArgument   ///< Empty payload or inconsistent options
};

const char* to_string(TransportError e) noexcept;

} // namespace msgbuf::transport
