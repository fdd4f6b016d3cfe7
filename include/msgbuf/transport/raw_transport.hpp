#pragma once
/**
 * @file raw_transport.hpp
 * @brief Contract of the message transport msgbuf hands buffers to.
 *
 * A transport moves whole messages. msgbuf only needs three operations:
 *  - send_raw(): copy-out of a region the caller keeps owning;
 *  - recv_raw(): copy-in of the next message into a caller region;
 *  - send_zero_copy(): take ownership of a MessageHandle and release it once
 *    the transport is done with the memory (the release callback contract).
 */

#include <cstddef>
#include <cstdint>

#include "msgbuf/compat/expected.hpp"
#include "msgbuf/mem/message_handle.hpp"
#include "msgbuf/transport/transport_error.hpp"

namespace msgbuf::transport {

/// @brief Per-call flags.
enum class RawFlags : std::uint8_t {
    None     = 0,
    DontWait = 1   ///< Return WouldBlock instead of blocking
};

class RawTransport {
public:
    virtual ~RawTransport() = default;

    /**
     * @brief Send one message of @p len bytes.
     * @return Bytes accepted (== len for message transports).
     */
    virtual msgbuf_detail::expected<std::size_t, TransportError>
    send_raw(const std::byte* data, std::size_t len, RawFlags flags) = 0;

    /**
     * @brief Receive the next message into [@p data, @p data + @p len).
     * @return Message length; MessageTooLarge if it did not fit (message dropped).
     */
    virtual msgbuf_detail::expected<std::size_t, TransportError>
    recv_raw(std::byte* data, std::size_t len, RawFlags flags) = 0;

    /**
     * @brief Length of the next message without consuming it.
     * @return Closed when the peer has gone away.
     */
    virtual msgbuf_detail::expected<std::size_t, TransportError>
    peek_size(RawFlags flags) = 0;

    /**
     * @brief Send @p handle without copying it; the transport owns it from here.
     * @details The handle is released when the transport has finished with the
     *          memory, on the calling thread, whether or not the send succeeded.
     *          The default completes synchronously through send_raw().
     */
    virtual msgbuf_detail::expected<std::size_t, TransportError>
    send_zero_copy(mem::MessageHandle&& handle, RawFlags flags);
};

} // namespace msgbuf::transport
