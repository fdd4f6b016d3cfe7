#pragma once
/**
 * @file courier.hpp
 * @brief Strategy-driven send/recv over a RawTransport.
 *
 * Send (payload owned by the caller, call is synchronous):
 *  - Transient: the payload is written straight from the caller's memory.
 *  - PoolCopy:  copied into a pooled buffer, written, buffer given back.
 *  - ZeroCopy:  a non-owning handle is passed to send_zero_copy(). The span
 *               stays the caller's, so nothing is allocated and no release
 *               callback runs; the write completes before send() returns.
 * The freshly-allocated-region-with-callback form of ZeroCopy is the handle
 * overload: build an External handle with MessageHandle::zero_copy() and pass
 * it to send(MessageHandle&&). Its callback fires once the transport is done,
 * on the sender's I/O thread when an AsyncSender is attached.
 *
 * Receive (length known up front via peek_size()):
 *  - Transient: read into the courier's scratch; the handle is a borrowed view
 *    valid until the next recv().
 *  - PoolCopy:  read directly into a pooled buffer.
 *  - ZeroCopy:  read into a fresh region that the handle frees on release.
 *
 * Single-threaded: one Courier per thread.
 */

#include <cstddef>
#include <memory>
#include <span>

#include "msgbuf/compat/expected.hpp"
#include "msgbuf/config/constants.hpp"
#include "msgbuf/mem/buffer_pool.hpp"
#include "msgbuf/mem/message_handle.hpp"
#include "msgbuf/transfer/transfer_strategy.hpp"
#include "msgbuf/transport/raw_transport.hpp"

namespace msgbuf::transport {

class AsyncSender;

struct CourierOptions {
    transfer::Thresholds thresholds{};
    std::size_t scratch_bytes{config::constants::RECV_SCRATCH_BYTES};          ///< >= thresholds.recv.small_max
    std::size_t max_message_bytes{config::constants::RECV_MAX_MESSAGE_BYTES};  ///< Larger messages are dropped
};

/// @brief One received message and the path it took.
struct Received {
    mem::MessageHandle handle;
    transfer::Strategy strategy{transfer::Strategy::Transient};
};

class Courier {
public:
    /**
     * @brief Validate @p options and allocate the receive scratch.
     * @return InvalidArgument for invalid thresholds or a scratch smaller than
     *         the receive transient band.
     */
    static msgbuf_detail::expected<Courier, TransportError>
    create(mem::BufferPool& pool, RawTransport& transport, const CourierOptions& options = {});

    /// @brief Route handle handoffs through @p sender (nullptr: send synchronously).
    void attach(AsyncSender* sender) noexcept { sender_ = sender; }

    /**
     * @brief Send @p payload along the path the send band selects.
     * @return The strategy used; InvalidArgument for an empty payload.
     */
    msgbuf_detail::expected<transfer::Strategy, TransportError>
    send(std::span<const std::byte> payload, RawFlags flags = RawFlags::None);

    /**
     * @brief Zero-copy handoff of a handle the caller already filled.
     * @details Synchronous without a sender. With a sender the handle is moved
     *          into its queue, except on WouldBlock/Closed where it stays here.
     */
    msgbuf_detail::expected<transfer::Strategy, TransportError>
    send(mem::MessageHandle&& handle, RawFlags flags = RawFlags::None);

    /// @brief Receive the next message; see the file comment for ownership per strategy.
    msgbuf_detail::expected<Received, TransportError> recv(RawFlags flags = RawFlags::None);

    const CourierOptions& options() const noexcept { return options_; }

private:
    Courier(mem::BufferPool& pool, RawTransport& transport, const CourierOptions& options,
            std::unique_ptr<std::byte[]> scratch) noexcept;

    msgbuf_detail::expected<Received, TransportError> recv_transient(std::size_t n, RawFlags flags);
    msgbuf_detail::expected<Received, TransportError> recv_pooled(std::size_t n, RawFlags flags);
    msgbuf_detail::expected<Received, TransportError> recv_zero_copy(std::size_t n, RawFlags flags);

    mem::BufferPool*             pool_;
    RawTransport*                transport_;
    AsyncSender*                 sender_{nullptr};
    CourierOptions               options_;
    std::unique_ptr<std::byte[]> scratch_;
};

} // namespace msgbuf::transport
