#pragma once
/**
 * @file socket_transport.hpp
 * @brief RawTransport over a connected AF_UNIX/SOCK_SEQPACKET descriptor.
 * @details Message boundaries are preserved by the kernel, so one send_raw() is
 *          one recv_raw(). The transport is also an io::Endpoint and can be
 *          registered with a ReadinessMultiplexer. Zero-length messages are not
 *          supported: a 0-byte read means the peer closed.
 */

#include <utility>

#include "msgbuf/compat/expected.hpp"
#include "msgbuf/io/endpoint.hpp"
#include "msgbuf/transport/raw_transport.hpp"

namespace msgbuf::transport {

class SocketTransport final : public RawTransport, public io::Endpoint {
public:
    /// @brief Connected pair of transports (socketpair(2)); handy for in-process links and tests.
    static msgbuf_detail::expected<std::pair<SocketTransport, SocketTransport>, TransportError> pair();

    /// @brief Take ownership of an already connected SOCK_SEQPACKET descriptor.
    static msgbuf_detail::expected<SocketTransport, TransportError> adopt(int fd);

    SocketTransport(const SocketTransport&)            = delete;
    SocketTransport& operator=(const SocketTransport&) = delete;
    SocketTransport(SocketTransport&& other) noexcept;
    SocketTransport& operator=(SocketTransport&& other) noexcept;
    ~SocketTransport() override;

    msgbuf_detail::expected<std::size_t, TransportError>
    send_raw(const std::byte* data, std::size_t len, RawFlags flags) override;

    msgbuf_detail::expected<std::size_t, TransportError>
    recv_raw(std::byte* data, std::size_t len, RawFlags flags) override;

    msgbuf_detail::expected<std::size_t, TransportError> peek_size(RawFlags flags) override;

    int native_handle() const noexcept override { return fd_; }

    /// @brief Stop sending; the peer sees Closed once it has drained what was sent.
    void shutdown_write() noexcept;

    /// @brief Close the descriptor now (idempotent).
    void close() noexcept;

private:
    explicit SocketTransport(int fd) noexcept : fd_(fd) {}

    int fd_{-1};
};

} // namespace msgbuf::transport
