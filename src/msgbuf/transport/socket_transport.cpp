#include "msgbuf/transport/socket_transport.hpp"

#include <cerrno>
#include <cstring>

#include <sys/socket.h>
#include <unistd.h>

#include "msgbuf/obs/observability.hpp"

namespace msgbuf::transport {

namespace {

int to_native(RawFlags flags) noexcept {
    return flags == RawFlags::DontWait ? MSG_DONTWAIT : 0;
}

/// Map a failed send/recv errno to the transport error set.
TransportError classify(int err, const char* op, int fd) {
    switch (err) {
        case EAGAIN:
#if EWOULDBLOCK != EAGAIN
        case EWOULDBLOCK:
#endif
            return TransportError::WouldBlock;
        case EPIPE:
        case ECONNRESET:
        case ENOTCONN:
            return TransportError::Closed;
        case EMSGSIZE:
        case ENOBUFS:
            return TransportError::MessageTooLarge;
        default:
            obs::logger()->error("SocketTransport fd {}: {} failed: {} (errno {})",
                                 fd, op, std::strerror(err), err);
            return TransportError::SystemError;
    }
}

} // namespace

msgbuf_detail::expected<std::pair<SocketTransport, SocketTransport>, TransportError>
SocketTransport::pair() {
    int fds[2] = {-1, -1};
    if (::socketpair(AF_UNIX, SOCK_SEQPACKET | SOCK_CLOEXEC, 0, fds) != 0) {
        obs::logger()->error("SocketTransport: socketpair failed: {}", std::strerror(errno));
        return msgbuf_detail::unexpected(TransportError::SystemError);
    }
    return std::pair<SocketTransport, SocketTransport>(SocketTransport(fds[0]), SocketTransport(fds[1]));
}

msgbuf_detail::expected<SocketTransport, TransportError> SocketTransport::adopt(int fd) {
    if (fd < 0) {
        return msgbuf_detail::unexpected(TransportError::InvalidArgument);
    }
    return SocketTransport(fd);
}

SocketTransport::SocketTransport(SocketTransport&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)) {}

SocketTransport& SocketTransport::operator=(SocketTransport&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

SocketTransport::~SocketTransport() { close(); }

void SocketTransport::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void SocketTransport::shutdown_write() noexcept {
    if (fd_ >= 0) ::shutdown(fd_, SHUT_WR);
}

msgbuf_detail::expected<std::size_t, TransportError>
SocketTransport::send_raw(const std::byte* data, std::size_t len, RawFlags flags) {
    if (fd_ < 0) {
        return msgbuf_detail::unexpected(TransportError::Closed);
    }
    for (;;) {
        const ssize_t n = ::send(fd_, data, len, to_native(flags) | MSG_NOSIGNAL);
        if (n >= 0) {
            return static_cast<std::size_t>(n);
        }
        if (errno == EINTR) continue;
        return msgbuf_detail::unexpected(classify(errno, "send", fd_));
    }
}

msgbuf_detail::expected<std::size_t, TransportError>
SocketTransport::recv_raw(std::byte* data, std::size_t len, RawFlags flags) {
    if (fd_ < 0) {
        return msgbuf_detail::unexpected(TransportError::Closed);
    }
    for (;;) {
        // MSG_TRUNC makes recv() report the full message length.
        const ssize_t n = ::recv(fd_, data, len, to_native(flags) | MSG_TRUNC);
        if (n == 0) {
            return msgbuf_detail::unexpected(TransportError::Closed);
        }
        if (n > 0) {
            if (static_cast<std::size_t>(n) > len) {
                obs::logger()->warn("SocketTransport fd {}: dropped {}-byte message (buffer {} B)",
                                    fd_, n, len);
                return msgbuf_detail::unexpected(TransportError::MessageTooLarge);
            }
            return static_cast<std::size_t>(n);
        }
        if (errno == EINTR) continue;
        return msgbuf_detail::unexpected(classify(errno, "recv", fd_));
    }
}

msgbuf_detail::expected<std::size_t, TransportError> SocketTransport::peek_size(RawFlags flags) {
    if (fd_ < 0) {
        return msgbuf_detail::unexpected(TransportError::Closed);
    }
    for (;;) {
        const ssize_t n = ::recv(fd_, nullptr, 0, to_native(flags) | MSG_PEEK | MSG_TRUNC);
        if (n == 0) {
            return msgbuf_detail::unexpected(TransportError::Closed);
        }
        if (n > 0) {
            return static_cast<std::size_t>(n);
        }
        if (errno == EINTR) continue;
        return msgbuf_detail::unexpected(classify(errno, "peek", fd_));
    }
}

} // namespace msgbuf::transport
