#if defined(__linux__)

#include "msgbuf/io/wake_endpoint.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <sys/eventfd.h>
#include <unistd.h>

#include "msgbuf/obs/observability.hpp"

namespace msgbuf::io {

msgbuf_detail::expected<WakeEndpoint, IoError> WakeEndpoint::create() noexcept {
    const int fd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (fd < 0) {
        obs::logger()->error("WakeEndpoint: eventfd failed: {}", std::strerror(errno));
        return msgbuf_detail::unexpected(IoError::SystemError);
    }
    return WakeEndpoint(fd);
}

WakeEndpoint::WakeEndpoint(WakeEndpoint&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)) {}

WakeEndpoint& WakeEndpoint::operator=(WakeEndpoint&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

WakeEndpoint::~WakeEndpoint() {
    if (fd_ >= 0) ::close(fd_);
}

msgbuf_detail::expected<void, IoError> WakeEndpoint::signal() noexcept {
    const std::uint64_t one = 1;
    for (;;) {
        const ssize_t n = ::write(fd_, &one, sizeof(one));
        if (n == static_cast<ssize_t>(sizeof(one))) return {};
        if (n < 0 && errno == EINTR) continue;
        // EAGAIN: counter saturated, the endpoint is readable anyway.
        if (n < 0 && errno == EAGAIN) return {};
        obs::logger()->error("WakeEndpoint: write failed: {}", std::strerror(errno));
        return msgbuf_detail::unexpected(IoError::SystemError);
    }
}

msgbuf_detail::expected<std::uint64_t, IoError> WakeEndpoint::drain() noexcept {
    std::uint64_t count = 0;
    for (;;) {
        const ssize_t n = ::read(fd_, &count, sizeof(count));
        if (n == static_cast<ssize_t>(sizeof(count))) return count;
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && errno == EAGAIN) return std::uint64_t{0};
        obs::logger()->error("WakeEndpoint: read failed: {}", std::strerror(errno));
        return msgbuf_detail::unexpected(IoError::SystemError);
    }
}

} // namespace msgbuf::io
#endif
