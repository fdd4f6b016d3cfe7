/**
 * @file readiness_multiplexer.cpp
 * @brief poll(2)-backed ReadinessMultiplexer.
 */
#include "msgbuf/io/readiness_multiplexer.hpp"

#include <cerrno>
#include <algorithm>
#include <cstring>
#include <limits>

#include "msgbuf/obs/observability.hpp"

namespace msgbuf::io {

namespace {

short to_native(PollEvents ev) noexcept {
    short out = 0;
    if (any(ev, PollEvents::In))  out |= POLLIN;
    if (any(ev, PollEvents::Out)) out |= POLLOUT;
    if (any(ev, PollEvents::Pri)) out |= POLLPRI;
    // POLLERR/POLLHUP/POLLNVAL are always reported; no need to request them.
    return out;
}

PollEvents from_native(short revents) noexcept {
    PollEvents out = PollEvents::None;
    if (revents & POLLIN)  out = out | PollEvents::In;
    if (revents & POLLOUT) out = out | PollEvents::Out;
    if (revents & POLLPRI) out = out | PollEvents::Pri;
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) out = out | PollEvents::Err;
    return out;
}

} // namespace

ReadinessMultiplexer::ReadinessMultiplexer(std::size_t capacity)
    : capacity_(capacity) {
    endpoints_.reserve(capacity);
    items_.reserve(capacity);
}

msgbuf_detail::expected<ReadinessMultiplexer, IoError>
ReadinessMultiplexer::with_capacity(std::size_t capacity) {
    if (capacity == 0) {
        return msgbuf_detail::unexpected(IoError::InvalidCapacity);
    }
    return ReadinessMultiplexer(capacity);
}

msgbuf_detail::expected<EndpointRef, IoError>
ReadinessMultiplexer::add(Endpoint& ep, PollEvents interest) noexcept {
    if (endpoints_.size() >= capacity_) {
        return msgbuf_detail::unexpected(IoError::CapacityExceeded);
    }
    const int fd = ep.native_handle();
    if (fd < 0) {
        return msgbuf_detail::unexpected(IoError::InvalidEndpoint);
    }
    // Storage was reserved up front; push_back does not allocate here.
    endpoints_.push_back(&ep);
    items_.push_back(::pollfd{fd, to_native(interest), 0});
    return EndpointRef{static_cast<std::uint32_t>(endpoints_.size() - 1)};
}

msgbuf_detail::expected<void, IoError>
ReadinessMultiplexer::update(EndpointRef ref, PollEvents interest) noexcept {
    if (!valid(ref)) {
        return msgbuf_detail::unexpected(IoError::InvalidRef);
    }
    items_[ref.index].events  = to_native(interest);
    items_[ref.index].revents = 0;
    return {};
}

msgbuf_detail::expected<int, IoError> ReadinessMultiplexer::poll(int timeout_ms) noexcept {
    for (auto& item : items_) item.revents = 0;
    if (items_.empty()) {
        return 0;
    }

    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms < 0 ? 0 : timeout_ms);
    int wait_ms = timeout_ms;

    for (;;) {
        const int n = ::poll(items_.data(), static_cast<nfds_t>(items_.size()), wait_ms);
        if (n >= 0) {
            return n;
        }
        if (errno != EINTR) {
            const int err = errno;
            obs::logger()->error("ReadinessMultiplexer: poll over {} endpoints failed: {} (errno {})",
                                 items_.size(), std::strerror(err), err);
            return msgbuf_detail::unexpected(IoError::SystemError);
        }
        // EINTR: retry with whatever is left of the timeout.
        if (timeout_ms > 0) {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
            if (left.count() <= 0) {
                return 0;
            }
            wait_ms = static_cast<int>(left.count());
        }
    }
}

msgbuf_detail::expected<int, IoError>
ReadinessMultiplexer::poll(std::chrono::milliseconds timeout) noexcept {
    if (timeout.count() < 0) {
        return poll(-1);
    }
    constexpr auto kMax = std::chrono::milliseconds(std::numeric_limits<int>::max());
    return poll(static_cast<int>(std::min(timeout, kMax).count()));
}

bool ReadinessMultiplexer::is_ready(EndpointRef ref, PollEvents events) const noexcept {
    return valid(ref) && any(from_native(items_[ref.index].revents), events);
}

PollEvents ReadinessMultiplexer::returned_events(EndpointRef ref) const noexcept {
    return valid(ref) ? from_native(items_[ref.index].revents) : PollEvents::None;
}

Endpoint* ReadinessMultiplexer::endpoint(EndpointRef ref) const noexcept {
    return valid(ref) ? endpoints_[ref.index] : nullptr;
}

void ReadinessMultiplexer::clear() noexcept {
    endpoints_.clear();
    items_.clear();
}

} // namespace msgbuf::io
