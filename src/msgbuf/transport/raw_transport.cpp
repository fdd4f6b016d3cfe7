#include "msgbuf/transport/raw_transport.hpp"

#include <utility>

#include "msgbuf/obs/observability.hpp"

namespace msgbuf::transport {

const char* to_string(TransportError e) noexcept {
    switch (e) {
        case TransportError::WouldBlock:      return "would_block";
        case TransportError::Closed:          return "closed";
        case TransportError::MessageTooLarge: return "message_too_large";
        case TransportError::SystemError:     return "system_error";
        case TransportError::BufferError:     return "buffer_error";
        case TransportError::InvalidArgument: return "invalid_argument";
    }
    return "unknown";
}

msgbuf_detail::expected<std::size_t, TransportError>
RawTransport::send_zero_copy(mem::MessageHandle&& handle, RawFlags flags) {
    mem::MessageHandle owned = std::move(handle);

    auto view = owned.cdata();
    if (!view) {
        return msgbuf_detail::unexpected(TransportError::BufferError);
    }
    auto sent = send_raw(view->data(), view->size(), flags);

    // Completion: the transport no longer references the region.
    if (auto released = owned.release(); !released) {
        obs::logger()->error("transport: release of handle {} after send failed: {}",
                             owned.id(), mem::to_string(released.error()));
        if (sent) {
            return msgbuf_detail::unexpected(TransportError::BufferError);
        }
    }
    return sent;
}

} // namespace msgbuf::transport
