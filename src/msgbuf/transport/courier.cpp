#include "msgbuf/transport/courier.hpp"

#include <new>
#include <utility>

#include "msgbuf/obs/observability.hpp"
#include "msgbuf/transport/async_sender.hpp"

namespace msgbuf::transport {

namespace {

constexpr std::align_val_t kRegionAlign{config::constants::POOL_BUFFER_ALIGNMENT};

TransportError from_buffer_error(mem::BufferError e, const char* where) {
    obs::logger()->error("Courier: {} failed: {}", where, mem::to_string(e));
    return TransportError::BufferError;
}

} // namespace

Courier::Courier(mem::BufferPool& pool, RawTransport& transport, const CourierOptions& options,
                 std::unique_ptr<std::byte[]> scratch) noexcept
    : pool_(&pool), transport_(&transport), options_(options), scratch_(std::move(scratch)) {}

msgbuf_detail::expected<Courier, TransportError>
Courier::create(mem::BufferPool& pool, RawTransport& transport, const CourierOptions& options) {
    if (!options.thresholds.valid()) {
        obs::logger()->error("Courier: thresholds rejected (send {}/{}, recv {}/{})",
                             options.thresholds.send.small_max, options.thresholds.send.large_min,
                             options.thresholds.recv.small_max, options.thresholds.recv.large_min);
        return msgbuf_detail::unexpected(TransportError::InvalidArgument);
    }
    if (options.scratch_bytes < options.thresholds.recv.small_max) {
        obs::logger()->error("Courier: scratch {} B smaller than receive transient band {} B",
                             options.scratch_bytes, options.thresholds.recv.small_max);
        return msgbuf_detail::unexpected(TransportError::InvalidArgument);
    }
    std::unique_ptr<std::byte[]> scratch(new (std::nothrow) std::byte[options.scratch_bytes]);
    if (!scratch) {
        return msgbuf_detail::unexpected(TransportError::BufferError);
    }
    return Courier(pool, transport, options, std::move(scratch));
}

msgbuf_detail::expected<transfer::Strategy, TransportError>
Courier::send(std::span<const std::byte> payload, RawFlags flags) {
    if (payload.empty()) {
        return msgbuf_detail::unexpected(TransportError::InvalidArgument);
    }
    const auto strategy = transfer::select_strategy(payload.size(), transfer::OperationKind::Send,
                                                    options_.thresholds);
    switch (strategy) {
        case transfer::Strategy::Transient: {
            auto sent = transport_->send_raw(payload.data(), payload.size(), flags);
            if (!sent) return msgbuf_detail::unexpected(sent.error());
            break;
        }
        case transfer::Strategy::PoolCopy: {
            auto handle = mem::MessageHandle::from_data(*pool_, payload);
            if (!handle) {
                return msgbuf_detail::unexpected(from_buffer_error(handle.error(), "pool copy"));
            }
            auto view = handle->cdata();
            if (!view) {
                return msgbuf_detail::unexpected(from_buffer_error(view.error(), "pool copy view"));
            }
            auto sent = transport_->send_raw(view->data(), view->size(), flags);
            if (auto released = handle->release(); !released) {
                return msgbuf_detail::unexpected(from_buffer_error(released.error(), "pool give back"));
            }
            if (!sent) return msgbuf_detail::unexpected(sent.error());
            break;
        }
        case transfer::Strategy::ZeroCopy: {
            // The view is only read by the transport, and only for this call.
            auto handle = mem::MessageHandle::borrowed(const_cast<std::byte*>(payload.data()),
                                                       payload.size());
            if (!handle) {
                return msgbuf_detail::unexpected(from_buffer_error(handle.error(), "zero-copy view"));
            }
            auto sent = transport_->send_zero_copy(std::move(*handle), flags);
            if (!sent) return msgbuf_detail::unexpected(sent.error());
            break;
        }
    }
    return strategy;
}

msgbuf_detail::expected<transfer::Strategy, TransportError>
Courier::send(mem::MessageHandle&& handle, RawFlags flags) {
    if (handle.released()) {
        return msgbuf_detail::unexpected(from_buffer_error(mem::BufferError::UseAfterRelease, "handoff"));
    }
    if (handle.size() == 0) {
        return msgbuf_detail::unexpected(TransportError::InvalidArgument);
    }
    if (sender_ != nullptr) {
        auto queued = sender_->submit(std::move(handle));
        if (!queued) return msgbuf_detail::unexpected(queued.error());
        return transfer::Strategy::ZeroCopy;
    }
    auto sent = transport_->send_zero_copy(std::move(handle), flags);
    if (!sent) return msgbuf_detail::unexpected(sent.error());
    return transfer::Strategy::ZeroCopy;
}

msgbuf_detail::expected<Received, TransportError> Courier::recv(RawFlags flags) {
    auto size = transport_->peek_size(flags);
    if (!size) {
        return msgbuf_detail::unexpected(size.error());
    }
    const std::size_t n = *size;

    if (n > options_.max_message_bytes) {
        // Consume and drop it; the transport reports the truncation.
        auto dropped = transport_->recv_raw(scratch_.get(), options_.scratch_bytes, flags);
        if (!dropped && dropped.error() != TransportError::MessageTooLarge) {
            return msgbuf_detail::unexpected(dropped.error());
        }
        obs::logger()->warn("Courier: dropped {}-byte message (limit {} B)", n, options_.max_message_bytes);
        return msgbuf_detail::unexpected(TransportError::MessageTooLarge);
    }

    switch (transfer::select_strategy(n, transfer::OperationKind::Receive, options_.thresholds)) {
        case transfer::Strategy::Transient: return recv_transient(n, flags);
        case transfer::Strategy::PoolCopy:  return recv_pooled(n, flags);
        case transfer::Strategy::ZeroCopy:  return recv_zero_copy(n, flags);
    }
    return msgbuf_detail::unexpected(TransportError::InvalidArgument);
}

msgbuf_detail::expected<Received, TransportError> Courier::recv_transient(std::size_t, RawFlags flags) {
    auto got = transport_->recv_raw(scratch_.get(), options_.scratch_bytes, flags);
    if (!got) {
        return msgbuf_detail::unexpected(got.error());
    }
    auto handle = mem::MessageHandle::borrowed(scratch_.get(), *got);
    if (!handle) {
        return msgbuf_detail::unexpected(from_buffer_error(handle.error(), "scratch view"));
    }
    return Received{std::move(*handle), transfer::Strategy::Transient};
}

msgbuf_detail::expected<Received, TransportError> Courier::recv_pooled(std::size_t n, RawFlags flags) {
    auto handle = mem::MessageHandle::from_length(*pool_, n);
    if (!handle) {
        return msgbuf_detail::unexpected(from_buffer_error(handle.error(), "pool rent"));
    }
    auto view = handle->data();
    if (!view) {
        return msgbuf_detail::unexpected(from_buffer_error(view.error(), "pool view"));
    }
    auto got = transport_->recv_raw(view->data(), view->size(), flags);
    if (!got) {
        return msgbuf_detail::unexpected(got.error());
    }
    if (auto resized = handle->resize(*got); !resized) {
        return msgbuf_detail::unexpected(from_buffer_error(resized.error(), "pool resize"));
    }
    return Received{std::move(*handle), transfer::Strategy::PoolCopy};
}

msgbuf_detail::expected<Received, TransportError> Courier::recv_zero_copy(std::size_t n, RawFlags flags) {
    auto* region = static_cast<std::byte*>(::operator new(n, kRegionAlign, std::nothrow));
    if (region == nullptr) {
        return msgbuf_detail::unexpected(from_buffer_error(mem::BufferError::AllocationFailure, "region"));
    }
    auto handle = mem::MessageHandle::zero_copy(region, n, [](std::byte* p, std::size_t) {
        ::operator delete(p, kRegionAlign);
    });
    if (!handle) {
        ::operator delete(region, kRegionAlign);
        return msgbuf_detail::unexpected(from_buffer_error(handle.error(), "zero-copy wrap"));
    }
    // From here the handle owns the region, including on the error paths.
    auto got = transport_->recv_raw(region, n, flags);
    if (!got) {
        return msgbuf_detail::unexpected(got.error());
    }
    if (auto resized = handle->resize(*got); !resized) {
        return msgbuf_detail::unexpected(from_buffer_error(resized.error(), "region resize"));
    }
    return Received{std::move(*handle), transfer::Strategy::ZeroCopy};
}

} // namespace msgbuf::transport
