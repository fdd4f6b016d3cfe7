#include "msgbuf/transport/async_sender.hpp"

#include <utility>

#include "msgbuf/obs/observability.hpp"

namespace msgbuf::transport {

msgbuf_detail::expected<std::unique_ptr<AsyncSender>, TransportError>
AsyncSender::start(RawTransport& transport, const SenderOptions& options) {
    auto queue = mem::SpscQueue<mem::MessageHandle>::with_capacity(options.queue_depth);
    if (!queue) {
        obs::logger()->error("AsyncSender: queue depth {} rejected: {}",
                             options.queue_depth, mem::to_string(queue.error()));
        return msgbuf_detail::unexpected(TransportError::InvalidArgument);
    }
    auto wake = io::WakeEndpoint::create();
    if (!wake) {
        return msgbuf_detail::unexpected(TransportError::SystemError);
    }
    auto mux = io::ReadinessMultiplexer::with_capacity(1);
    if (!mux) {
        return msgbuf_detail::unexpected(TransportError::SystemError);
    }

    std::unique_ptr<AsyncSender> sender(new AsyncSender(
        transport, std::move(*queue), std::move(*wake), std::move(*mux), options));

    // Register only once the endpoint has reached its final address.
    auto ref = sender->mux_.add(sender->wake_, io::PollEvents::In);
    if (!ref) {
        obs::logger()->error("AsyncSender: wake registration failed: {}", io::to_string(ref.error()));
        return msgbuf_detail::unexpected(TransportError::SystemError);
    }
    sender->wake_ref_ = *ref;
    sender->worker_ = std::thread([s = sender.get()] { s->run(); });

    obs::logger()->info("AsyncSender: started (queue depth {}, rt {})",
                        options.queue_depth, options.rt ? "on" : "off");
    return sender;
}

AsyncSender::AsyncSender(RawTransport& transport, mem::SpscQueue<mem::MessageHandle> queue,
                         io::WakeEndpoint wake, io::ReadinessMultiplexer mux,
                         const SenderOptions& options)
    : transport_(transport),
      queue_(std::move(queue)),
      wake_(std::move(wake)),
      mux_(std::move(mux)),
      options_(options) {}

AsyncSender::~AsyncSender() { stop(); }

msgbuf_detail::expected<void, TransportError> AsyncSender::submit(mem::MessageHandle&& handle) {
    if (stopping_.load(std::memory_order_acquire)) {
        return msgbuf_detail::unexpected(TransportError::Closed);
    }
    if (!queue_.push(std::move(handle))) {
        return msgbuf_detail::unexpected(TransportError::WouldBlock);
    }
    submitted_.fetch_add(1, std::memory_order_relaxed);
    if (auto woke = wake_.signal(); !woke) {
        // The I/O thread still wakes after idle_wait.
        obs::logger()->warn("AsyncSender: wake signal failed: {}", io::to_string(woke.error()));
    }
    return {};
}

void AsyncSender::stop() {
    stopping_.store(true, std::memory_order_release);
    if (!worker_.joinable()) {
        return;
    }
    if (auto woke = wake_.signal(); !woke) {
        obs::logger()->warn("AsyncSender: stop signal failed: {}", io::to_string(woke.error()));
    }
    worker_.join();

    const auto st = statistics();
    obs::logger()->info("AsyncSender: stopped (submitted {}, sent {}, failed {})",
                        st.submitted, st.sent, st.failed);
}

SenderStatistics AsyncSender::statistics() const noexcept {
    SenderStatistics s;
    s.submitted = submitted_.load(std::memory_order_relaxed);
    s.sent      = sent_.load(std::memory_order_relaxed);
    s.failed    = failed_.load(std::memory_order_relaxed);
    return s;
}

std::size_t AsyncSender::drain() {
    std::size_t n = 0;
    mem::MessageHandle handle;
    while (queue_.pop(handle)) {
        const auto id = handle.id();
        auto r = transport_.send_zero_copy(std::move(handle), RawFlags::None);
        if (r) {
            sent_.fetch_add(1, std::memory_order_relaxed);
        } else {
            failed_.fetch_add(1, std::memory_order_relaxed);
            obs::logger()->warn("AsyncSender: handle {} not sent: {}", id, to_string(r.error()));
        }
        ++n;
    }
    return n;
}

void AsyncSender::run() {
    if (options_.rt) {
        if (!os::bind_and_prioritize(*options_.rt)) {
            obs::logger()->warn("AsyncSender: I/O thread continues without RT settings");
        }
    }

    while (!stopping_.load(std::memory_order_acquire)) {
        if (drain() > 0) {
            continue;
        }
        auto ready = mux_.poll(options_.idle_wait);
        if (!ready) {
            std::this_thread::sleep_for(options_.idle_wait);
            continue;
        }
        if (mux_.is_readable(wake_ref_)) {
            if (auto d = wake_.drain(); !d) {
                obs::logger()->warn("AsyncSender: wake drain failed: {}", io::to_string(d.error()));
            }
        }
    }
    // Flush handoffs that raced with stop().
    drain();
}

} // namespace msgbuf::transport
