#pragma once
/**
 * @file async_sender.hpp
 * @brief Transport I/O thread that sends handed-off MessageHandles and releases them.
 *
 * Roles:
 *  - One producer thread calls submit()/stop().
 *  - The sender's own thread pops handles from an SpscQueue, passes each to
 *    RawTransport::send_zero_copy() and thereby fires its release on the I/O
 *    thread (concurrently with the producer renting from the same pool).
 *  - When the ring is empty the I/O thread blocks in a ReadinessMultiplexer on
 *    a WakeEndpoint; submit() signals it.
 *
 * The transport must outlive the sender and must not be used for sending by
 * any other thread while the sender runs.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <thread>

#include "msgbuf/compat/expected.hpp"
#include "msgbuf/config/constants.hpp"
#include "msgbuf/io/readiness_multiplexer.hpp"
#include "msgbuf/io/wake_endpoint.hpp"
#include "msgbuf/mem/message_handle.hpp"
#include "msgbuf/mem/spsc_queue.hpp"
#include "msgbuf/os/rt.hpp"
#include "msgbuf/transport/raw_transport.hpp"

namespace msgbuf::transport {

struct SenderOptions {
    std::size_t               queue_depth{config::constants::SENDER_QUEUE_DEPTH}; ///< Ring capacity, power-of-two
    std::chrono::milliseconds idle_wait{config::constants::SENDER_IDLE_WAIT_MS};  ///< Upper bound of one idle poll
    std::optional<os::RtConfig> rt{};  ///< Applied by the I/O thread to itself when set
};

struct SenderStatistics {
    std::uint64_t submitted{0};  ///< Handles accepted by submit()
    std::uint64_t sent{0};       ///< Handles the transport accepted
    std::uint64_t failed{0};     ///< Handles the transport refused (still released)
};

class AsyncSender {
public:
    /**
     * @brief Build the ring and wake endpoint, then start the I/O thread.
     * @return InvalidArgument for a bad queue depth; SystemError if the wake
     *         endpoint cannot be created.
     */
    static msgbuf_detail::expected<std::unique_ptr<AsyncSender>, TransportError>
    start(RawTransport& transport, const SenderOptions& options = {});

    AsyncSender(const AsyncSender&)            = delete;
    AsyncSender& operator=(const AsyncSender&) = delete;

    /// @brief Calls stop().
    ~AsyncSender();

    /**
     * @brief Hand @p handle to the I/O thread.
     * @return WouldBlock if the ring is full and Closed after stop(); in both
     *         cases @p handle is left with the caller.
     */
    msgbuf_detail::expected<void, TransportError> submit(mem::MessageHandle&& handle);

    /// @brief Send whatever is queued, then join the I/O thread. Idempotent.
    void stop();

    bool running() const noexcept { return !stopping_.load(std::memory_order_acquire); }

    SenderStatistics statistics() const noexcept;

private:
    AsyncSender(RawTransport& transport, mem::SpscQueue<mem::MessageHandle> queue,
                io::WakeEndpoint wake, io::ReadinessMultiplexer mux, const SenderOptions& options);

    void run();
    std::size_t drain();

    RawTransport&                      transport_;
    mem::SpscQueue<mem::MessageHandle> queue_;
    io::WakeEndpoint                   wake_;
    io::ReadinessMultiplexer           mux_;
    io::EndpointRef                    wake_ref_{};
    SenderOptions                      options_;

    std::atomic<bool>          stopping_{false};
    std::atomic<std::uint64_t> submitted_{0};
    std::atomic<std::uint64_t> sent_{0};
    std::atomic<std::uint64_t> failed_{0};

    std::thread worker_;
};

} // namespace msgbuf::transport
