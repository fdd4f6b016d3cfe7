#pragma once
/**
 * @file readiness_multiplexer.hpp
 * @brief Wait on many endpoints with one blocking call (poll(2) underneath).
 *
 * Contract:
 *  - Fixed-capacity registration table sized at construction.
 *  - poll(timeout_ms): < 0 blocks until something is ready, 0 checks once,
 *    > 0 waits at most that long. Returns the number of ready registrations;
 *    0 on timeout (a normal outcome, not an error).
 *  - is_ready()/returned_events() read the snapshot of the *last* poll(); the
 *    next poll() overwrites it.
 *  - Driven by exactly one thread. Endpoints may be written by other threads.
 *  - No async cancellation: register a WakeEndpoint and signal() it.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

#include <poll.h>

#include "msgbuf/compat/expected.hpp"
#include "msgbuf/config/constants.hpp"
#include "msgbuf/io/endpoint.hpp"
#include "msgbuf/io/io_error.hpp"

namespace msgbuf::io {

/**
 * @struct EndpointRef
 * @brief Stable registration index, valid until clear().
 */
struct EndpointRef {
    std::uint32_t index{0};

    friend bool operator==(const EndpointRef&, const EndpointRef&) = default;
};

class ReadinessMultiplexer {
public:
    /**
     * @brief Factory: validates capacity and reserves the table once.
     * @param capacity Maximum registrations (> 0).
     */
    static msgbuf_detail::expected<ReadinessMultiplexer, IoError>
    with_capacity(std::size_t capacity = config::constants::POLLER_DEFAULT_CAPACITY);

    ReadinessMultiplexer(const ReadinessMultiplexer&)            = delete;
    ReadinessMultiplexer& operator=(const ReadinessMultiplexer&) = delete;
    ReadinessMultiplexer(ReadinessMultiplexer&&) noexcept            = default;
    ReadinessMultiplexer& operator=(ReadinessMultiplexer&&) noexcept = default;

    /**
     * @brief Register @p ep with an interest mask.
     * @return CapacityExceeded when the table is full; InvalidEndpoint for a
     *         negative descriptor.
     */
    msgbuf_detail::expected<EndpointRef, IoError> add(Endpoint& ep, PollEvents interest) noexcept;

    /// @brief Replace the interest mask of an existing registration.
    msgbuf_detail::expected<void, IoError> update(EndpointRef ref, PollEvents interest) noexcept;

    /**
     * @brief Wait for readiness.
     * @param timeout_ms < 0 infinite, 0 non-blocking, > 0 bounded (milliseconds).
     * @return Ready registration count (0 on timeout); SystemError if poll(2) fails.
     */
    msgbuf_detail::expected<int, IoError> poll(int timeout_ms = -1) noexcept;

    /// @brief poll() with a duration; negative durations block indefinitely.
    msgbuf_detail::expected<int, IoError> poll(std::chrono::milliseconds timeout) noexcept;

    /// @brief O(1): did the last poll() report any of @p events for @p ref?
    bool is_ready(EndpointRef ref, PollEvents events) const noexcept;

    /// @brief Full result mask from the last poll() (None for an unknown ref).
    PollEvents returned_events(EndpointRef ref) const noexcept;

    bool is_readable(EndpointRef ref) const noexcept { return is_ready(ref, PollEvents::In); }
    bool is_writable(EndpointRef ref) const noexcept { return is_ready(ref, PollEvents::Out); }
    bool has_error(EndpointRef ref) const noexcept { return is_ready(ref, PollEvents::Err); }

    /// @brief Endpoint registered under @p ref, or nullptr.
    Endpoint* endpoint(EndpointRef ref) const noexcept;

    std::size_t size() const noexcept { return endpoints_.size(); }
    std::size_t capacity() const noexcept { return capacity_; }

    /// @brief Drop every registration; previously issued refs become invalid.
    void clear() noexcept;

private:
    explicit ReadinessMultiplexer(std::size_t capacity);

    bool valid(EndpointRef ref) const noexcept { return ref.index < endpoints_.size(); }

    std::size_t             capacity_{0};
    std::vector<Endpoint*>  endpoints_;  ///< Non-owning
    std::vector<::pollfd>   items_;      ///< Parallel to endpoints_; revents = last snapshot
};

} // namespace msgbuf::io
