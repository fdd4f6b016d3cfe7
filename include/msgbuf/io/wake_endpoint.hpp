#pragma once
/**
 * @file wake_endpoint.hpp
 * @brief eventfd-backed endpoint used to unblock a pending poll().
 * @details There is no out-of-band interrupt for ReadinessMultiplexer::poll();
 *          register one WakeEndpoint (interest In) and signal() it from any thread.
 */

#include <cstdint>

#include "msgbuf/compat/expected.hpp"
#include "msgbuf/io/endpoint.hpp"
#include "msgbuf/io/io_error.hpp"

namespace msgbuf::io {

class WakeEndpoint final : public Endpoint {
public:
    /// @brief Create a non-blocking, close-on-exec eventfd.
    static msgbuf_detail::expected<WakeEndpoint, IoError> create() noexcept;

    WakeEndpoint(const WakeEndpoint&)            = delete;
    WakeEndpoint& operator=(const WakeEndpoint&) = delete;
    WakeEndpoint(WakeEndpoint&& other) noexcept;
    WakeEndpoint& operator=(WakeEndpoint&& other) noexcept;
    ~WakeEndpoint() override;

    int native_handle() const noexcept override { return fd_; }

    /// @brief Make the endpoint readable. Safe from any thread.
    msgbuf_detail::expected<void, IoError> signal() noexcept;

    /**
     * @brief Consume pending signals.
     * @return Number of signal() calls folded since the last drain (0 if none).
     */
    msgbuf_detail::expected<std::uint64_t, IoError> drain() noexcept;

private:
    explicit WakeEndpoint(int fd) noexcept : fd_(fd) {}

    int fd_{-1};
};

} // namespace msgbuf::io
