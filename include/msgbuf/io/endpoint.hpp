#pragma once
/**
 * @file endpoint.hpp
 * @brief Pollable endpoint contract and readiness event flags.
 */

#include <cstdint>
#include <type_traits>

namespace msgbuf::io {

/**
 * @enum PollEvents
 * @brief Readiness bitmask (interest on registration, result after poll()).
 */
enum class PollEvents : std::uint16_t {
    None = 0,
    In   = 1,  ///< Readable
    Out  = 2,  ///< Writable
    Err  = 4,  ///< Error / hang-up / invalid descriptor
    Pri  = 8   ///< Urgent data
};

constexpr PollEvents operator|(PollEvents a, PollEvents b) noexcept {
    using U = std::underlying_type_t<PollEvents>;
    return static_cast<PollEvents>(static_cast<U>(a) | static_cast<U>(b));
}

constexpr PollEvents operator&(PollEvents a, PollEvents b) noexcept {
    using U = std::underlying_type_t<PollEvents>;
    return static_cast<PollEvents>(static_cast<U>(a) & static_cast<U>(b));
}

/// @brief True if any bit of @p wanted is set in @p got.
constexpr bool any(PollEvents got, PollEvents wanted) noexcept {
    return (got & wanted) != PollEvents::None;
}

/**
 * @class Endpoint
 * @brief Anything the multiplexer can wait on.
 * @details The descriptor must stay open, and the object must not move, while
 *          it is registered.
 */
class Endpoint {
public:
    virtual ~Endpoint() = default;

    /// Descriptor handed to poll(2); negative means "not pollable".
    virtual int native_handle() const noexcept = 0;
};

/**
 * @class DescriptorEndpoint
 * @brief Non-owning adaptor for a raw descriptor (pipe end, socket, timerfd...).
 */
class DescriptorEndpoint final : public Endpoint {
public:
    explicit DescriptorEndpoint(int fd) noexcept : fd_(fd) {}
    int native_handle() const noexcept override { return fd_; }

private:
    int fd_;
};

} // namespace msgbuf::io
