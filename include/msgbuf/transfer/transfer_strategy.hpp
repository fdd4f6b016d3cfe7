#pragma once
/**
 * @file transfer_strategy.hpp
 * @brief Size-dependent choice between transient, pool-copy and zero-copy transfer.
 * @details Pure and allocation-free. The crossover points are measured constants
 *          (see config/constants.hpp) carried in Thresholds, so re-tuning for a new
 *          target never touches call sites.
 */

#include <cstddef>
#include <cstdint>

#include "msgbuf/config/constants.hpp"

namespace msgbuf::transfer {

/**
 * @enum Strategy
 * @brief How a payload crosses into (or out of) the transport.
 */
enum class Strategy : std::uint8_t {
    Transient = 0,  ///< Short-lived view/buffer scoped to one send/recv call; no pool
    PoolCopy,       ///< Copy into a pooled buffer (mid-range default)
    ZeroCopy        ///< Hand a freshly allocated region over with a release callback
};

/**
 * @enum OperationKind
 * @brief Direction of the transfer; each has its own band.
 */
enum class OperationKind : std::uint8_t {
    Send = 0,
    Receive
};

/**
 * @struct Band
 * @brief Crossovers for one operation kind.
 *
 *   length <= small_max             -> Transient
 *   length >= large_min             -> ZeroCopy
 *   small_max < length < large_min  -> PoolCopy
 */
struct Band {
    std::size_t small_max{config::constants::SEND_SMALL_MAX_BYTES}; ///< Largest transient length
    std::size_t large_min{config::constants::SEND_LARGE_MIN_BYTES}; ///< Smallest zero-copy length

    /// @brief A band is usable only if the mid-range is non-empty.
    constexpr bool valid() const noexcept { return small_max < large_min; }
};

/**
 * @struct Thresholds
 * @brief Per-kind bands; defaults come from constants.hpp.
 */
struct Thresholds {
    Band send{config::constants::SEND_SMALL_MAX_BYTES, config::constants::SEND_LARGE_MIN_BYTES};
    Band recv{config::constants::RECV_SMALL_MAX_BYTES, config::constants::RECV_LARGE_MIN_BYTES};

    constexpr const Band& for_kind(OperationKind kind) const noexcept {
        return kind == OperationKind::Send ? send : recv;
    }

    constexpr bool valid() const noexcept { return send.valid() && recv.valid(); }
};

/**
 * @brief Select the transfer path for a payload.
 * @param length Payload length in bytes.
 * @param kind Send or Receive.
 * @param t Crossovers (defaults = measured constants).
 * @return The strategy tag; deterministic for fixed inputs.
 */
constexpr Strategy select_strategy(std::size_t length, OperationKind kind,
                                   const Thresholds& t = Thresholds{}) noexcept {
    const Band& b = t.for_kind(kind);
    if (length <= b.small_max) {
        return Strategy::Transient;
    }
    if (length >= b.large_min) {
        return Strategy::ZeroCopy;
    }
    return Strategy::PoolCopy;
}

const char* to_string(Strategy s) noexcept;
const char* to_string(OperationKind k) noexcept;

static_assert(select_strategy(64, OperationKind::Send) == Strategy::Transient);
static_assert(select_strategy(1024, OperationKind::Send) == Strategy::PoolCopy);
static_assert(select_strategy(65536, OperationKind::Send) == Strategy::ZeroCopy);

} // namespace msgbuf::transfer
