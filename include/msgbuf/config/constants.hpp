#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the pool, the transfer selector and I/O.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          Config Loader (key = value file) when re-measuring on a new target.
 */

#include <cstddef>
#include <cstdint>

namespace msgbuf::config::constants {

// =====================
// Size-class ladder (power-of-two capacities)
// 2^4 = 16 B ... 2^22 = 4 MiB, 19 rungs. Requests above the top rung are
// served unpooled ("oversize").
// =====================
inline constexpr std::uint32_t POOL_MIN_CLASS_SHIFT = 4;   ///< 16 B
inline constexpr std::uint32_t POOL_MAX_CLASS_SHIFT = 22;  ///< 4 MiB
inline constexpr std::size_t   POOL_CLASS_COUNT =
    POOL_MAX_CLASS_SHIFT - POOL_MIN_CLASS_SHIFT + 1;
inline constexpr std::size_t   POOL_MIN_CLASS_BYTES = std::size_t{1} << POOL_MIN_CLASS_SHIFT;
inline constexpr std::size_t   POOL_MAX_CLASS_BYTES = std::size_t{1} << POOL_MAX_CLASS_SHIFT;

/// Alignment of every pooled region (one cache line; keeps SIMD copies aligned).
inline constexpr std::size_t   POOL_BUFFER_ALIGNMENT = 64;

// =====================
// Transfer strategy crossovers (bytes)
// Measured on x86-64 Linux against a loopback transport:
//  - at or below SMALL_MAX a transient view beats any pool round-trip;
//  - at or above LARGE_MIN the copy dominates the fixed handoff cost.
// Re-measure per target; these are not universal truths.
// =====================
inline constexpr std::size_t SEND_SMALL_MAX_BYTES = 512;
inline constexpr std::size_t SEND_LARGE_MIN_BYTES = 64 * 1024;
inline constexpr std::size_t RECV_SMALL_MAX_BYTES = 512;
inline constexpr std::size_t RECV_LARGE_MIN_BYTES = 64 * 1024;

// =====================
// I/O defaults
// =====================
inline constexpr std::size_t POLLER_DEFAULT_CAPACITY = 64;       ///< Registrations per multiplexer
inline constexpr std::size_t RECV_SCRATCH_BYTES      = 4096;     ///< Transient receive scratch (>= RECV_SMALL_MAX_BYTES)
inline constexpr std::size_t RECV_MAX_MESSAGE_BYTES  = 64u << 20; ///< Larger messages are discarded (MessageTooLarge)
inline constexpr std::size_t SENDER_QUEUE_DEPTH      = 1024;     ///< AsyncSender ring (power-of-two)

/// AsyncSender idle wait before re-checking its ring (milliseconds).
inline constexpr int         SENDER_IDLE_WAIT_MS     = 50;

} // namespace msgbuf::config::constants
