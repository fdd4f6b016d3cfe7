#pragma once
/**
 * @file rt.hpp
 * @brief Optional CPU pinning and real-time scheduling for msgbuf-owned threads.
 * @note Linux only (affinity + SCHED_FIFO/RR). Other platforms report failure.
 */

#include <cstdint>

namespace msgbuf::os {

    /// @brief Real-time scheduling policy.
    /// - Fifo: fixed-priority, run-to-block.
    /// - RoundRobin: fixed-priority, time-sliced among equal priorities.
    enum class RtSchedPolicy : std::uint8_t {
        Fifo = 0,
        RoundRobin = 1
    };

    const char* to_string(RtSchedPolicy p) noexcept;

    /// @brief RT configuration applied by a thread to itself.
    /// @var cpu -1 to skip pinning; otherwise CPU index to pin to.
    /// @var policy Desired RT policy.
    /// @var priority Linux SCHED_{FIFO,RR} range is [1..99].
    struct RtConfig {
        int cpu = -1;
        RtSchedPolicy policy = RtSchedPolicy::Fifo;
        int priority; // must be set by caller
    };

    /// @brief Mid-band priorities for msgbuf threads (headroom above and below).
    namespace prio {
        /// @brief AsyncSender I/O thread: drains handoffs and fires releases promptly.
        inline constexpr int kSender = 70;
    } // namespace prio

    /**
     * @brief Apply affinity (if cpu >= 0) then policy/priority to the calling thread.
     * @return true on success; false if unsupported or privileges are missing
     *         (the reason is logged at warn).
     */
    bool bind_and_prioritize(const RtConfig& cfg);

} // namespace msgbuf::os
