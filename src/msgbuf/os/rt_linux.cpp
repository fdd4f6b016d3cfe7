#include "msgbuf/os/rt.hpp"

#if defined(__linux__)
#include <pthread.h>
#include <sched.h>
#include <cstring>
#endif

#include "msgbuf/obs/observability.hpp"

namespace msgbuf::os {

const char* to_string(RtSchedPolicy p) noexcept {
    return p == RtSchedPolicy::RoundRobin ? "rr" : "fifo";
}

#if defined(__linux__)

static bool set_affinity(int cpu) {
    if (cpu < 0) return true; // nothing to do
    cpu_set_t mask; CPU_ZERO(&mask); CPU_SET(cpu, &mask);
    const int rc = pthread_setaffinity_np(pthread_self(), sizeof(mask), &mask);
    if (rc != 0) {
        obs::logger()->warn("rt: pinning to cpu {} failed: {}", cpu, std::strerror(rc));
        return false;
    }
    return true;
}

static bool set_sched(RtSchedPolicy pol, int prio) {
    const int policy = (pol == RtSchedPolicy::RoundRobin) ? SCHED_RR : SCHED_FIFO;
    sched_param sp{}; sp.sched_priority = prio;
    const int rc = pthread_setschedparam(pthread_self(), policy, &sp);
    if (rc != 0) {
        obs::logger()->warn("rt: {} priority {} refused: {}", to_string(pol), prio, std::strerror(rc));
        return false;
    }
    return true;
}

bool bind_and_prioritize(const RtConfig& cfg) {
    // Pin first so the thread does not migrate after becoming RT.
    if (!set_affinity(cfg.cpu)) return false;
    if (!set_sched(cfg.policy, cfg.priority)) return false;
    obs::logger()->debug("rt: cpu={} policy={} priority={}", cfg.cpu, to_string(cfg.policy), cfg.priority);
    return true;
}

#else

bool bind_and_prioritize(const RtConfig&) {
    obs::logger()->warn("rt: real-time scheduling not supported on this platform");
    return false;
}

#endif

} // namespace msgbuf::os
