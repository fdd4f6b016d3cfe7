/**
 * @file spsc_queue.cpp
 * @brief SpscError labels and explicit instantiations for the ring element types we ship.
*/

#include "msgbuf/mem/spsc_queue.hpp"
#include "msgbuf/mem/message_handle.hpp"

namespace msgbuf::mem {

    const char* to_string(SpscError e) noexcept {
        switch (e) {
            case SpscError::CapacityTooSmall:      return "capacity_too_small";
            case SpscError::CapacityNotPowerOfTwo: return "capacity_not_power_of_two";
            case SpscError::AllocationFailed:      return "allocation_failed";
        }
        return "unknown";
    }

    template class SpscQueue<std::uint32_t>;  // unit tests
    template class SpscQueue<MessageHandle>;  // AsyncSender handoff ring
} // namespace msgbuf::mem
