/**
 * @file transfer_strategy.cpp
 * @brief Labels for strategy tags (logging only; selection is constexpr in the header).
 */
#include "msgbuf/transfer/transfer_strategy.hpp"

namespace msgbuf::transfer {

const char* to_string(Strategy s) noexcept {
    switch (s) {
        case Strategy::Transient: return "transient";
        case Strategy::PoolCopy:  return "pool_copy";
        case Strategy::ZeroCopy:  return "zero_copy";
    }
    return "unknown";
}

const char* to_string(OperationKind k) noexcept {
    switch (k) {
        case OperationKind::Send:    return "send";
        case OperationKind::Receive: return "receive";
    }
    return "unknown";
}

} // namespace msgbuf::transfer
