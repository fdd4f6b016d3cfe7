#include "msgbuf/io/io_error.hpp"

namespace msgbuf::io {

const char* to_string(IoError e) noexcept {
    switch (e) {
        case IoError::InvalidCapacity:  return "invalid_capacity";
        case IoError::CapacityExceeded: return "capacity_exceeded";
        case IoError::InvalidRef:       return "invalid_ref";
        case IoError::InvalidEndpoint:  return "invalid_endpoint";
        case IoError::SystemError:      return "system_error";
    }
    return "unknown";
}

} // namespace msgbuf::io
