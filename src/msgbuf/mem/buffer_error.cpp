#include "msgbuf/mem/buffer_error.hpp"

namespace msgbuf::mem {

const char* to_string(BufferError e) noexcept {
  switch (e) {
    case BufferError::InvalidSize:       return "invalid_size";
    case BufferError::AllocationFailure: return "allocation_failure";
    case BufferError::UseAfterRelease:   return "use_after_release";
    case BufferError::DoubleRelease:     return "double_release";
    case BufferError::UnknownSizeClass:  return "unknown_size_class";
  }
  return "unknown";
}

} // namespace msgbuf::mem
