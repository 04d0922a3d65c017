#include "common/errors.h"

namespace dts {

const char* error_kind_str(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NOT_FOUND:         return "NOT_FOUND";
        case ErrorKind::DUPLICATE_ID:      return "DUPLICATE_ID";
        case ErrorKind::UNKNOWN_CATEGORY:  return "UNKNOWN_CATEGORY";
        case ErrorKind::MALFORMED_INPUT:   return "MALFORMED_INPUT";
        case ErrorKind::INVALID_PARAMETER: return "INVALID_PARAMETER";
    }
    return "UNKNOWN";
}

SimError::SimError(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(error_kind_str(kind)) + ": " + message),
      kind_(kind) {}

} // namespace dts
