#pragma once
#include <stdexcept>
#include <string>

namespace dts {

enum class ErrorKind {
    NOT_FOUND = 0,
    DUPLICATE_ID,
    UNKNOWN_CATEGORY,
    MALFORMED_INPUT,
    INVALID_PARAMETER,
};

const char* error_kind_str(ErrorKind kind);

// Hard failure surfaced by the core. what() reads "<KIND>: <message>".
class SimError : public std::runtime_error {
public:
    SimError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace dts
