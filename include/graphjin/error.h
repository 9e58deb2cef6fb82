#pragma once
// ═══════════════════════════════════════════════════════════════════
//  graphjin/error.h — Error kinds shared by the driver and schema cores
// ═══════════════════════════════════════════════════════════════════

#include <stdexcept>
#include <string>

namespace graphjin {

enum class ErrorKind {
    MalformedInput,
    MissingOperation,
    UnsupportedOperation,
    MissingParameter,
    TypeMismatch,
    CursorInvalid,
    Cancelled,
    BackendError
};

inline const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedInput:       return "malformed-input";
        case ErrorKind::MissingOperation:     return "missing-operation";
        case ErrorKind::UnsupportedOperation: return "unsupported-operation";
        case ErrorKind::MissingParameter:     return "missing-parameter";
        case ErrorKind::TypeMismatch:         return "type-mismatch";
        case ErrorKind::CursorInvalid:        return "cursor-invalid";
        case ErrorKind::Cancelled:            return "cancelled";
        case ErrorKind::BackendError:         return "backend-error";
    }
    return "unknown";
}

// ── Exception carrying an ErrorKind ──
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(toString(kind)) + ": " + message),
          kind_(kind) {}

    // Wraps a backend failure, keeping the original message
    static Error backend(const std::string& op, const std::exception& cause) {
        return Error(ErrorKind::BackendError, op + ": " + cause.what());
    }

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace graphjin
