#pragma once
// Kernel errors: typed failures of the dispatch contract
//
// Misuse of the syscall table (unknown primitive, double registration,
// disabled, saturated, timed out, handler threw) is raised as a KernelError.
// Lookups inside the memory and reasoning engines never throw; they
// return false or an empty optional instead.

#include <stdexcept>
#include <string>

namespace cortex {

enum class ErrorCode {
    NotRegistered,
    DuplicateRegistration,
    Disabled,
    ConcurrencyLimitExceeded,
    Timeout,
    HandlerError,
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::NotRegistered: return "NotRegistered";
        case ErrorCode::DuplicateRegistration: return "DuplicateRegistration";
        case ErrorCode::Disabled: return "Disabled";
        case ErrorCode::ConcurrencyLimitExceeded: return "ConcurrencyLimitExceeded";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::HandlerError: return "HandlerError";
    }
    return "Unknown";
}

class KernelError : public std::runtime_error {
public:
    KernelError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }
    const char* code_name() const { return error_code_name(code_); }

private:
    ErrorCode code_;
};

} // namespace cortex
