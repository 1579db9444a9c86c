#ifndef SIGN_CORE_SIGN_ERROR_H
#define SIGN_CORE_SIGN_ERROR_H

#include <stdexcept>
#include <string>

namespace sign_core {

enum class ErrorKind {
    NONE,
    INVALID_REQUEST,       // caller error, never retried
    NO_RULE_MATCHED,       // configuration gap
    SERVICE_UNAVAILABLE,   // pool exhausted or caller cancelled the wait
    SANDBOX_BUILD_ERROR,
    SCRIPT_INVALID,
    INVOCATION_TIMEOUT,
    SCRIPT_RUNTIME_ERROR,
    ENTRY_POINT_NOT_FOUND,
    INTERNAL
};

// Wire name of an error kind, e.g. "NoRuleMatched".
const char* errorKindName(ErrorKind kind);

// True for failures where retrying against a fresh context is reasonable.
bool isRetryable(ErrorKind kind);

class SignError : public std::runtime_error {
public:
    SignError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace sign_core

#endif // SIGN_CORE_SIGN_ERROR_H
