#include "core/sign_error.h"

namespace sign_core {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "None";
        case ErrorKind::INVALID_REQUEST: return "InvalidRequest";
        case ErrorKind::NO_RULE_MATCHED: return "NoRuleMatched";
        case ErrorKind::SERVICE_UNAVAILABLE: return "ServiceUnavailable";
        case ErrorKind::SANDBOX_BUILD_ERROR: return "SandboxBuildError";
        case ErrorKind::SCRIPT_INVALID: return "ScriptInvalid";
        case ErrorKind::INVOCATION_TIMEOUT: return "InvocationTimeout";
        case ErrorKind::SCRIPT_RUNTIME_ERROR: return "ScriptRuntimeError";
        case ErrorKind::ENTRY_POINT_NOT_FOUND: return "EntryPointNotFound";
        case ErrorKind::INTERNAL: return "Internal";
    }
    return "Internal";
}

bool isRetryable(ErrorKind kind) {
    return kind == ErrorKind::SERVICE_UNAVAILABLE ||
           kind == ErrorKind::INVOCATION_TIMEOUT ||
           kind == ErrorKind::SCRIPT_RUNTIME_ERROR;
}

} // namespace sign_core
