#ifndef SIGN_CORE_SIGN_TYPES_H
#define SIGN_CORE_SIGN_TYPES_H

#include <chrono>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "core/sign_error.h"

namespace sign_core {

// One published version of the vendor signing script. Never mutated after load.
struct AlgorithmScript {
    std::string source;
    std::string hash;    // SHA-256 of source, lowercase hex
    std::string origin;  // file path, "admin" or "rollback"
    uint64_t version = 0;
    std::chrono::system_clock::time_point loadedAt;
};

enum class MatchKind {
    SUBSTRING,
    REGEX
};

struct DispatchRule {
    std::string platform; // empty matches every platform
    std::string pattern;
    MatchKind match = MatchKind::SUBSTRING;
    std::string entryPoint;
    int priority = 0;
};

struct SigningRequest {
    std::string targetUri;
    std::string platform;
    nlohmann::json parameters; // query string or an object of request params
    std::string clientUserAgent;
};

struct SigningResponse {
    bool success = false;
    std::string token;
    std::string entryPoint;
    std::chrono::milliseconds elapsed{0};

    ErrorKind errorKind = ErrorKind::NONE;
    std::string message;
};

enum class ContextState {
    BUILDING,
    READY,
    BUSY,
    FAULTED,
    RETIRED
};

const char* contextStateName(ContextState state);

} // namespace sign_core

#endif // SIGN_CORE_SIGN_TYPES_H
