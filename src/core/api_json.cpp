#include "core/api_json.h"

namespace sign_core {

// Returns the first key of the pair that is present, or nullptr.
static const nlohmann::json* findField(const nlohmann::json& body, const char* key, const char* legacyKey) {
    if (body.contains(key)) return &body[key];
    if (body.contains(legacyKey)) return &body[legacyKey];
    return nullptr;
}

static std::string stringField(const nlohmann::json& body, const char* key, const char* legacyKey) {
    const nlohmann::json* value = findField(body, key, legacyKey);
    if (!value || value->is_null()) {
        return "";
    }
    if (!value->is_string()) {
        throw SignError(ErrorKind::INVALID_REQUEST, std::string("'") + key + "' must be a string");
    }
    return value->get<std::string>();
}

SigningRequest requestFromJson(const nlohmann::json& body, const std::string& pathPlatform) {
    if (!body.is_object()) {
        throw SignError(ErrorKind::INVALID_REQUEST, "request body must be a JSON object");
    }

    SigningRequest request;
    request.targetUri = stringField(body, "target_uri", "uri");
    request.platform = pathPlatform.empty() ? stringField(body, "platform", "platform") : pathPlatform;
    request.clientUserAgent = stringField(body, "client_user_agent", "user_agent");

    const nlohmann::json* parameters = findField(body, "parameters", "params");
    if (parameters) {
        request.parameters = *parameters;
    }
    return request;
}

void to_json(nlohmann::json& j, const SigningResponse& response) {
    if (response.success) {
        j = nlohmann::json{
            {"success", true},
            {"token", response.token},
            {"entry_point", response.entryPoint},
            {"elapsed_ms", response.elapsed.count()}
        };
    } else {
        j = errorJson(response.errorKind, response.message);
    }
}

nlohmann::json errorJson(ErrorKind kind, const std::string& message) {
    return nlohmann::json{
        {"success", false},
        {"error_kind", errorKindName(kind)},
        {"message", message},
        {"retryable", isRetryable(kind)}
    };
}

int httpStatusFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return 200;
        case ErrorKind::INVALID_REQUEST: return 400;
        case ErrorKind::NO_RULE_MATCHED:
        case ErrorKind::SCRIPT_INVALID:
        case ErrorKind::SANDBOX_BUILD_ERROR:
        case ErrorKind::ENTRY_POINT_NOT_FOUND: return 422;
        case ErrorKind::SERVICE_UNAVAILABLE: return 503;
        case ErrorKind::INVOCATION_TIMEOUT:
        case ErrorKind::SCRIPT_RUNTIME_ERROR:
        case ErrorKind::INTERNAL: return 500;
    }
    return 500;
}

} // namespace sign_core
