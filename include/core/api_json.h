#ifndef SIGN_CORE_API_JSON_H
#define SIGN_CORE_API_JSON_H

#include <string>

#include <nlohmann/json.hpp>

#include "core/sign_types.h"

namespace sign_core {

/**
 * @brief Decodes a signing request body.
 *
 * Accepts both the current field names (target_uri, platform, parameters,
 * client_user_agent) and the legacy ones (uri, params, user_agent). A
 * non-empty pathPlatform, taken from POST /sign/{platform}, wins over the
 * body. Throws SignError(INVALID_REQUEST) when the body is not an object or a
 * field has the wrong type; presence checks are left to SigningService.
 */
SigningRequest requestFromJson(const nlohmann::json& body, const std::string& pathPlatform = "");

// {"success": true, "token", "entry_point", "elapsed_ms"} or
// {"success": false, "error_kind", "message", "retryable"}
void to_json(nlohmann::json& j, const SigningResponse& response);

nlohmann::json errorJson(ErrorKind kind, const std::string& message);

// HTTP status used for each error kind; 200 for NONE.
int httpStatusFor(ErrorKind kind);

} // namespace sign_core

#endif // SIGN_CORE_API_JSON_H
