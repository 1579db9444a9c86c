#include "core/sign_client.h"
#include "core/logger.h"

#include <cpr/cpr.h>

namespace sign_core {

std::optional<nlohmann::json> ClientReply::json() const {
    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error&) {
        return std::nullopt;
    }
}

static ClientReply toReply(const cpr::Response& r) {
    ClientReply reply;
    if (r.error.code != cpr::ErrorCode::OK) {
        reply.transportError = r.error.message.empty() ? "request failed" : r.error.message;
        return reply;
    }
    reply.statusCode = r.status_code;
    reply.body = r.text;
    return reply;
}

SignClient::SignClient(std::string baseUrl, std::chrono::milliseconds timeout)
    : baseUrl_(std::move(baseUrl)), timeout_(timeout) {
    while (!baseUrl_.empty() && baseUrl_.back() == '/') {
        baseUrl_.pop_back();
    }
}

nlohmann::json SignClient::requestBody(const SigningRequest& request) {
    return nlohmann::json{
        {"target_uri", request.targetUri},
        {"platform", request.platform},
        {"parameters", request.parameters},
        {"client_user_agent", request.clientUserAgent}
    };
}

ClientReply SignClient::sign(const SigningRequest& request) {
    return post("/sign", requestBody(request).dump(), "application/json");
}

ClientReply SignClient::pushScript(const std::string& source) {
    return post("/admin/script", source, "application/javascript");
}

ClientReply SignClient::rollbackScript() {
    return post("/admin/script/rollback", "", "text/plain");
}

ClientReply SignClient::pushRules(const nlohmann::json& rules) {
    return post("/admin/rules", rules.dump(), "application/json");
}

ClientReply SignClient::health() {
    return get("/health");
}

ClientReply SignClient::status() {
    return get("/sign/status");
}

ClientReply SignClient::get(const std::string& path) {
    LOG_DEBUG("SignClient", "GET " + baseUrl_ + path);
    cpr::Response r = cpr::Get(cpr::Url{baseUrl_ + path},
                               cpr::Timeout{timeout_});
    return toReply(r);
}

ClientReply SignClient::post(const std::string& path, const std::string& body, const std::string& contentType) {
    LOG_DEBUG("SignClient", "POST " + baseUrl_ + path + " (" + std::to_string(body.size()) + " bytes)");
    cpr::Response r = cpr::Post(cpr::Url{baseUrl_ + path},
                                cpr::Header{{"Content-Type", contentType}},
                                cpr::Body{body},
                                cpr::Timeout{timeout_});
    return toReply(r);
}

} // namespace sign_core
