#ifndef SIGN_CORE_SIGN_CLIENT_H
#define SIGN_CORE_SIGN_CLIENT_H

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "core/sign_types.h"

namespace sign_core {

struct ClientReply {
    long statusCode = 0;      // 0 when the request never reached the server
    std::string body;
    std::string transportError;

    bool reached() const { return transportError.empty() && statusCode != 0; }
    std::optional<nlohmann::json> json() const;
};

// Talks to a running sign-server over HTTP.
class SignClient {
public:
    explicit SignClient(std::string baseUrl,
                        std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    ClientReply sign(const SigningRequest& request);
    ClientReply pushScript(const std::string& source);
    ClientReply rollbackScript();
    ClientReply pushRules(const nlohmann::json& rules);
    ClientReply health();
    ClientReply status();

    // Body sent by sign(); exposed for callers that post it themselves.
    static nlohmann::json requestBody(const SigningRequest& request);

    const std::string& baseUrl() const { return baseUrl_; }

private:
    ClientReply get(const std::string& path);
    ClientReply post(const std::string& path, const std::string& body, const std::string& contentType);

    std::string baseUrl_;
    std::chrono::milliseconds timeout_;
};

} // namespace sign_core

#endif // SIGN_CORE_SIGN_CLIENT_H
