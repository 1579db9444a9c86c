#ifndef SIGN_CORE_SIGNING_SERVICE_H
#define SIGN_CORE_SIGNING_SERVICE_H

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/context_pool.h"
#include "core/dispatch_router.h"
#include "core/script_store.h"
#include "core/service_config.h"
#include "core/sign_types.h"

namespace sign_core {

extern const char* const kServiceVersion;
extern const size_t kMaxTargetUriBytes;

/**
 * The boundary of the signing service: validates a request, picks the entry
 * point, checks out a sandbox context, runs the script and packages the
 * outcome. sign() never throws; every failure comes back as a typed
 * SigningResponse.
 */
class SigningService {
public:
    // Loads config.scriptPath. Throws SignError(SCRIPT_INVALID) if it cannot be loaded.
    explicit SigningService(const ServiceConfig& config);

    // Uses the given script source instead of config.scriptPath.
    SigningService(const ServiceConfig& config, const std::string& scriptSource);

    ~SigningService();

    SigningResponse sign(const SigningRequest& request, CancellationToken* cancel = nullptr);

    // Admin operations. Throw SignError(SCRIPT_INVALID) and keep the old script on failure.
    ScriptPtr updateScript(const std::string& source, const std::string& origin = "admin");
    ScriptPtr rollbackScript();

    // Throws SignError(INVALID_REQUEST) on a bad rule set; the old rules stay.
    void reloadRules(const std::vector<DispatchRule>& rules);

    // True while at least one context is ready to serve.
    bool isLive() const;

    nlohmann::json status() const;

    const ServiceConfig& config() const { return config_; }
    ScriptStore& store() { return store_; }
    DispatchRouter& router() { return router_; }
    ContextPool& pool() { return *pool_; }

private:
    void init(const std::string& source, const std::string& origin);
    void validate(const SigningRequest& request) const;

    ServiceConfig config_;
    DispatchRouter router_;
    ScriptStore store_;
    std::unique_ptr<ContextPool> pool_;
    std::mutex adminMutex_; // keeps store and pool updates in the same order
};

} // namespace sign_core

#endif // SIGN_CORE_SIGNING_SERVICE_H
