#include "core/signing_service.h"
#include "core/logger.h"

#include <algorithm>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace sign_core {

const char* const kServiceVersion = "1.0.0";

// Longest target URI accepted for signing.
const size_t kMaxTargetUriBytes = 8 * 1024;

static std::string formatTime(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm bt{};
    gmtime_r(&t, &bt);
    std::ostringstream oss;
    oss << std::put_time(&bt, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

SigningService::SigningService(const ServiceConfig& config)
    : config_(config), router_(config.rules), store_(nullptr, config.scriptHistory) {
    if (config_.scriptPath.empty()) {
        throw SignError(ErrorKind::SCRIPT_INVALID, "no algorithm script configured");
    }
    std::ifstream in(config_.scriptPath, std::ios::binary);
    if (!in) {
        throw SignError(ErrorKind::SCRIPT_INVALID, "cannot read script file: " + config_.scriptPath);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    init(buffer.str(), config_.scriptPath);
}

SigningService::SigningService(const ServiceConfig& config, const std::string& scriptSource)
    : config_(config), router_(config.rules), store_(nullptr, config.scriptHistory) {
    init(scriptSource, "inline");
}

SigningService::~SigningService() = default;

void SigningService::init(const std::string& source, const std::string& origin) {
    // A candidate script must build in a fresh sandbox and define every entry
    // point the current rules can dispatch to.
    store_.setValidator([this](const AlgorithmScript& candidate) {
        auto trial = SandboxContext::build(std::make_shared<AlgorithmScript>(candidate),
                                           router_.entryPoints(),
                                           config_.pool.buildTimeout,
                                           config_.pool.memoryLimitBytes,
                                           pool_ ? pool_->runaways() : nullptr);
        trial.reset();
    });

    ScriptPtr script = store_.load(source, origin);
    pool_ = std::make_unique<ContextPool>(config_.pool, script);

    LOG_INFO("SigningService", "Ready: script v" + std::to_string(script->version) +
             " (" + script->hash.substr(0, 12) + "), " + std::to_string(router_.rules().size()) +
             " rules, " + std::to_string(config_.platforms.size()) + " platforms");
}

void SigningService::validate(const SigningRequest& request) const {
    if (request.targetUri.empty()) {
        throw SignError(ErrorKind::INVALID_REQUEST, "target_uri is required");
    }
    if (request.targetUri.size() > kMaxTargetUriBytes) {
        throw SignError(ErrorKind::INVALID_REQUEST, "target_uri exceeds " + std::to_string(kMaxTargetUriBytes) + " bytes");
    }
    if (request.platform.empty()) {
        throw SignError(ErrorKind::INVALID_REQUEST, "platform is required");
    }
    if (std::find(config_.platforms.begin(), config_.platforms.end(), request.platform) == config_.platforms.end()) {
        throw SignError(ErrorKind::INVALID_REQUEST, "unknown platform '" + request.platform + "'");
    }
    if (!request.parameters.is_string() && !request.parameters.is_object()) {
        throw SignError(ErrorKind::INVALID_REQUEST, "parameters must be a string or an object");
    }
}

SigningResponse SigningService::sign(const SigningRequest& request, CancellationToken* cancel) {
    auto started = std::chrono::steady_clock::now();
    SigningResponse response;

    try {
        validate(request);
        response.entryPoint = router_.resolve(request);

        ContextLease lease = pool_->acquire(config_.pool.acquireTimeout, cancel);
        try {
            response.token = lease->invoke(response.entryPoint, request.parameters,
                                           request.clientUserAgent, config_.invocationTimeout);
            lease.release(ReleaseOutcome::HEALTHY);
        } catch (const SignError&) {
            // A context only stays in service if the failure left its heap intact.
            lease.release(lease->faulted() ? ReleaseOutcome::FAULTED : ReleaseOutcome::HEALTHY);
            throw;
        }
        response.success = true;
    } catch (const SignError& e) {
        response.errorKind = e.kind();
        response.message = e.what();
    } catch (const std::exception& e) {
        response.errorKind = ErrorKind::INTERNAL;
        response.message = e.what();
    }

    response.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (response.success) {
        LOG_DEBUG("SigningService", "Signed " + request.platform + " " + request.targetUri +
                  " via " + response.entryPoint + " -> " + response.token.substr(0, 10) + "... (" +
                  std::to_string(response.elapsed.count()) + "ms)");
    } else {
        LOG_WARN("SigningService", std::string(errorKindName(response.errorKind)) + " for " +
                 request.platform + " " + request.targetUri + ": " + response.message);
    }
    return response;
}

ScriptPtr SigningService::updateScript(const std::string& source, const std::string& origin) {
    std::lock_guard<std::mutex> lock(adminMutex_);
    ScriptPtr script = store_.load(source, origin);
    pool_->onScriptUpdated(script);
    return script;
}

ScriptPtr SigningService::rollbackScript() {
    std::lock_guard<std::mutex> lock(adminMutex_);
    ScriptPtr script = store_.rollback();
    pool_->onScriptUpdated(script);
    return script;
}

void SigningService::reloadRules(const std::vector<DispatchRule>& rules) {
    if (rules.empty()) {
        throw SignError(ErrorKind::INVALID_REQUEST, "rule set is empty");
    }
    router_.replaceRules(rules);
}

bool SigningService::isLive() const {
    return pool_->hasReadyContext();
}

nlohmann::json SigningService::status() const {
    nlohmann::json out;
    out["service"] = "sign-server";
    out["version"] = kServiceVersion;
    out["live"] = isLive();

    ScriptPtr script = store_.current();
    if (script) {
        nlohmann::json history = nlohmann::json::array();
        for (const auto& previous : store_.history()) {
            history.push_back({{"version", previous->version}, {"hash", previous->hash}});
        }
        out["script"] = {
            {"version", script->version},
            {"hash", script->hash},
            {"origin", script->origin},
            {"bytes", script->source.size()},
            {"loaded_at", formatTime(script->loadedAt)},
            {"history", history}
        };
    }

    PoolStats stats = pool_->stats();
    out["pool"] = {
        {"capacity", stats.capacity},
        {"idle", stats.idle},
        {"busy", stats.busy},
        {"building", stats.building},
        {"waiting", stats.waiting},
        {"built", stats.built},
        {"released", stats.released},
        {"retired", stats.retired},
        {"faulted", stats.faulted},
        {"rejected", stats.rejected},
        {"runaway", stats.runaway}
    };
    out["rules"] = DispatchRouter::rulesToJson(router_.rules());
    out["platforms"] = config_.platforms;
    return out;
}

} // namespace sign_core
