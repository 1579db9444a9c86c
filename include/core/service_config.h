#ifndef SIGN_CORE_SERVICE_CONFIG_H
#define SIGN_CORE_SERVICE_CONFIG_H

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/context_pool.h"
#include "core/dispatch_router.h"

namespace sign_core {

struct ServiceConfig {
    std::string host = "0.0.0.0";
    unsigned short port = 8045;

    std::string scriptPath;  // algorithm script loaded at startup
    std::string rulesPath;   // optional JSON rule file, overrides `rules`
    std::vector<DispatchRule> rules = DispatchRouter::defaultRules();
    std::vector<std::string> platforms = {"xhs", "dy", "bili", "wb", "ks"};

    PoolConfig pool;
    std::chrono::milliseconds invocationTimeout{1000};
    size_t scriptHistory = 4;

    std::string logLevel = "info";
    std::string logFile;
};

/**
 * @brief Overlays the keys present in `json` onto `config`.
 *
 * Recognized keys: host, port, script, rules (array or path), platforms,
 * pool_size, acquire_timeout_ms, invoke_timeout_ms, build_timeout_ms,
 * max_invocations, memory_limit_mb, script_history, log_level, log_file.
 * Returns false and fills `error` on a wrong type or out-of-range value.
 */
bool applyConfigJson(const nlohmann::json& json, ServiceConfig& config, std::string& error);

// Reads a JSON config file and applies it. Returns false with `error` set on failure.
bool loadConfigFile(const std::string& path, ServiceConfig& config, std::string& error);

// Loads config.rulesPath into config.rules when it is set.
bool loadRulesFile(ServiceConfig& config, std::string& error);

// Final range checks after file and command-line values are merged.
bool validateConfig(const ServiceConfig& config, std::string& error);

} // namespace sign_core

#endif // SIGN_CORE_SERVICE_CONFIG_H
