#include "core/service_config.h"
#include "core/logger.h"

#include <fstream>

namespace sign_core {

// Helper to read a positive integer key; leaves `out` untouched when the key is absent.
template <typename T>
static bool readPositive(const nlohmann::json& json, const char* key, T& out, std::string& error) {
    if (!json.contains(key)) {
        return true;
    }
    const auto& value = json[key];
    if (!value.is_number_integer() || value.get<long long>() <= 0) {
        error = std::string("'") + key + "' must be a positive integer";
        return false;
    }
    out = static_cast<T>(value.get<long long>());
    return true;
}

static bool readMillis(const nlohmann::json& json, const char* key, std::chrono::milliseconds& out, std::string& error) {
    long long ms = out.count();
    if (!readPositive(json, key, ms, error)) {
        return false;
    }
    out = std::chrono::milliseconds(ms);
    return true;
}

static bool readString(const nlohmann::json& json, const char* key, std::string& out, std::string& error) {
    if (!json.contains(key)) {
        return true;
    }
    if (!json[key].is_string()) {
        error = std::string("'") + key + "' must be a string";
        return false;
    }
    out = json[key].get<std::string>();
    return true;
}

bool applyConfigJson(const nlohmann::json& json, ServiceConfig& config, std::string& error) {
    if (!json.is_object()) {
        error = "config root must be a JSON object";
        return false;
    }

    if (!readString(json, "host", config.host, error)) return false;
    if (json.contains("port")) {
        const auto& port = json["port"];
        if (!port.is_number_integer() || port.get<long long>() < 1 || port.get<long long>() > 65535) {
            error = "'port' must be an integer between 1 and 65535";
            return false;
        }
        config.port = static_cast<unsigned short>(port.get<long long>());
    }
    if (!readString(json, "script", config.scriptPath, error)) return false;

    if (json.contains("rules")) {
        if (json["rules"].is_string()) {
            config.rulesPath = json["rules"].get<std::string>();
        } else {
            try {
                config.rules = DispatchRouter::parseRules(json["rules"]);
            } catch (const SignError& e) {
                error = e.what();
                return false;
            }
        }
    }

    if (json.contains("platforms")) {
        const auto& platforms = json["platforms"];
        if (!platforms.is_array()) {
            error = "'platforms' must be an array of strings";
            return false;
        }
        std::vector<std::string> parsed;
        for (const auto& item : platforms) {
            if (!item.is_string() || item.get<std::string>().empty()) {
                error = "'platforms' must be an array of non-empty strings";
                return false;
            }
            parsed.push_back(item.get<std::string>());
        }
        config.platforms = parsed;
    }

    if (!readPositive(json, "pool_size", config.pool.size, error)) return false;
    if (!readMillis(json, "acquire_timeout_ms", config.pool.acquireTimeout, error)) return false;
    if (!readMillis(json, "invoke_timeout_ms", config.invocationTimeout, error)) return false;
    if (!readMillis(json, "build_timeout_ms", config.pool.buildTimeout, error)) return false;
    if (!readPositive(json, "max_invocations", config.pool.maxInvocationsPerContext, error)) return false;
    if (!readPositive(json, "script_history", config.scriptHistory, error)) return false;
    if (json.contains("memory_limit_mb")) {
        const auto& limit = json["memory_limit_mb"];
        if (!limit.is_number_integer() || limit.get<long long>() < 0) {
            error = "'memory_limit_mb' must be a non-negative integer (0 disables the cap)";
            return false;
        }
        config.pool.memoryLimitBytes = static_cast<size_t>(limit.get<long long>()) * 1024 * 1024;
    }
    if (!readString(json, "log_level", config.logLevel, error)) return false;
    if (!readString(json, "log_file", config.logFile, error)) return false;

    return true;
}

bool loadConfigFile(const std::string& path, ServiceConfig& config, std::string& error) {
    std::ifstream in(path);
    if (!in) {
        error = "cannot open config file: " + path;
        return false;
    }
    nlohmann::json json;
    try {
        in >> json;
    } catch (const nlohmann::json::parse_error& e) {
        error = "config file " + path + " is not valid JSON: " + e.what();
        return false;
    }
    if (!applyConfigJson(json, config, error)) {
        error = path + ": " + error;
        return false;
    }
    return true;
}

bool loadRulesFile(ServiceConfig& config, std::string& error) {
    if (config.rulesPath.empty()) {
        return true;
    }
    std::ifstream in(config.rulesPath);
    if (!in) {
        error = "cannot open rules file: " + config.rulesPath;
        return false;
    }
    try {
        nlohmann::json json;
        in >> json;
        config.rules = DispatchRouter::parseRules(json);
    } catch (const nlohmann::json::parse_error& e) {
        error = "rules file " + config.rulesPath + " is not valid JSON: " + e.what();
        return false;
    } catch (const SignError& e) {
        error = config.rulesPath + ": " + e.what();
        return false;
    }
    return true;
}

bool validateConfig(const ServiceConfig& config, std::string& error) {
    LogLevel level;
    if (!Logger::parseLevel(config.logLevel, level)) {
        error = "unknown log level '" + config.logLevel + "' (use debug, info, warn or error)";
        return false;
    }
    if (config.pool.size == 0) {
        error = "pool size must be at least 1";
        return false;
    }
    if (config.pool.acquireTimeout.count() <= 0 || config.invocationTimeout.count() <= 0 ||
        config.pool.buildTimeout.count() <= 0) {
        error = "timeouts must be positive";
        return false;
    }
    if (config.platforms.empty()) {
        error = "at least one platform must be configured";
        return false;
    }
    if (config.rules.empty()) {
        error = "at least one dispatch rule must be configured";
        return false;
    }
    try {
        DispatchRouter trial(config.rules);
    } catch (const SignError& e) {
        error = e.what();
        return false;
    }
    return true;
}

} // namespace sign_core
