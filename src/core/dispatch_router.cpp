#include "core/dispatch_router.h"
#include "core/logger.h"

#include <algorithm>
#include <mutex>
#include <stdexcept>

namespace sign_core {

DispatchRouter::DispatchRouter(std::vector<DispatchRule> rules)
    : compiled_(compile(std::move(rules))) {}

std::vector<DispatchRule> DispatchRouter::defaultRules() {
    std::vector<DispatchRule> rules;

    DispatchRule reply;
    reply.platform = "dy";
    reply.pattern = "/reply";
    reply.entryPoint = "sign_reply";
    reply.priority = 10;
    rules.push_back(reply);

    DispatchRule detail;
    detail.platform = "dy";
    detail.pattern = ""; // empty substring matches every URI
    detail.entryPoint = "sign_detail";
    detail.priority = 0;
    rules.push_back(detail);

    return rules;
}

std::vector<DispatchRouter::CompiledRule> DispatchRouter::compile(std::vector<DispatchRule> rules) {
    std::vector<CompiledRule> compiled;
    compiled.reserve(rules.size());

    for (auto& rule : rules) {
        if (rule.entryPoint.empty()) {
            throw SignError(ErrorKind::INVALID_REQUEST,
                            "dispatch rule for pattern '" + rule.pattern + "' has no entry point");
        }
        CompiledRule entry;
        if (rule.match == MatchKind::REGEX) {
            try {
                entry.regex.emplace(rule.pattern, boost::regex::ECMAScript);
            } catch (const boost::regex_error& e) {
                throw SignError(ErrorKind::INVALID_REQUEST,
                                "invalid regex '" + rule.pattern + "': " + e.what());
            }
        }
        entry.rule = std::move(rule);
        compiled.push_back(std::move(entry));
    }

    // stable_sort keeps declaration order among equal priorities
    std::stable_sort(compiled.begin(), compiled.end(), [](const CompiledRule& a, const CompiledRule& b) {
        return a.rule.priority > b.rule.priority;
    });
    return compiled;
}

std::string DispatchRouter::resolve(const SigningRequest& request) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& entry : compiled_) {
        const DispatchRule& rule = entry.rule;
        if (!rule.platform.empty() && rule.platform != request.platform) {
            continue;
        }
        bool matched = false;
        if (entry.regex) {
            try {
                matched = boost::regex_search(request.targetUri, *entry.regex);
            } catch (const std::runtime_error& e) {
                // boost gives up on pathological inputs instead of exhausting the stack
                LOG_WARN("DispatchRouter", "Regex '" + rule.pattern + "' aborted on " +
                         std::to_string(request.targetUri.size()) + "-byte uri: " + e.what());
                throw SignError(ErrorKind::INVALID_REQUEST,
                                "target uri is too complex for rule '" + rule.pattern + "'");
            }
        } else {
            matched = request.targetUri.find(rule.pattern) != std::string::npos;
        }
        if (matched) {
            return rule.entryPoint;
        }
    }
    LOG_WARN("DispatchRouter", "No rule for platform=" + request.platform + " uri=" + request.targetUri);
    throw SignError(ErrorKind::NO_RULE_MATCHED,
                    "no dispatch rule matches " + request.platform + " " + request.targetUri);
}

void DispatchRouter::replaceRules(std::vector<DispatchRule> rules) {
    std::vector<CompiledRule> compiled = compile(std::move(rules));
    size_t count = compiled.size();
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        compiled_.swap(compiled);
    }
    LOG_INFO("DispatchRouter", "Loaded " + std::to_string(count) + " dispatch rules");
}

std::vector<DispatchRule> DispatchRouter::rules() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<DispatchRule> out;
    out.reserve(compiled_.size());
    for (const auto& entry : compiled_) {
        out.push_back(entry.rule);
    }
    return out;
}

std::vector<std::string> DispatchRouter::entryPoints() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& entry : compiled_) {
        if (std::find(names.begin(), names.end(), entry.rule.entryPoint) == names.end()) {
            names.push_back(entry.rule.entryPoint);
        }
    }
    return names;
}

std::vector<DispatchRule> DispatchRouter::parseRules(const nlohmann::json& json) {
    const nlohmann::json* list = &json;
    if (json.is_object() && json.contains("rules")) {
        list = &json["rules"];
    }
    if (!list->is_array()) {
        throw SignError(ErrorKind::INVALID_REQUEST, "dispatch rules must be a JSON array");
    }

    std::vector<DispatchRule> rules;
    for (const auto& item : *list) {
        if (!item.is_object()) {
            throw SignError(ErrorKind::INVALID_REQUEST, "dispatch rule must be an object");
        }
        DispatchRule rule;
        try {
            rule.platform = item.value("platform", "");
            rule.pattern = item.value("pattern", "");
            rule.entryPoint = item.value("entry_point", "");
            rule.priority = item.value("priority", 0);

            std::string match = item.value("match", "substring");
            if (match == "regex") {
                rule.match = MatchKind::REGEX;
            } else if (match == "substring") {
                rule.match = MatchKind::SUBSTRING;
            } else {
                throw SignError(ErrorKind::INVALID_REQUEST, "unknown match kind '" + match + "'");
            }
        } catch (const nlohmann::json::exception& e) {
            throw SignError(ErrorKind::INVALID_REQUEST, std::string("malformed dispatch rule: ") + e.what());
        }
        if (rule.entryPoint.empty()) {
            throw SignError(ErrorKind::INVALID_REQUEST, "dispatch rule needs an entry_point");
        }
        rules.push_back(rule);
    }
    return rules;
}

nlohmann::json DispatchRouter::rulesToJson(const std::vector<DispatchRule>& rules) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& rule : rules) {
        out.push_back({
            {"platform", rule.platform},
            {"pattern", rule.pattern},
            {"match", rule.match == MatchKind::REGEX ? "regex" : "substring"},
            {"entry_point", rule.entryPoint},
            {"priority", rule.priority}
        });
    }
    return out;
}

} // namespace sign_core
