#ifndef SIGN_CORE_DISPATCH_ROUTER_H
#define SIGN_CORE_DISPATCH_ROUTER_H

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include <boost/regex.hpp>
#include <nlohmann/json.hpp>

#include "core/sign_types.h"

namespace sign_core {

// Maps a SigningRequest to the entry point that signs it. Rules are plain
// configuration and can be swapped at runtime without touching the sandbox.
class DispatchRouter {
public:
    explicit DispatchRouter(std::vector<DispatchRule> rules = defaultRules());

    /**
     * @brief Returns the entry point of the first matching rule.
     *
     * Rules are tried by descending priority, ties in declaration order, and
     * rules scoped to another platform are skipped. Throws
     * SignError(NO_RULE_MATCHED) when nothing matches and
     * SignError(INVALID_REQUEST) when a regex rule gives up on the URI.
     */
    std::string resolve(const SigningRequest& request) const;

    // Swaps the whole rule set. An invalid rule rejects the set with
    // SignError(INVALID_REQUEST) and the old rules stay in place.
    void replaceRules(std::vector<DispatchRule> rules);

    std::vector<DispatchRule> rules() const;

    // Distinct entry point names referenced by the rules, in rule order.
    std::vector<std::string> entryPoints() const;

    static std::vector<DispatchRule> defaultRules();

    // [{"platform": "dy", "pattern": "/reply", "match": "substring", "entry_point": "sign_reply", "priority": 10}]
    static std::vector<DispatchRule> parseRules(const nlohmann::json& json);
    static nlohmann::json rulesToJson(const std::vector<DispatchRule>& rules);

private:
    struct CompiledRule {
        DispatchRule rule;
        std::optional<boost::regex> regex;
    };

    static std::vector<CompiledRule> compile(std::vector<DispatchRule> rules);

    mutable std::shared_mutex mutex_;
    std::vector<CompiledRule> compiled_; // already in evaluation order
};

} // namespace sign_core

#endif // SIGN_CORE_DISPATCH_ROUTER_H
