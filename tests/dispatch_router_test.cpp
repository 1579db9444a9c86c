#include <gtest/gtest.h>

#include "core/dispatch_router.h"

using namespace sign_core;

namespace {

SigningRequest request(const std::string& platform, const std::string& uri) {
    SigningRequest r;
    r.platform = platform;
    r.targetUri = uri;
    r.parameters = "a=1";
    return r;
}

DispatchRule rule(const std::string& platform, const std::string& pattern, const std::string& entry,
                  int priority, MatchKind match = MatchKind::SUBSTRING) {
    DispatchRule r;
    r.platform = platform;
    r.pattern = pattern;
    r.entryPoint = entry;
    r.priority = priority;
    r.match = match;
    return r;
}

} // namespace

TEST(DispatchRouterTest, DefaultRulesSendRepliesToSignReply) {
    DispatchRouter router;
    EXPECT_EQ(router.resolve(request("dy", "https://www.douyin.com/aweme/v1/web/comment/list/reply/")), "sign_reply");
    EXPECT_EQ(router.resolve(request("dy", "https://www.douyin.com/aweme/v1/web/aweme/detail/")), "sign_detail");
}

TEST(DispatchRouterTest, HigherPriorityWinsRegardlessOfOrder) {
    DispatchRouter router({
        rule("", "/api/", "generic", 1),
        rule("", "/api/feed", "feed", 5),
    });
    EXPECT_EQ(router.resolve(request("xhs", "https://edith.xiaohongshu.com/api/feed")), "feed");
    EXPECT_EQ(router.resolve(request("xhs", "https://edith.xiaohongshu.com/api/note")), "generic");
}

TEST(DispatchRouterTest, EqualPriorityKeepsDeclarationOrder) {
    DispatchRouter router({
        rule("", "/x", "first", 3),
        rule("", "/x", "second", 3),
    });
    EXPECT_EQ(router.resolve(request("wb", "/x/y")), "first");
}

TEST(DispatchRouterTest, PlatformScopedRulesAreSkippedForOtherPlatforms) {
    DispatchRouter router({
        rule("bili", "", "bili_sign", 10),
        rule("", "", "fallback", 0),
    });
    EXPECT_EQ(router.resolve(request("bili", "/x/space/wbi/arc/search")), "bili_sign");
    EXPECT_EQ(router.resolve(request("ks", "/rest/v/profile")), "fallback");
}

TEST(DispatchRouterTest, RegexRulesUseSearchSemantics) {
    DispatchRouter router({
        rule("", "comment/(list|reply)", "sign_comment", 1, MatchKind::REGEX),
        rule("", "/never-matches", "other", 0),
    });
    EXPECT_EQ(router.resolve(request("dy", "/aweme/v1/web/comment/list/?cursor=0")), "sign_comment");
    EXPECT_THROW(router.resolve(request("dy", "/aweme/v1/web/aweme/post/")), SignError);
}

TEST(DispatchRouterTest, RegexRulesHandleMegabyteUris) {
    DispatchRouter router({
        rule("dy", "/comment/.*/reply", "sign_reply", 10, MatchKind::REGEX),
        rule("dy", "^/aweme/.*$", "sign_detail", 5, MatchKind::REGEX),
    });
    const std::string filler(1024 * 1024, 'a');

    EXPECT_EQ(router.resolve(request("dy", "/comment/" + filler + "/reply/")), "sign_reply");
    EXPECT_EQ(router.resolve(request("dy", "/aweme/" + filler)), "sign_detail");

    // No rule matches; the only acceptable outcomes are typed errors.
    try {
        router.resolve(request("dy", "/comment/" + filler));
        FAIL() << "expected SignError";
    } catch (const SignError& e) {
        EXPECT_TRUE(e.kind() == ErrorKind::NO_RULE_MATCHED || e.kind() == ErrorKind::INVALID_REQUEST)
            << errorKindName(e.kind());
    }
}

TEST(DispatchRouterTest, NoMatchIsNoRuleMatched) {
    DispatchRouter router;
    try {
        router.resolve(request("xhs", "/api/sns/web/v1/feed"));
        FAIL() << "expected SignError";
    } catch (const SignError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NO_RULE_MATCHED);
    }
}

TEST(DispatchRouterTest, InvalidRuleSetLeavesOldRulesInPlace) {
    DispatchRouter router;
    EXPECT_THROW(router.replaceRules({rule("", "([", "broken", 1, MatchKind::REGEX)}), SignError);
    EXPECT_THROW(router.replaceRules({rule("", "/a", "", 1)}), SignError);

    EXPECT_EQ(router.rules().size(), 2u);
    EXPECT_EQ(router.resolve(request("dy", "/reply")), "sign_reply");
}

TEST(DispatchRouterTest, ReplaceRulesTakesEffect) {
    DispatchRouter router;
    router.replaceRules({rule("xhs", "", "sign_xhs", 0)});
    EXPECT_EQ(router.resolve(request("xhs", "/api/sns/web/v1/feed")), "sign_xhs");
    EXPECT_THROW(router.resolve(request("dy", "/reply")), SignError);
}

TEST(DispatchRouterTest, EntryPointsAreDistinct) {
    DispatchRouter router({
        rule("dy", "/reply", "sign_reply", 10),
        rule("dy", "", "sign_detail", 0),
        rule("ks", "", "sign_detail", 0),
    });
    std::vector<std::string> expected = {"sign_reply", "sign_detail"};
    EXPECT_EQ(router.entryPoints(), expected);
}

TEST(DispatchRouterTest, ParseRulesAcceptsArrayAndWrappedForm) {
    auto json = nlohmann::json::parse(R"([
        {"platform": "dy", "pattern": "/reply", "entry_point": "sign_reply", "priority": 10},
        {"pattern": "^/api/", "match": "regex", "entry_point": "sign_api"}
    ])");
    auto rules = DispatchRouter::parseRules(json);
    ASSERT_EQ(rules.size(), 2u);
    EXPECT_EQ(rules[0].platform, "dy");
    EXPECT_EQ(rules[0].priority, 10);
    EXPECT_EQ(rules[1].match, MatchKind::REGEX);
    EXPECT_EQ(rules[1].priority, 0);

    auto wrapped = DispatchRouter::parseRules(nlohmann::json{{"rules", json}});
    EXPECT_EQ(wrapped.size(), 2u);

    EXPECT_EQ(DispatchRouter::rulesToJson(rules)[1]["match"], "regex");
}

TEST(DispatchRouterTest, ParseRulesRejectsMalformedInput) {
    EXPECT_THROW(DispatchRouter::parseRules(nlohmann::json::parse(R"({"pattern": "/x"})")), SignError);
    EXPECT_THROW(DispatchRouter::parseRules(nlohmann::json::parse(R"([1, 2])")), SignError);
    EXPECT_THROW(DispatchRouter::parseRules(nlohmann::json::parse(R"([{"match": "glob", "entry_point": "a"}])")), SignError);
    EXPECT_THROW(DispatchRouter::parseRules(nlohmann::json::parse(R"([{"priority": "high", "entry_point": "a"}])")), SignError);
}
