#include <gtest/gtest.h>

#include "core/api_json.h"

using namespace sign_core;

TEST(ApiJsonTest, DecodesCurrentFieldNames) {
    auto body = nlohmann::json::parse(R"({
        "target_uri": "https://www.douyin.com/aweme/v1/web/aweme/detail/",
        "platform": "dy",
        "parameters": {"aweme_id": "7"},
        "client_user_agent": "UA"
    })");
    SigningRequest request = requestFromJson(body);
    EXPECT_EQ(request.targetUri, "https://www.douyin.com/aweme/v1/web/aweme/detail/");
    EXPECT_EQ(request.platform, "dy");
    EXPECT_EQ(request.parameters["aweme_id"], "7");
    EXPECT_EQ(request.clientUserAgent, "UA");
}

TEST(ApiJsonTest, DecodesLegacyFieldNamesWithPathPlatform) {
    auto body = nlohmann::json::parse(R"({"uri": "/x/space/wbi/arc/search", "params": "mid=1", "user_agent": "UA", "platform": "dy"})");
    SigningRequest request = requestFromJson(body, "bili");
    EXPECT_EQ(request.targetUri, "/x/space/wbi/arc/search");
    EXPECT_EQ(request.platform, "bili");
    EXPECT_EQ(request.parameters, "mid=1");
    EXPECT_EQ(request.clientUserAgent, "UA");
}

TEST(ApiJsonTest, MissingFieldsDecodeEmpty) {
    SigningRequest request = requestFromJson(nlohmann::json::object());
    EXPECT_TRUE(request.targetUri.empty());
    EXPECT_TRUE(request.platform.empty());
    EXPECT_TRUE(request.parameters.is_null());
}

TEST(ApiJsonTest, RejectsWrongShapes) {
    EXPECT_THROW(requestFromJson(nlohmann::json::array()), SignError);
    EXPECT_THROW(requestFromJson(nlohmann::json::parse(R"({"target_uri": 5})")), SignError);
    EXPECT_THROW(requestFromJson(nlohmann::json::parse(R"({"platform": ["dy"]})")), SignError);
}

TEST(ApiJsonTest, SuccessResponseShape) {
    SigningResponse response;
    response.success = true;
    response.token = "X-Bogus-value";
    response.entryPoint = "sign_detail";
    response.elapsed = std::chrono::milliseconds(12);

    nlohmann::json j = response;
    EXPECT_EQ(j["success"], true);
    EXPECT_EQ(j["token"], "X-Bogus-value");
    EXPECT_EQ(j["entry_point"], "sign_detail");
    EXPECT_EQ(j["elapsed_ms"], 12);
    EXPECT_FALSE(j.contains("error_kind"));
}

TEST(ApiJsonTest, ErrorResponseShape) {
    SigningResponse response;
    response.errorKind = ErrorKind::INVOCATION_TIMEOUT;
    response.message = "sign_detail exceeded 1000ms";

    nlohmann::json j = response;
    EXPECT_EQ(j["success"], false);
    EXPECT_EQ(j["error_kind"], "InvocationTimeout");
    EXPECT_EQ(j["message"], "sign_detail exceeded 1000ms");
    EXPECT_EQ(j["retryable"], true);
    EXPECT_FALSE(j.contains("token"));
}

TEST(ApiJsonTest, HttpStatusMapping) {
    EXPECT_EQ(httpStatusFor(ErrorKind::NONE), 200);
    EXPECT_EQ(httpStatusFor(ErrorKind::INVALID_REQUEST), 400);
    EXPECT_EQ(httpStatusFor(ErrorKind::NO_RULE_MATCHED), 422);
    EXPECT_EQ(httpStatusFor(ErrorKind::SCRIPT_INVALID), 422);
    EXPECT_EQ(httpStatusFor(ErrorKind::SANDBOX_BUILD_ERROR), 422);
    EXPECT_EQ(httpStatusFor(ErrorKind::ENTRY_POINT_NOT_FOUND), 422);
    EXPECT_EQ(httpStatusFor(ErrorKind::SERVICE_UNAVAILABLE), 503);
    EXPECT_EQ(httpStatusFor(ErrorKind::INVOCATION_TIMEOUT), 500);
    EXPECT_EQ(httpStatusFor(ErrorKind::SCRIPT_RUNTIME_ERROR), 500);
    EXPECT_EQ(httpStatusFor(ErrorKind::INTERNAL), 500);
}

TEST(ApiJsonTest, ErrorKindNamesAndRetryability) {
    EXPECT_STREQ(errorKindName(ErrorKind::NO_RULE_MATCHED), "NoRuleMatched");
    EXPECT_STREQ(errorKindName(ErrorKind::ENTRY_POINT_NOT_FOUND), "EntryPointNotFound");
    EXPECT_TRUE(isRetryable(ErrorKind::SERVICE_UNAVAILABLE));
    EXPECT_TRUE(isRetryable(ErrorKind::SCRIPT_RUNTIME_ERROR));
    EXPECT_FALSE(isRetryable(ErrorKind::SCRIPT_INVALID));
    EXPECT_FALSE(isRetryable(ErrorKind::NO_RULE_MATCHED));
}
