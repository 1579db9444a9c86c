#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "core/http_server.h"
#include "test_support.h"

using namespace sign_core;
using sign_test::eventually;
using std::chrono::milliseconds;
namespace http = boost::beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

ServiceConfig testConfig() {
    ServiceConfig config;
    config.pool.size = 2;
    config.pool.buildTimeout = std::chrono::milliseconds(2000);
    return config;
}

HttpRequest makeRequest(http::verb method, const std::string& target, const std::string& body = "",
                        const std::string& contentType = "application/json") {
    HttpRequest request{method, target, 11};
    request.set(http::field::host, "localhost");
    if (!body.empty()) {
        request.set(http::field::content_type, contentType);
        request.body() = body;
        request.prepare_payload();
    }
    return request;
}

const char* const kQueuedSignBody =
    R"({"target_uri": "https://www.douyin.com/aweme/v1/web/aweme/detail/", "platform": "dy", "parameters": "a=1"})";

// A one-context service whose only context is checked out, so a sign request
// queues in acquire() for up to five seconds.
ServiceConfig saturatedConfig() {
    ServiceConfig config = testConfig();
    config.pool.size = 1;
    config.pool.acquireTimeout = milliseconds(5000);
    return config;
}

// Runs an HttpServer on an ephemeral port for the lifetime of the object.
class LiveServer {
public:
    explicit LiveServer(SigningService& service)
        : server(service, "127.0.0.1", 0), thread([this]() { ran = server.run(); }) {}

    ~LiveServer() {
        server.stop();
        if (thread.joinable()) {
            thread.join();
        }
    }

    // Connects and sends a sign request without waiting for the answer.
    void sendQueuedSign(tcp::socket& client) {
        client.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), server.boundPort()));
        HttpRequest request = makeRequest(http::verb::post, "/sign", kQueuedSignBody);
        http::write(client, request);
    }

    HttpServer server;
    std::atomic<bool> ran{false};
    std::thread thread;
};

class HttpServerTest : public ::testing::Test {
protected:
    HttpServerTest()
        : service_(testConfig(), sign_test::kScriptV1), server_(service_, "127.0.0.1", 0) {}

    nlohmann::json jsonOf(const HttpResponse& response) {
        return nlohmann::json::parse(response.body());
    }

    SigningService service_;
    HttpServer server_;
};

} // namespace

TEST_F(HttpServerTest, HealthReportsReadyPool) {
    HttpResponse response = server_.handle(makeRequest(http::verb::get, "/health"));
    EXPECT_EQ(response.result(), http::status::ok);
    EXPECT_EQ(response.body(), "ok");
}

TEST_F(HttpServerTest, SignReturnsToken) {
    HttpResponse response = server_.handle(makeRequest(http::verb::post, "/sign", R"({
        "target_uri": "https://www.douyin.com/aweme/v1/web/comment/list/reply/",
        "platform": "dy",
        "parameters": "item_id=1",
        "client_user_agent": "UA"
    })"));
    EXPECT_EQ(response.result(), http::status::ok);
    auto body = jsonOf(response);
    EXPECT_EQ(body["success"], true);
    EXPECT_EQ(body["token"], "v1-reply:item_id=1");
    EXPECT_EQ(body["entry_point"], "sign_reply");
    EXPECT_EQ(response[http::field::content_type], "application/json; charset=utf-8");
}

TEST_F(HttpServerTest, PlatformRouteAcceptsLegacyBody) {
    HttpResponse response = server_.handle(makeRequest(http::verb::post, "/sign/dy?trace=1",
        R"({"uri": "https://www.douyin.com/aweme/v1/web/aweme/detail/", "params": "aweme_id=7", "user_agent": "UA"})"));
    EXPECT_EQ(response.result(), http::status::ok);
    EXPECT_EQ(jsonOf(response)["token"], "v1-detail:aweme_id=7|UA");
}

TEST_F(HttpServerTest, BadBodiesAreBadRequests) {
    HttpResponse notJson = server_.handle(makeRequest(http::verb::post, "/sign", "{not json"));
    EXPECT_EQ(notJson.result(), http::status::bad_request);
    EXPECT_EQ(jsonOf(notJson)["error_kind"], "InvalidRequest");
    EXPECT_EQ(jsonOf(notJson)["retryable"], false);

    HttpResponse unknownPlatform = server_.handle(makeRequest(http::verb::post, "/sign/friendster",
        R"({"uri": "/a", "params": ""})"));
    EXPECT_EQ(unknownPlatform.result(), http::status::bad_request);
}

TEST_F(HttpServerTest, NoRuleIsUnprocessable) {
    HttpResponse response = server_.handle(makeRequest(http::verb::post, "/sign/xhs",
        R"({"uri": "/api/sns/web/v1/feed", "params": ""})"));
    EXPECT_EQ(response.result(), http::status::unprocessable_entity);
    EXPECT_EQ(jsonOf(response)["error_kind"], "NoRuleMatched");
}

TEST_F(HttpServerTest, UnknownRouteIsNotFound) {
    EXPECT_EQ(server_.handle(makeRequest(http::verb::get, "/metrics")).result(), http::status::not_found);
    EXPECT_EQ(server_.handle(makeRequest(http::verb::get, "/sign")).result(), http::status::not_found);
}

TEST_F(HttpServerTest, ScriptUpdateAndRollback) {
    HttpResponse rejected = server_.handle(makeRequest(http::verb::post, "/admin/script",
        sign_test::kScriptWithoutReply, "application/javascript"));
    EXPECT_EQ(rejected.result(), http::status::unprocessable_entity);
    EXPECT_EQ(jsonOf(rejected)["error_kind"], "ScriptInvalid");

    nlohmann::json wrapped = {{"source", sign_test::kScriptV2}};
    HttpResponse accepted = server_.handle(makeRequest(http::verb::post, "/admin/script", wrapped.dump()));
    EXPECT_EQ(accepted.result(), http::status::ok);
    EXPECT_EQ(jsonOf(accepted)["version"], 2);
    EXPECT_EQ(jsonOf(accepted)["hash"], sha256Hex(sign_test::kScriptV2));

    HttpResponse rolledBack = server_.handle(makeRequest(http::verb::post, "/admin/script/rollback"));
    EXPECT_EQ(rolledBack.result(), http::status::ok);
    EXPECT_EQ(jsonOf(rolledBack)["hash"], sha256Hex(sign_test::kScriptV1));

    HttpResponse again = server_.handle(makeRequest(http::verb::post, "/admin/script/rollback"));
    EXPECT_EQ(again.result(), http::status::ok);
    EXPECT_EQ(jsonOf(again)["hash"], sha256Hex(sign_test::kScriptV2));
}

TEST_F(HttpServerTest, RulesReload) {
    HttpResponse bad = server_.handle(makeRequest(http::verb::post, "/admin/rules",
        R"([{"pattern": "([", "match": "regex", "entry_point": "sign_detail"}])"));
    EXPECT_EQ(bad.result(), http::status::bad_request);

    HttpResponse ok = server_.handle(makeRequest(http::verb::post, "/admin/rules",
        R"({"rules": [{"platform": "ks", "pattern": "", "entry_point": "sign_detail"}]})"));
    EXPECT_EQ(ok.result(), http::status::ok);
    EXPECT_EQ(jsonOf(ok)["rules"].size(), 1u);

    HttpResponse signed_ks = server_.handle(makeRequest(http::verb::post, "/sign/ks",
        R"({"uri": "/rest/v/profile", "params": "p=1", "user_agent": "UA"})"));
    EXPECT_EQ(signed_ks.result(), http::status::ok);
}

TEST_F(HttpServerTest, StatusIsJson) {
    HttpResponse response = server_.handle(makeRequest(http::verb::get, "/sign/status"));
    EXPECT_EQ(response.result(), http::status::ok);
    auto body = jsonOf(response);
    EXPECT_EQ(body["live"], true);
    EXPECT_EQ(body["pool"]["capacity"], 2);
    EXPECT_EQ(body["script"]["version"], 1);
}

TEST(HttpServerLiveTest, ClientDisconnectAbandonsQueuedSignRequest) {
    SigningService service(saturatedConfig(), sign_test::kScriptV1);
    ContextLease held = service.pool().acquire();
    LiveServer live(service);
    ASSERT_TRUE(eventually([&live]() { return live.server.boundPort() != 0; }));

    net::io_context ioc;
    tcp::socket client(ioc);
    live.sendQueuedSign(client);
    ASSERT_TRUE(eventually([&service]() { return service.pool().stats().waiting == 1; }));

    auto closed = std::chrono::steady_clock::now();
    client.close();

    EXPECT_TRUE(eventually([&service]() { return service.pool().stats().rejected == 1; }, milliseconds(2000)));
    EXPECT_LT(std::chrono::steady_clock::now() - closed, milliseconds(2000));
    EXPECT_EQ(service.pool().stats().waiting, 0u);
    EXPECT_TRUE(eventually([&live]() { return live.server.activeSessions() == 0; }));

    held.release(ReleaseOutcome::HEALTHY);
}

TEST(HttpServerLiveTest, StopWaitsForInFlightSessions) {
    SigningService service(saturatedConfig(), sign_test::kScriptV1);
    ContextLease held = service.pool().acquire();
    LiveServer live(service);
    ASSERT_TRUE(eventually([&live]() { return live.server.boundPort() != 0; }));

    net::io_context ioc;
    tcp::socket client(ioc);
    live.sendQueuedSign(client);
    ASSERT_TRUE(eventually([&service]() { return service.pool().stats().waiting == 1; }));
    EXPECT_EQ(live.server.activeSessions(), 1u);

    // Stopping hangs up on the queued caller; run() returns only once its session is gone.
    auto stopping = std::chrono::steady_clock::now();
    live.server.stop();
    live.thread.join();

    EXPECT_TRUE(live.ran.load());
    EXPECT_LT(std::chrono::steady_clock::now() - stopping, milliseconds(2000));
    EXPECT_EQ(live.server.activeSessions(), 0u);
    EXPECT_EQ(service.pool().stats().waiting, 0u);
    EXPECT_EQ(service.pool().stats().rejected, 1u);

    held.release(ReleaseOutcome::HEALTHY);
}
