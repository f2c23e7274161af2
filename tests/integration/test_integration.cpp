#include <boost/asio.hpp>
#include <chrono>
#include <curl/curl.h>
#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <thread>
#include "core/logger/logger.hpp"
#include "engine/scanner/scanner.hpp"
#include "network/http/curl_client.hpp"
#include "probe/probe_selector.hpp"
#include "server/scan_server.hpp"
#include "utils/text/base64.hpp"

using json = nlohmann::json;

// Serves subscription bodies. Its own listening port doubles as a reachable
// target for the probes.
class SubscriptionServer {
public:
    void set_route(const std::string& path, const std::string& content) {
        server_.Get(path, [content](const httplib::Request&, httplib::Response& res) {
            res.set_content(content, "text/plain");
        });
    }

    void start() {
        port_   = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this]() { server_.listen_after_bind(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    void stop() {
        server_.stop();
        if (thread_.joinable())
            thread_.join();
    }

    int port() const {
        return port_;
    }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

private:
    httplib::Server server_;
    std::thread     thread_;
    int             port_ = 0;
};

int closed_port() {
    boost::asio::io_context        ioc;
    boost::asio::ip::tcp::acceptor acceptor(
        ioc, {boost::asio::ip::make_address("127.0.0.1"), 0});
    int port = acceptor.local_endpoint().port();
    acceptor.close();
    return port;
}

class IntegrationTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        curl_global_init(CURL_GLOBAL_ALL);
    }

    static void TearDownTestSuite() {
        curl_global_cleanup();
    }

    void SetUp() override {
        Sonar::Core::Logger::set_level(Sonar::Core::LOG_ERROR);

        server_ = std::make_unique<Sonar::Server::ScanServer>(
            []() {
                return std::make_unique<Sonar::Engine::Scanner>(
                    std::make_unique<Sonar::Network::Http::CurlClient>(),
                    std::make_unique<Sonar::Probe::TransportProbeSelector>());
            },
            "127.0.0.1",
            0,
            2,
            2);
        server_->start();
    }

    void TearDown() override {
        server_->stop();
        Sonar::Core::Logger::set_level(Sonar::Core::LOG_DEFAULT);
    }

    httplib::Result post_scan(const std::string& body) {
        httplib::Client client("127.0.0.1", server_->get_port());
        client.set_read_timeout(30, 0);
        return client.Post("/api/scan", body, "application/json");
    }

    std::unique_ptr<Sonar::Server::ScanServer> server_;
};

TEST_F(IntegrationTest, ScansFetchedSubscription) {
    SubscriptionServer upstream;
    upstream.start();

    int         dead = closed_port();
    std::string plain =
        "trojan://pw@127.0.0.1:" + std::to_string(upstream.port()) + "?security=none#alive\n"
        + "trojan://pw@127.0.0.1:" + std::to_string(dead) + "?security=none#dead\n";
    upstream.set_route("/sub", Sonar::Utils::Text::base64_encode(plain));

    json request = {{"sources", {upstream.url("/sub")}}, {"timeoutMs", 1000}, {"concurrency", 4}};
    auto res     = post_scan(request.dump());

    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->get_header_value("Cache-Control"), "no-store");

    json body = json::parse(res->body);
    EXPECT_EQ(body["total"], 2);
    EXPECT_EQ(body["ok"], 1);
    EXPECT_EQ(body["timeoutMs"], 1000);
    ASSERT_EQ(body["results"].size(), 1u);
    EXPECT_EQ(body["results"][0]["name"], "alive");
    EXPECT_EQ(body["results"][0]["port"], upstream.port());
    EXPECT_EQ(body["results"][0]["ok"], true);

    upstream.stop();
}

TEST_F(IntegrationTest, WebSocketDescriptorAgainstPlainHttpServer) {
    SubscriptionServer upstream;
    upstream.start();

    // An ordinary HTTP server answers the upgrade request without a 101.
    std::string line = "vless://id@127.0.0.1:" + std::to_string(upstream.port())
                       + "?type=ws&path=%2Fws&security=none#ws";
    json request     = {{"rawText", line}, {"timeoutMs", 1000}};
    auto res         = post_scan(request.dump());

    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    json body = json::parse(res->body);
    EXPECT_EQ(body["total"], 1);
    EXPECT_EQ(body["ok"], 0);
    EXPECT_TRUE(body["results"].empty());

    upstream.stop();
}

TEST_F(IntegrationTest, UnreachableSubscriptionsAreUnprocessable) {
    json request = {{"sources", {"http://127.0.0.1:" + std::to_string(closed_port()) + "/sub"}}};
    auto res     = post_scan(request.dump());

    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 422);
    EXPECT_TRUE(json::parse(res->body).contains("error"));
}

TEST_F(IntegrationTest, MalformedBodies) {
    auto res = post_scan("{not json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_TRUE(json::parse(res->body).contains("error"));

    res = post_scan("[1, 2, 3]");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);

    res = post_scan("{}");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(json::parse(res->body)["total"], 0);
}

TEST_F(IntegrationTest, EmptyBodyScansWithDefaults) {
    auto res = post_scan("");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);

    json body = json::parse(res->body);
    EXPECT_EQ(body["total"], 0);
    EXPECT_EQ(body["timeoutMs"], 3000);
}

TEST_F(IntegrationTest, RoutingErrors) {
    httplib::Client client("127.0.0.1", server_->get_port());

    auto res = client.Get("/api/scan");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 405);

    res = client.Post("/api/other", "{}", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
}

TEST_F(IntegrationTest, OversizedBodyIsRejected) {
    std::string huge = R"({"rawText":")" + std::string(2 * 1024 * 1024, 'a') + R"("})";
    auto        res  = post_scan(huge);
    // The server may close before the client finishes sending.
    if (res)
        EXPECT_EQ(res->status, 413);

    auto after = post_scan("{}");
    ASSERT_TRUE(after);
    EXPECT_EQ(after->status, 200);
}

TEST_F(IntegrationTest, ServerSurvivesFailedRequests) {
    for (int i = 0; i < 3; ++i) {
        auto bad = post_scan("garbage");
        ASSERT_TRUE(bad);
        EXPECT_EQ(bad->status, 400);
    }
    auto res = post_scan(R"({"rawText": "nothing to see here"})");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
}
