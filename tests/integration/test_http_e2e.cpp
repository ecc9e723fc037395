#include <gtest/gtest.h>
#include "ranger/ranger.hpp"
#include <httplib.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace ranger;

namespace {

class HttpE2E : public ::testing::Test {
protected:
    HttpE2E()
        : sink_(std::make_shared<MemoryLogSink>())
        , logs_(sink_)
        , responder_(logs_) {}

    void SetUp() override {
        ToolRegistry tools;
        register_ranger_tools(tools, responder_);

        McpServer::Options opts;
        opts.server_info = Implementation{"ranger server", std::nullopt, std::string(SERVER_VERSION)};
        server_ = std::make_unique<McpServer>(opts, std::move(tools), logs_);

        HttpServerTransport::Options topts;
        topts.port = 0;
        topts.allowed_origins = {"http://localhost"};
        topts.max_sessions = kMaxSessions;
        auto transport = std::make_unique<HttpServerTransport>(topts);
        transport_ = transport.get();

        server_thread_ = std::thread([this, t = std::move(transport)]() mutable {
            try {
                server_->serve(std::move(t));
            } catch (const std::exception& e) {
                serve_failed_ = true;
                ADD_FAILURE() << "serve() failed: " << e.what();
            }
        });

        for (int i = 0; i < 1000 && !serve_failed_ && transport_->port() == 0; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        ASSERT_FALSE(serve_failed_);
        ASSERT_NE(transport_->port(), 0);
        client_ = std::make_unique<httplib::Client>("127.0.0.1", transport_->port());
        client_->set_read_timeout(5, 0);
    }

    void TearDown() override {
        server_->shutdown();
        if (server_thread_.joinable()) server_thread_.join();
    }

    httplib::Result post(const nlohmann::json& body, httplib::Headers headers = {}) {
        return client_->Post("/mcp", headers, body.dump(), "application/json");
    }

    std::string initialize() {
        auto res = post({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"},
                         {"params", {{"protocolVersion", "2025-06-18"},
                                     {"capabilities", nlohmann::json::object()},
                                     {"clientInfo", {{"name", "http-test"}, {"version", "1"}}}}}});
        EXPECT_TRUE(res);
        if (!res) return {};
        EXPECT_EQ(res->status, 200);
        return res->get_header_value("Mcp-Session-Id");
    }

    static constexpr std::size_t kMaxSessions = 3;

    std::shared_ptr<MemoryLogSink> sink_;
    LogContext logs_;
    ResponderService responder_;
    std::unique_ptr<McpServer> server_;
    HttpServerTransport* transport_ = nullptr;  // owned by serve()
    std::atomic<bool> serve_failed_{false};
    std::thread server_thread_;
    std::unique_ptr<httplib::Client> client_;
};

} // namespace

TEST_F(HttpE2E, InitializeIssuesSession) {
    auto session = initialize();
    EXPECT_FALSE(session.empty());
    EXPECT_EQ(transport_->session_count(), 1u);
    EXPECT_EQ(server_->session().client_info()->name, "http-test");
}

TEST_F(HttpE2E, ToolCallReturnsRanger) {
    auto session = initialize();
    auto res = post({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/call"},
                     {"params", {{"name", "any_request"},
                                 {"arguments", {{"request", "hello"}, {"x", 1}}}}}},
                    {{"Mcp-Session-Id", session}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);

    auto reply = nlohmann::json::parse(res->body);
    EXPECT_EQ(reply.at("id"), 2);
    EXPECT_EQ(reply.at("result").at("content")[0].at("text"), "Ranger！");

    bool logged = false;
    for (const auto& rec : sink_->records()) {
        if (rec.logger == "ranger" && rec.message == "any_request was called") {
            logged = true;
            EXPECT_EQ(rec.extra.at("request"), "hello");
            EXPECT_EQ(rec.extra.at("args"), R"({"x":1})");
        }
    }
    EXPECT_TRUE(logged);
}

TEST_F(HttpE2E, BatchGetsArrayOfReplies) {
    auto session = initialize();
    nlohmann::json batch = nlohmann::json::array({
        {{"jsonrpc", "2.0"}, {"id", 10}, {"method", "ping"}},
        {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}},
        {{"jsonrpc", "2.0"}, {"id", 11}, {"method", "tools/call"}, {"params", {{"name", "ranger"}}}}
    });
    auto res = post(batch, {{"Mcp-Session-Id", session}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);

    auto replies = nlohmann::json::parse(res->body);
    ASSERT_TRUE(replies.is_array());
    ASSERT_EQ(replies.size(), 2u);
    EXPECT_EQ(replies[0].at("id"), 10);
    EXPECT_EQ(replies[1].at("id"), 11);
}

TEST_F(HttpE2E, NotificationIsAccepted) {
    auto session = initialize();
    auto res = post({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}},
                    {{"Mcp-Session-Id", session}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 202);
    EXPECT_TRUE(res->body.empty());
    EXPECT_EQ(server_->session().state(), SessionState::Ready);
}

TEST_F(HttpE2E, MalformedBodyIsBadRequest) {
    auto res = client_->Post("/mcp", "{oops", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    auto reply = nlohmann::json::parse(res->body);
    EXPECT_TRUE(reply.at("id").is_null());
    EXPECT_EQ(reply.at("error").at("code"), error::ParseError);
}

TEST_F(HttpE2E, UnknownSessionIsNotFound) {
    auto res = post({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}},
                    {{"Mcp-Session-Id", "no-such-session"}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
}

TEST_F(HttpE2E, ForeignOriginIsForbidden) {
    auto res = post({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}},
                    {{"Origin", "http://evil.example"}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 403);

    auto ok = post({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}},
                   {{"Origin", "http://localhost"}});
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok->status, 200);
}

TEST_F(HttpE2E, UnsupportedProtocolVersionHeader) {
    auto res = post({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}},
                    {{"MCP-Protocol-Version", "1999-01-01"}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
}

TEST_F(HttpE2E, GetIsNotAllowed) {
    auto res = client_->Get("/mcp");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 405);
}

TEST_F(HttpE2E, DeleteEndsSession) {
    auto session = initialize();
    ASSERT_FALSE(session.empty());

    auto del = client_->Delete("/mcp", httplib::Headers{{"Mcp-Session-Id", session}});
    ASSERT_TRUE(del);
    EXPECT_EQ(del->status, 200);
    EXPECT_EQ(transport_->session_count(), 0u);

    auto again = client_->Delete("/mcp", httplib::Headers{{"Mcp-Session-Id", session}});
    ASSERT_TRUE(again);
    EXPECT_EQ(again->status, 404);

    auto after = post({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}},
                      {{"Mcp-Session-Id", session}});
    ASSERT_TRUE(after);
    EXPECT_EQ(after->status, 404);
}

TEST_F(HttpE2E, OldestSessionIsForgottenAtCapacity) {
    std::vector<std::string> sessions;
    for (std::size_t i = 0; i < kMaxSessions + 2; ++i) {
        sessions.push_back(initialize());
        ASSERT_FALSE(sessions.back().empty());
    }
    EXPECT_EQ(transport_->session_count(), kMaxSessions);

    const nlohmann::json ping = {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}};
    auto evicted = post(ping, {{"Mcp-Session-Id", sessions[0]}});
    ASSERT_TRUE(evicted);
    EXPECT_EQ(evicted->status, 404);
    evicted = post(ping, {{"Mcp-Session-Id", sessions[1]}});
    ASSERT_TRUE(evicted);
    EXPECT_EQ(evicted->status, 404);

    auto live = post(ping, {{"Mcp-Session-Id", sessions.back()}});
    ASSERT_TRUE(live);
    EXPECT_EQ(live->status, 200);
}

TEST_F(HttpE2E, DeletedSessionFreesItsSlot) {
    auto first = initialize();
    auto del = client_->Delete("/mcp", httplib::Headers{{"Mcp-Session-Id", first}});
    ASSERT_TRUE(del);
    EXPECT_EQ(del->status, 200);

    std::vector<std::string> sessions;
    for (std::size_t i = 0; i < kMaxSessions; ++i) sessions.push_back(initialize());
    EXPECT_EQ(transport_->session_count(), kMaxSessions);

    // All of them are still live: the deleted one did not hold a slot.
    for (const auto& id : sessions) {
        auto res = post({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}}, {{"Mcp-Session-Id", id}});
        ASSERT_TRUE(res);
        EXPECT_EQ(res->status, 200);
    }
}
