#include <gtest/gtest.h>
#include "pipe_harness.hpp"
#include <chrono>
#include <thread>

using namespace ranger;
using ranger::testing::PipeHarness;

TEST(StdioLifecycle, InitializeThenPing) {
    PipeHarness client;
    auto init = client.initialize();

    EXPECT_EQ(init.at("jsonrpc"), "2.0");
    EXPECT_EQ(init.at("id"), 0);
    const auto& result = init.at("result");
    EXPECT_EQ(result.at("protocolVersion"), "2025-06-18");
    EXPECT_EQ(result.at("serverInfo").at("name"), "ranger server");
    EXPECT_EQ(result.at("serverInfo").at("version"), std::string(SERVER_VERSION));
    EXPECT_TRUE(result.at("capabilities").contains("tools"));

    auto pong = client.request(1, "ping");
    EXPECT_EQ(pong.at("id"), 1);
    EXPECT_EQ(pong.at("result"), nlohmann::json::object());
    EXPECT_EQ(client.server().session().state(), SessionState::Ready);
}

TEST(StdioLifecycle, StringIdsAreEchoed) {
    PipeHarness client;
    client.send_line(R"({"jsonrpc":"2.0","id":"abc-1","method":"ping"})");
    auto reply = client.receive();
    EXPECT_EQ(reply.at("id"), "abc-1");
}

TEST(StdioLifecycle, EofEndsServe) {
    PipeHarness client;
    client.initialize();
    EXPECT_TRUE(client.server().is_running());

    client.wait_for_exit();
    EXPECT_FALSE(client.server().is_running());
    EXPECT_EQ(client.server().session().state(), SessionState::Closed);
}

TEST(StdioLifecycle, RequestsBeforeEofAreAnswered) {
    PipeHarness client;
    client.send_line(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    client.send_line(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");
    client.close_input();

    auto first = client.receive();
    auto second = client.receive();
    EXPECT_EQ(first.at("id"), 1);
    EXPECT_EQ(second.at("id"), 2);
    EXPECT_EQ(second.at("result").at("tools").size(), 6u);
}

TEST(StdioLifecycle, ShutdownInterruptsIdleServer) {
    PipeHarness client;
    client.initialize();

    // Input stays open; only shutdown() can end serve().
    client.server().shutdown();
    for (int i = 0; i < 500 && client.server().is_running(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    EXPECT_FALSE(client.server().is_running());
}

TEST(StdioLifecycle, MalformedLineGetsNullIdParseError) {
    PipeHarness client;
    client.send_line("{this is not json");
    auto reply = client.receive();
    EXPECT_TRUE(reply.at("id").is_null());
    EXPECT_EQ(reply.at("error").at("code"), error::ParseError);

    // The connection survives.
    auto pong = client.request(1, "ping");
    EXPECT_EQ(pong.at("result"), nlohmann::json::object());
}

TEST(StdioLifecycle, InvalidEnvelopeGetsInvalidRequest) {
    PipeHarness client;
    client.send_line(R"({"jsonrpc":"1.0","id":3,"method":"ping"})");
    auto reply = client.receive();
    EXPECT_TRUE(reply.at("id").is_null());
    EXPECT_EQ(reply.at("error").at("code"), error::InvalidRequest);
}

TEST(StdioLifecycle, UnknownMethod) {
    PipeHarness client;
    client.initialize();
    auto reply = client.request(1, "prompts/list");
    EXPECT_EQ(reply.at("error").at("code"), error::MethodNotFound);
}

TEST(StdioLifecycle, NotificationsGetNoReply) {
    PipeHarness client;
    client.send({{"jsonrpc", "2.0"}, {"method", "notifications/cancelled"},
                 {"params", {{"requestId", 7}}}});
    client.send({{"jsonrpc", "2.0"}, {"method", "notifications/whatever"}});
    // The next line on the wire is the ping reply.
    auto pong = client.request(5, "ping");
    EXPECT_EQ(pong.at("id"), 5);
}
