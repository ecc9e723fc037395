#include <gtest/gtest.h>
#include "ranger/json_rpc.hpp"
#include "ranger/error.hpp"
#include <nlohmann/json.hpp>

using namespace ranger;

namespace {

nlohmann::json wire(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return j;
}

} // namespace

TEST(JsonRpcWire, RequestCarriesIdAndOptionalParams) {
    EXPECT_EQ(wire(JsonRpcRequest{RequestId{int64_t{1}}, "tools/list", nlohmann::json{{"cursor", "2"}}}),
              nlohmann::json::parse(R"({"jsonrpc":"2.0","id":1,"method":"tools/list","params":{"cursor":"2"}})"));
    EXPECT_EQ(wire(JsonRpcRequest{RequestId{std::string{"my-id"}}, "ping", std::nullopt}),
              nlohmann::json::parse(R"({"jsonrpc":"2.0","id":"my-id","method":"ping"})"));
}

TEST(JsonRpcWire, NotificationHasNoId) {
    auto j = wire(JsonRpcNotification{"notifications/cancelled", nlohmann::json{{"requestId", 3}}});
    EXPECT_FALSE(j.contains("id"));
    EXPECT_EQ(j["params"]["requestId"], 3);
}

TEST(JsonRpcWire, ResponseWritesResultOrError) {
    JsonRpcResponse ok;
    ok.id = RequestId{int64_t{42}};
    ok.result = nlohmann::json{{"ok", true}};
    EXPECT_EQ(wire(ok), nlohmann::json::parse(R"({"jsonrpc":"2.0","id":42,"result":{"ok":true}})"));

    auto failed = make_error_response(RequestId{int64_t{1}}, error::MethodNotFound, "Method not found");
    failed.result = nlohmann::json::object();  // error wins
    EXPECT_EQ(wire(failed), nlohmann::json::parse(
        R"({"jsonrpc":"2.0","id":1,"error":{"code":-32601,"message":"Method not found"}})"));
}

TEST(JsonRpcWire, ErrorDataIsOptional) {
    nlohmann::json j = JsonRpcError{error::InvalidParams, "bad", nlohmann::json{{"field", "name"}}};
    EXPECT_EQ(j["data"]["field"], "name");
    nlohmann::json bare = JsonRpcError{error::InvalidParams, "bad", std::nullopt};
    EXPECT_FALSE(bare.contains("data"));
}

TEST(JsonRpcRead, NullIdResponse) {
    auto resp = nlohmann::json::parse(
        R"({"jsonrpc":"2.0","id":null,"error":{"code":-32700,"message":"Parse error","data":"line 1"}})")
        .get<JsonRpcResponse>();
    EXPECT_FALSE(resp.id.has_value());
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::ParseError);
    EXPECT_EQ(resp.error->data, std::optional<nlohmann::json>("line 1"));
}

TEST(JsonRpcRead, IdMustBeIntegerOrString) {
    RequestId id;
    from_json(nlohmann::json(-3), id);
    EXPECT_EQ(std::get<int64_t>(id), -3);
    from_json(nlohmann::json("x"), id);
    EXPECT_EQ(std::get<std::string>(id), "x");

    EXPECT_THROW(from_json(nlohmann::json(1.5), id), std::invalid_argument);
    EXPECT_THROW(from_json(nlohmann::json(nullptr), id), std::invalid_argument);
    EXPECT_THROW(from_json(nlohmann::json::array(), id), std::invalid_argument);
}

TEST(MakeErrorResponse, CarriesIdAndCode) {
    auto resp = make_error_response(RequestId{std::string{"x"}}, error::InvalidParams, "Unknown tool: nope");
    ASSERT_TRUE(resp.id.has_value());
    EXPECT_EQ(std::get<std::string>(*resp.id), "x");
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->message, "Unknown tool: nope");
    EXPECT_FALSE(resp.result.has_value());
}
