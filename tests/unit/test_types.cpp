#include <gtest/gtest.h>
#include "ranger/types.hpp"
#include <nlohmann/json.hpp>

using namespace ranger;

TEST(TextContent, WireShape) {
    nlohmann::json j = TextContent{"Ranger！"};
    EXPECT_EQ(j, nlohmann::json::parse(R"({"type":"text","text":"Ranger！"})"));
}

TEST(ToolDefinition, OptionalFieldsOmitted) {
    ToolDefinition def;
    def.name = "ranger";
    def.input_schema = {{"type", "object"}, {"properties", nlohmann::json::object()}};

    nlohmann::json j = def;
    EXPECT_EQ(j["name"], "ranger");
    EXPECT_EQ(j["inputSchema"]["type"], "object");
    EXPECT_FALSE(j.contains("description"));
    EXPECT_FALSE(j.contains("annotations"));
}

TEST(ToolDefinition, MissingSchemaBecomesEmptyObjectSchema) {
    ToolDefinition def;
    def.name = "ranger_json";
    def.description = "A tool that responds with \"Ranger!\" in JSON format.";
    def.annotations = nlohmann::json{{"readOnlyHint", true}};

    nlohmann::json j = def;
    EXPECT_EQ(j["inputSchema"], nlohmann::json({{"type", "object"}}));
    EXPECT_EQ(j["description"], *def.description);
    EXPECT_EQ(j["annotations"]["readOnlyHint"], true);
}

TEST(CallToolResult, WireShape) {
    CallToolResult r;
    r.content.push_back(TextContent{"Ranger！"});
    EXPECT_EQ(nlohmann::json(r),
              nlohmann::json::parse(R"({"content":[{"type":"text","text":"Ranger！"}],"isError":false})"));

    CallToolResult empty;
    empty.is_error = true;
    EXPECT_EQ(nlohmann::json(empty), nlohmann::json::parse(R"({"content":[],"isError":true})"));
}

TEST(InitializeResult, Serialize) {
    InitializeResult r;
    r.protocol_version = "2025-06-18";
    r.capabilities.tools = nlohmann::json{{"listChanged", false}};
    r.capabilities.logging = nlohmann::json::object();
    r.server_info = Implementation{"ranger server", std::nullopt, "1.0.0"};

    nlohmann::json j = r;
    EXPECT_EQ(j["protocolVersion"], "2025-06-18");
    EXPECT_EQ(j["capabilities"]["tools"]["listChanged"], false);
    EXPECT_TRUE(j["capabilities"]["logging"].is_object());
    EXPECT_EQ(j["serverInfo"], nlohmann::json({{"name", "ranger server"}, {"version", "1.0.0"}}));
    EXPECT_FALSE(j.contains("instructions"));

    r.instructions = "Ask anything.";
    EXPECT_EQ(nlohmann::json(r)["instructions"], "Ask anything.");
}

TEST(Implementation, ReadsClientInfo) {
    auto info = nlohmann::json::parse(R"({"name":"inspector","title":"MCP Inspector","version":"0.9"})")
                    .get<Implementation>();
    EXPECT_EQ(info.name, "inspector");
    EXPECT_EQ(info.title, std::optional<std::string>("MCP Inspector"));
    EXPECT_EQ(info.version, "0.9");
}

TEST(Implementation, VersionRequired) {
    nlohmann::json j = {{"name", "client"}};
    EXPECT_THROW(j.get<Implementation>(), nlohmann::json::exception);
}

TEST(ClientCapabilities, NonObjectIsEmpty) {
    auto caps = nlohmann::json("nope").get<ClientCapabilities>();
    EXPECT_EQ(caps.raw, nlohmann::json::object());
}
