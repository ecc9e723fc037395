#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ranger {

// Wire types of the MCP subset this server speaks. Types the server only
// sends have to_json; types it only receives have from_json.

/// {"type":"text","text":...}, the single content kind ever produced.
struct TextContent {
    std::string text;
};

inline bool operator==(const TextContent& a, const TextContent& b) { return a.text == b.text; }

/// Entry of a tools/list page.
struct ToolDefinition {
    std::string name;
    std::optional<std::string> description;
    nlohmann::json input_schema;
    std::optional<nlohmann::json> annotations;
};

/// Body of a tools/call result. Tool failures set is_error instead of
/// becoming JSON-RPC errors.
struct CallToolResult {
    std::vector<TextContent> content;
    bool is_error = false;
};

/// clientInfo / serverInfo.
struct Implementation {
    std::string name;
    std::optional<std::string> title;
    std::string version;
};

/// Capabilities advertised by initialize. An engaged member is sent as
/// its JSON value; a disengaged one is left out.
struct ServerCapabilities {
    std::optional<nlohmann::json> tools;
    std::optional<nlohmann::json> logging;
};

/// Kept verbatim for the session; nothing inspects it.
struct ClientCapabilities {
    nlohmann::json raw = nlohmann::json::object();
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
    std::optional<std::string> instructions;
};

/// One page of a list result; next_cursor is absent on the last page.
template <typename T>
struct PaginatedResult {
    std::vector<T> items;
    std::optional<std::string> next_cursor;
};

void to_json(nlohmann::json& j, const TextContent& t);
void to_json(nlohmann::json& j, const ToolDefinition& t);
void to_json(nlohmann::json& j, const CallToolResult& t);
void to_json(nlohmann::json& j, const Implementation& t);
void to_json(nlohmann::json& j, const ServerCapabilities& t);
void to_json(nlohmann::json& j, const InitializeResult& t);

/// Throws nlohmann::json::exception when name or version is missing or
/// not a string.
void from_json(const nlohmann::json& j, Implementation& t);

/// Non-object input yields an empty capability set.
void from_json(const nlohmann::json& j, ClientCapabilities& t);

} // namespace ranger
