#include "ranger/types.hpp"

namespace ranger {

namespace {

template <typename T>
void put_if(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) j[key] = *value;
}

} // anonymous namespace

void to_json(nlohmann::json& j, const TextContent& t) {
    j = {{"type", "text"}, {"text", t.text}};
}

void to_json(nlohmann::json& j, const ToolDefinition& t) {
    j = {{"name", t.name}};
    put_if(j, "description", t.description);
    j["inputSchema"] = t.input_schema.is_null() ? nlohmann::json{{"type", "object"}} : t.input_schema;
    put_if(j, "annotations", t.annotations);
}

void to_json(nlohmann::json& j, const CallToolResult& t) {
    nlohmann::json content = nlohmann::json::array();
    for (const auto& item : t.content) content.push_back(item);
    j = {{"content", std::move(content)}, {"isError", t.is_error}};
}

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}};
    put_if(j, "title", t.title);
    j["version"] = t.version;
}

void to_json(nlohmann::json& j, const ServerCapabilities& t) {
    j = nlohmann::json::object();
    put_if(j, "tools", t.tools);
    put_if(j, "logging", t.logging);
}

void to_json(nlohmann::json& j, const InitializeResult& t) {
    j = {
        {"protocolVersion", t.protocol_version},
        {"capabilities", t.capabilities},
        {"serverInfo", t.server_info}
    };
    put_if(j, "instructions", t.instructions);
}

void from_json(const nlohmann::json& j, Implementation& t) {
    j.at("name").get_to(t.name);
    j.at("version").get_to(t.version);
    auto title = j.find("title");
    if (title != j.end() && title->is_string()) {
        t.title = title->get<std::string>();
    } else {
        t.title.reset();
    }
}

void from_json(const nlohmann::json& j, ClientCapabilities& t) {
    t.raw = j.is_object() ? j : nlohmann::json::object();
}

} // namespace ranger
