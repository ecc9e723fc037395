#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string_view>
#include <vector>

namespace ranger {

class Codec {
public:
    /// Parse one newline-free JSON-RPC frame.
    /// Throws McpParseError on invalid JSON or a malformed message.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Parse a batch (JSON array of messages).
    [[nodiscard]] static std::vector<JsonRpcMessage> parse_batch(std::string_view raw);

    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);

    [[nodiscard]] static std::string serialize_batch(const std::vector<JsonRpcMessage>& msgs);

    /// Parse raw bytes into a JSON document without interpreting it.
    [[nodiscard]] static nlohmann::json parse_document(std::string_view raw);

private:
    static JsonRpcMessage parse_object(const nlohmann::json& j);
};

} // namespace ranger
