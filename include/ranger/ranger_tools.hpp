#pragma once
#include "arg_value.hpp"
#include "responder.hpp"
#include "tool_registry.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace ranger {

namespace tool_names {
    constexpr const char* Plain       = "ranger";
    constexpr const char* WithInput   = "ranger_with_input";
    constexpr const char* Json        = "ranger_json";
    constexpr const char* WithOptions = "ranger_with_options";
    constexpr const char* WithParams  = "ranger_with_params";
    constexpr const char* CatchAll    = "any_request";
} // namespace tool_names

/// Register the six Ranger tools. The registry's handlers call into
/// `responder`, which must outlive the registry.
void register_ranger_tools(ToolRegistry& registry, const ResponderService& responder);

/// Lenient decoding of tool arguments. Absent keys, nulls and
/// non-object argument bags decode to std::nullopt; values of the wrong
/// type are coerced rather than rejected.
namespace decode {

/// Strings pass through; other values become their compact JSON text.
std::optional<std::string> optional_string(const nlohmann::json& arguments, const std::string& key);

/// Integers pass through, floats truncate, booleans become 0/1.
/// Anything else is std::nullopt.
std::optional<int64_t> optional_integer(const nlohmann::json& arguments, const std::string& key);

/// Objects become maps; anything else is std::nullopt.
std::optional<ArgValue::Map> optional_map(const nlohmann::json& arguments, const std::string& key);

/// Every entry of the argument bag except the listed keys.
ArgValue::Map remaining(const nlohmann::json& arguments, const std::string& except_key);

} // namespace decode

} // namespace ranger
