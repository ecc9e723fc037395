#pragma once
#include <array>
#include <string_view>

namespace ranger {

constexpr std::string_view SERVER_VERSION   = "1.0.0";
constexpr std::string_view PROTOCOL_VERSION = "2025-06-18";
constexpr std::string_view JSONRPC_VERSION  = "2.0";

/// Protocol revisions accepted during initialize, oldest first.
constexpr std::array<std::string_view, 3> SUPPORTED_PROTOCOL_VERSIONS = {
    "2024-11-05", "2025-03-26", "2025-06-18"
};

} // namespace ranger
