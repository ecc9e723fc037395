#pragma once
#include "error.hpp"
#include "logging.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace ranger {

enum class TransportKind {
    Stdio,
    Http
};

/// Command-line options of ranger_mcp_server. The defaults give the
/// plain stdio server.
struct ServerConfig {
    TransportKind transport = TransportKind::Stdio;
    std::string host = "127.0.0.1";
    uint16_t port = 8000;
    LogLevel log_level = LogLevel::Info;
    std::string name = "ranger server";
    bool show_help = false;
};

/// Parse argv (excluding argv[0]). Throws ConfigError on unknown options,
/// missing values and values out of range.
ServerConfig parse_args(const std::vector<std::string>& args);

ServerConfig parse_args(int argc, char* argv[]);

std::string usage(const std::string& program);

} // namespace ranger
