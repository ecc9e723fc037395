#include "ranger/config.hpp"
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace ranger {

namespace {

uint16_t parse_port(const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigError("Invalid port: '" + value + "'");
    }
    errno = 0;
    unsigned long port = std::strtoul(value.c_str(), nullptr, 10);
    if (errno == ERANGE || port > std::numeric_limits<uint16_t>::max()) {
        throw ConfigError("Port out of range: " + value);
    }
    return static_cast<uint16_t>(port);
}

TransportKind parse_transport(const std::string& value) {
    if (value == "stdio") return TransportKind::Stdio;
    if (value == "http") return TransportKind::Http;
    throw ConfigError("Unknown transport '" + value + "' (expected stdio or http)");
}

} // anonymous namespace

ServerConfig parse_args(const std::vector<std::string>& args) {
    ServerConfig config;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string arg = args[i];
        std::string value;
        bool has_inline_value = false;

        // --key=value
        if (arg.rfind("--", 0) == 0) {
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
                has_inline_value = true;
            }
        }

        auto take_value = [&]() -> std::string {
            if (has_inline_value) return value;
            if (i + 1 >= args.size()) {
                throw ConfigError("Missing value for " + arg);
            }
            return args[++i];
        };

        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
        } else if (arg == "--transport" || arg == "-t") {
            config.transport = parse_transport(take_value());
        } else if (arg == "--host") {
            config.host = take_value();
            if (config.host.empty()) throw ConfigError("Host must not be empty");
        } else if (arg == "--port" || arg == "-p") {
            config.port = parse_port(take_value());
        } else if (arg == "--log-level") {
            std::string level = take_value();
            try {
                config.log_level = log_level_from_string(level);
            } catch (const std::invalid_argument& e) {
                throw ConfigError(e.what());
            }
        } else if (arg == "--name") {
            config.name = take_value();
            if (config.name.empty()) throw ConfigError("Server name must not be empty");
        } else {
            throw ConfigError("Unknown option: " + arg);
        }
    }

    return config;
}

ServerConfig parse_args(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return parse_args(args);
}

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "\n"
        << "MCP server that responds 'Ranger!' to everything.\n"
        << "\n"
        << "Options:\n"
        << "  -t, --transport <stdio|http>  Transport to serve on (default: stdio)\n"
        << "      --host <addr>             HTTP bind address (default: 127.0.0.1)\n"
        << "  -p, --port <n>                HTTP port, 0 for any (default: 8000)\n"
        << "      --log-level <level>       debug, info, notice, warning, error,\n"
        << "                                critical, alert or emergency (default: info)\n"
        << "      --name <name>             Server name reported on initialize\n"
        << "                                (default: \"ranger server\")\n"
        << "  -h, --help                    Show this help and exit\n";
    return out.str();
}

} // namespace ranger
