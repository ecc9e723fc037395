#pragma once
#include <stdexcept>
#include <string>

namespace ranger {

namespace error {
    constexpr int ParseError     = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams  = -32602;
    constexpr int InternalError  = -32603;
} // namespace error

class McpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Raised by the codec. `code` is ParseError for malformed JSON and
/// InvalidRequest for well-formed JSON that is not a JSON-RPC message.
class McpParseError : public McpError {
public:
    int code;
    explicit McpParseError(const std::string& msg, int code = error::ParseError)
        : McpError(msg), code(code) {}
};

class McpProtocolError : public McpError {
public:
    int code;
    McpProtocolError(int code, const std::string& msg)
        : McpError(msg), code(code) {}
};

class McpTransportError : public McpError {
public:
    using McpError::McpError;
};

/// Bad command-line input.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace ranger
