#pragma once
#include "json_rpc.hpp"
#include "logging.hpp"
#include "session.hpp"
#include "tool_registry.hpp"
#include "types.hpp"
#include "transport/transport.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace ranger {

/// MCP server over a fixed tool registry. Owns the protocol lifecycle;
/// the tools themselves never see framing, ids or sessions.
class McpServer {
public:
    struct Options {
        Implementation server_info;
        std::optional<std::string> instructions;
        size_t page_size = 50;
    };

    McpServer(Options opts, ToolRegistry tools, LogContext& log);
    ~McpServer();

    // Non-copyable, non-movable
    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    /// Handle one incoming message and return the reply, if any.
    /// serve() routes every transport message through here.
    [[nodiscard]] std::optional<JsonRpcMessage> handle(const JsonRpcMessage& msg);

    // ---- Transport ----

    /// Run the transport until the peer goes away or shutdown() is called.
    void serve(std::unique_ptr<ITransport> transport);
    void serve_stdio();
    void serve_http(const std::string& host, uint16_t port);

    /// Ask the active transport to stop; safe from any thread.
    void shutdown();

    [[nodiscard]] bool is_running() const;
    [[nodiscard]] const Session& session() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ranger
