#pragma once
#include "config.hpp"
#include "logging.hpp"
#include "responder.hpp"
#include "server.hpp"
#include "transport/transport.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace ranger {

/// Parse the command line (excluding argv[0]) into `config`. Returns the
/// process exit code when there is nothing to serve: 0 after --help with
/// the usage on `out`, 2 after a bad option with the usage on `err`.
std::optional<int> load_config(const std::vector<std::string>& args,
                               const std::string& program,
                               std::ostream& out, std::ostream& err,
                               ServerConfig& config);

/// The ranger_mcp_server process minus its signal handling: wires the
/// logger, the tools and the server, prints the banners and maps the
/// outcome to an exit code.
class ServerApp {
public:
    /// Log records go to `sink`, or as JSON lines to `err` when none is given.
    ServerApp(ServerConfig config, std::ostream& err,
              std::shared_ptr<ILogSink> sink = nullptr);

    ServerApp(const ServerApp&) = delete;
    ServerApp& operator=(const ServerApp&) = delete;

    /// Serve on the transport named by the config. Returns 0 when the peer
    /// went away or interrupt() was called, 1 when the server failed.
    int run();
    int run(std::unique_ptr<ITransport> transport);

    /// Stop a running (or about to run) server; safe from any thread.
    void interrupt();

    [[nodiscard]] bool interrupted() const noexcept { return interrupted_; }
    [[nodiscard]] McpServer& server() { return *server_; }
    [[nodiscard]] LogContext& logs() { return logs_; }

private:
    int serve(std::unique_ptr<ITransport> transport);

    ServerConfig config_;
    std::ostream& err_;
    LogContext logs_;
    Logger log_;
    ResponderService responder_;
    std::unique_ptr<McpServer> server_;
    std::atomic<bool> interrupted_{false};
};

} // namespace ranger
