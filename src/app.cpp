#include "ranger/app.hpp"
#include "ranger/error.hpp"
#include "ranger/ranger_tools.hpp"
#include "ranger/version.hpp"

#include <stdexcept>

namespace ranger {

std::optional<int> load_config(const std::vector<std::string>& args,
                               const std::string& program,
                               std::ostream& out, std::ostream& err,
                               ServerConfig& config) {
    try {
        config = parse_args(args);
    } catch (const ConfigError& e) {
        err << program << ": " << e.what() << "\n\n" << usage(program);
        return 2;
    }
    if (config.show_help) {
        out << usage(program);
        return 0;
    }
    return std::nullopt;
}

ServerApp::ServerApp(ServerConfig config, std::ostream& err, std::shared_ptr<ILogSink> sink)
    : config_(std::move(config))
    , err_(err)
    , logs_(sink ? std::move(sink) : std::make_shared<StreamLogSink>(err), config_.log_level)
    , log_(logs_.logger("ranger"))
    , responder_(logs_) {
    ToolRegistry tools;
    register_ranger_tools(tools, responder_);

    McpServer::Options opts;
    opts.server_info = Implementation{config_.name, std::nullopt, std::string(SERVER_VERSION)};
    server_ = std::make_unique<McpServer>(opts, std::move(tools), logs_);
}

int ServerApp::run() {
    return serve(nullptr);
}

int ServerApp::run(std::unique_ptr<ITransport> transport) {
    if (!transport) {
        throw std::invalid_argument("run() needs a transport");
    }
    return serve(std::move(transport));
}

int ServerApp::serve(std::unique_ptr<ITransport> transport) {
    try {
        log_.info("Starting Ranger MCP server");
        err_ << "MCP server that responds 'Ranger!' to everything has started" << std::endl;

        if (transport) {
            server_->serve(std::move(transport));
        } else if (config_.transport == TransportKind::Http) {
            server_->serve_http(config_.host, config_.port);
        } else {
            server_->serve_stdio();
        }

        if (interrupted_) {
            log_.info("Server stopped by user");
            err_ << "Shutting down Ranger MCP server" << std::endl;
        }
    } catch (const std::exception& e) {
        log_.error("Failed to start server: " + std::string(e.what()),
                   nlohmann::json::object(), std::string(e.what()));
        return 1;
    }
    return 0;
}

void ServerApp::interrupt() {
    interrupted_ = true;
    server_->shutdown();
}

} // namespace ranger
