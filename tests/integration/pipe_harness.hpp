#pragma once
#include "ranger/ranger.hpp"
#include <unistd.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

namespace ranger::testing {

/// Runs an McpServer over a StdioTransport bound to two pipes and talks
/// to it with raw JSON lines, the way an MCP client process would.
class PipeHarness {
public:
    explicit PipeHarness(size_t page_size = 50)
        : sink_(std::make_shared<MemoryLogSink>())
        , logs_(sink_)
        , responder_(logs_) {
        ToolRegistry tools;
        register_ranger_tools(tools, responder_);

        McpServer::Options opts;
        opts.server_info = Implementation{"ranger server", std::nullopt, std::string(SERVER_VERSION)};
        opts.page_size = page_size;
        server_ = std::make_unique<McpServer>(opts, std::move(tools), logs_);

        int c2s[2];
        int s2c[2];
        if (::pipe(c2s) < 0 || ::pipe(s2c) < 0) {
            throw std::runtime_error("pipe failed");
        }
        to_server_ = c2s[1];
        from_server_ = s2c[0];

        auto transport = std::make_unique<StdioTransport>(c2s[0], s2c[1]);
        server_thread_ = std::thread([this, t = std::move(transport)]() mutable {
            server_->serve(std::move(t));
        });
    }

    ~PipeHarness() {
        close_input();
        if (server_thread_.joinable()) server_thread_.join();
        if (from_server_ >= 0) ::close(from_server_);
    }

    PipeHarness(const PipeHarness&) = delete;
    PipeHarness& operator=(const PipeHarness&) = delete;

    void send_line(const std::string& line) {
        std::string framed = line + "\n";
        const char* data = framed.data();
        size_t remaining = framed.size();
        while (remaining > 0) {
            ssize_t n = ::write(to_server_, data, remaining);
            if (n < 0) throw std::runtime_error("write to server failed");
            data += n;
            remaining -= static_cast<size_t>(n);
        }
    }

    void send(const nlohmann::json& message) { send_line(message.dump()); }

    /// Next line from the server, parsed. Throws at EOF.
    nlohmann::json receive() {
        size_t nl;
        while ((nl = buffer_.find('\n')) == std::string::npos) {
            char chunk[4096];
            ssize_t n = ::read(from_server_, chunk, sizeof(chunk));
            if (n <= 0) throw std::runtime_error("server closed its output");
            buffer_.append(chunk, static_cast<size_t>(n));
        }
        std::string line = buffer_.substr(0, nl);
        buffer_.erase(0, nl + 1);
        return nlohmann::json::parse(line);
    }

    nlohmann::json request(int64_t id, const std::string& method,
                           nlohmann::json params = nlohmann::json::object()) {
        send({{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", std::move(params)}});
        return receive();
    }

    nlohmann::json call_tool(int64_t id, const std::string& name,
                             nlohmann::json arguments = nlohmann::json::object()) {
        return request(id, "tools/call", {{"name", name}, {"arguments", std::move(arguments)}});
    }

    nlohmann::json initialize(const std::string& protocol_version = "2025-06-18") {
        auto reply = request(0, "initialize", {
            {"protocolVersion", protocol_version},
            {"capabilities", nlohmann::json::object()},
            {"clientInfo", {{"name", "pipe-harness"}, {"version", "1.0"}}}
        });
        send({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
        return reply;
    }

    /// Send EOF; the server's serve loop ends once it has read everything.
    void close_input() {
        if (to_server_ >= 0) ::close(to_server_);
        to_server_ = -1;
    }

    void wait_for_exit() {
        close_input();
        if (server_thread_.joinable()) server_thread_.join();
    }

    McpServer& server() { return *server_; }
    MemoryLogSink& logs() { return *sink_; }

private:
    std::shared_ptr<MemoryLogSink> sink_;
    LogContext logs_;
    ResponderService responder_;
    std::unique_ptr<McpServer> server_;
    std::thread server_thread_;
    int to_server_{-1};
    int from_server_{-1};
    std::string buffer_;
};

} // namespace ranger::testing
