#pragma once
#include "transport.hpp"
#include "../codec.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

// Forward declarations to avoid including heavy httplib header
namespace httplib {
    class Server;
    struct Request;
    struct Response;
}

namespace ranger {

/// Streamable HTTP server transport (request/response subset).
///
/// Every POST carries one JSON-RPC message or a batch. Requests are
/// dispatched on the httplib worker thread that received them, and the
/// replies that the server sends back while dispatching are collected and
/// returned as the HTTP body. Notifications and responses are answered
/// with 202. Server-initiated messages have no stream to travel on and
/// are dropped.
class HttpServerTransport : public ITransport {
public:
    struct Options {
        std::string host = "127.0.0.1";
        uint16_t port = 8000;          // 0 binds an ephemeral port
        std::string mcp_path = "/mcp";
        std::vector<std::string> allowed_origins;  // empty allows any
        /// Live sessions kept at once; the oldest is forgotten first.
        std::size_t max_sessions = 1024;
    };

    explicit HttpServerTransport(Options opts);
    ~HttpServerTransport() override;

    HttpServerTransport(const HttpServerTransport&) = delete;
    HttpServerTransport& operator=(const HttpServerTransport&) = delete;

    void start(MessageCallback on_message, ErrorCallback on_error = nullptr) override;
    void send(const JsonRpcMessage& msg) override;
    void shutdown() override;
    bool is_connected() const override;

    /// Port actually bound; differs from Options::port when that was 0.
    [[nodiscard]] uint16_t port() const noexcept { return bound_port_.load(); }

    [[nodiscard]] std::size_t session_count() const;

private:
    void setup_routes();
    void handle_post(const httplib::Request& req, httplib::Response& res);
    void handle_delete(const httplib::Request& req, httplib::Response& res);
    bool validate_origin(const std::string& origin) const;
    std::string open_session();

    Options opts_;
    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<uint16_t> bound_port_{0};

    mutable std::mutex sessions_mutex_;
    std::set<std::string> sessions_;
    std::deque<std::string> session_order_;  // oldest first

    MessageCallback message_callback_;
    ErrorCallback error_callback_;
};

} // namespace ranger
