#include "ranger/transport/http_transport.hpp"
#include "ranger/error.hpp"
#include "ranger/version.hpp"

#include <httplib.h>

#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>

namespace ranger {

namespace {

// Replies produced while a POST is being dispatched on this thread.
thread_local std::vector<std::string>* tl_replies = nullptr;

class ReplyCollector {
public:
    explicit ReplyCollector(std::vector<std::string>& replies) : previous_(tl_replies) {
        tl_replies = &replies;
    }
    ~ReplyCollector() { tl_replies = previous_; }

    ReplyCollector(const ReplyCollector&) = delete;
    ReplyCollector& operator=(const ReplyCollector&) = delete;

private:
    std::vector<std::string>* previous_;
};

std::string generate_uuid() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;
    uint64_t a = dis(gen), b = dis(gen);
    // Format as UUID v4
    a = (a & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    b = (b & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(8)  << (a >> 32);
    oss << "-" << std::setw(4) << ((a >> 16) & 0xFFFF);
    oss << "-" << std::setw(4) << (a & 0xFFFF);
    oss << "-" << std::setw(4) << (b >> 48);
    oss << "-" << std::setw(12) << (b & 0xFFFFFFFFFFFFull);
    return oss.str();
}

bool is_supported_version(const std::string& version) {
    return std::find(SUPPORTED_PROTOCOL_VERSIONS.begin(), SUPPORTED_PROTOCOL_VERSIONS.end(),
                     version) != SUPPORTED_PROTOCOL_VERSIONS.end();
}

bool is_initialize(const JsonRpcMessage& msg) {
    const auto* req = std::get_if<JsonRpcRequest>(&msg);
    return req && req->method == "initialize";
}

void set_json_error(httplib::Response& res, int status, const std::string& message) {
    res.status = status;
    res.set_content(nlohmann::json{{"error", message}}.dump(), "application/json");
}

} // anonymous namespace

HttpServerTransport::HttpServerTransport(Options opts)
    : opts_(std::move(opts))
    , server_(std::make_unique<httplib::Server>()) {
}

HttpServerTransport::~HttpServerTransport() {
    shutdown();
}

bool HttpServerTransport::validate_origin(const std::string& origin) const {
    if (opts_.allowed_origins.empty()) return true;
    return std::find(opts_.allowed_origins.begin(), opts_.allowed_origins.end(), origin)
        != opts_.allowed_origins.end();
}

void HttpServerTransport::setup_routes() {
    server_->Post(opts_.mcp_path, [this](const httplib::Request& req, httplib::Response& res) {
        handle_post(req, res);
    });
    server_->Delete(opts_.mcp_path, [this](const httplib::Request& req, httplib::Response& res) {
        handle_delete(req, res);
    });
    // Server-initiated streams are not offered.
    server_->Get(opts_.mcp_path, [](const httplib::Request&, httplib::Response& res) {
        res.status = 405;
        res.set_header("Allow", "POST, DELETE");
    });
}

void HttpServerTransport::handle_post(const httplib::Request& req, httplib::Response& res) {
    // DNS rebinding protection
    auto origin = req.get_header_value("Origin");
    if (!origin.empty() && !validate_origin(origin)) {
        set_json_error(res, 403, "Invalid origin");
        return;
    }

    auto proto_ver = req.get_header_value("MCP-Protocol-Version");
    if (!proto_ver.empty() && !is_supported_version(proto_ver)) {
        set_json_error(res, 400, "Unsupported protocol version");
        return;
    }

    std::string session_id = req.get_header_value("Mcp-Session-Id");
    if (!session_id.empty()) {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        if (sessions_.count(session_id) == 0) {
            set_json_error(res, 404, "Session not found");
            return;
        }
    }

    auto first = req.body.find_first_not_of(" \t\r\n");
    const bool is_batch = first != std::string::npos && req.body[first] == '[';

    std::vector<std::string> replies;
    try {
        ReplyCollector collect(replies);

        std::vector<JsonRpcMessage> messages;
        bool parsed = true;
        try {
            if (is_batch) {
                messages = Codec::parse_batch(req.body);
            } else {
                messages.push_back(Codec::parse(req.body));
            }
        } catch (const McpParseError&) {
            parsed = false;
            if (error_callback_) error_callback_(std::current_exception());
        }

        if (!parsed) {
            res.status = 400;
            if (!replies.empty()) res.set_content(replies.front(), "application/json");
            return;
        }

        if (session_id.empty()
            && std::any_of(messages.begin(), messages.end(), is_initialize)) {
            session_id = open_session();
            res.set_header("Mcp-Session-Id", session_id);
        }

        for (auto& msg : messages) {
            if (message_callback_) message_callback_(std::move(msg));
        }
    } catch (const std::exception&) {
        if (error_callback_) error_callback_(std::current_exception());
        set_json_error(res, 500, "Internal server error");
        return;
    }

    if (replies.empty()) {
        res.status = 202;
        return;
    }

    std::string body;
    if (is_batch) {
        body = "[";
        for (size_t i = 0; i < replies.size(); ++i) {
            if (i > 0) body += ',';
            body += replies[i];
        }
        body += ']';
    } else {
        body = std::move(replies.back());
    }
    res.status = 200;
    res.set_content(body, "application/json");
}

void HttpServerTransport::handle_delete(const httplib::Request& req, httplib::Response& res) {
    std::string session_id = req.get_header_value("Mcp-Session-Id");
    if (session_id.empty()) {
        res.status = 400;
        return;
    }
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    if (sessions_.erase(session_id) == 0) {
        res.status = 404;
        return;
    }
    session_order_.erase(std::find(session_order_.begin(), session_order_.end(), session_id));
    res.status = 200;
}

std::string HttpServerTransport::open_session() {
    std::string id = generate_uuid();
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    const std::size_t limit = std::max<std::size_t>(opts_.max_sessions, 1);
    while (session_order_.size() >= limit) {
        sessions_.erase(session_order_.front());
        session_order_.pop_front();
    }
    sessions_.insert(id);
    session_order_.push_back(id);
    return id;
}

void HttpServerTransport::start(MessageCallback on_message, ErrorCallback on_error) {
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) {
        throw McpTransportError("Transport already started");
    }

    message_callback_ = std::move(on_message);
    error_callback_ = std::move(on_error);

    setup_routes();

    const std::string endpoint = opts_.host + ":" + std::to_string(opts_.port);
    if (opts_.port == 0) {
        int port = server_->bind_to_any_port(opts_.host);
        if (port < 0) {
            running_ = false;
            throw McpTransportError("Failed to bind HTTP server on " + endpoint);
        }
        bound_port_ = static_cast<uint16_t>(port);
    } else {
        if (!server_->bind_to_port(opts_.host, opts_.port)) {
            running_ = false;
            throw McpTransportError("Failed to bind HTTP server on " + endpoint);
        }
        bound_port_ = opts_.port;
    }

    // A shutdown() that raced the bind must not leave listen() blocking.
    if (shutdown_requested_.load()) {
        running_ = false;
        return;
    }

    bool ok = server_->listen_after_bind();
    running_ = false;
    if (!ok && !shutdown_requested_.load()) {
        throw McpTransportError("HTTP server on " + endpoint + " stopped unexpectedly");
    }
}

void HttpServerTransport::send(const JsonRpcMessage& msg) {
    if (shutdown_requested_.load()) {
        throw McpTransportError("Transport shut down");
    }
    if (tl_replies == nullptr) return;  // no request in flight on this thread
    tl_replies->push_back(Codec::serialize(msg));
}

void HttpServerTransport::shutdown() {
    if (shutdown_requested_.exchange(true)) return;
    server_->stop();
}

bool HttpServerTransport::is_connected() const {
    return running_ && !shutdown_requested_;
}

std::size_t HttpServerTransport::session_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

} // namespace ranger
