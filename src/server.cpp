#include "ranger/server.hpp"
#include "ranger/error.hpp"
#include "ranger/router.hpp"
#include "ranger/version.hpp"
#include "ranger/transport/stdio_transport.hpp"
#include "ranger/transport/http_transport.hpp"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace ranger {

namespace {

// Cursors are decimal offsets into the definition list.
template <typename T>
PaginatedResult<T> page(const std::vector<T>& items, size_t page_size,
                        const std::optional<std::string>& cursor) {
    size_t start = 0;
    if (cursor) {
        const bool digits = !cursor->empty()
            && std::all_of(cursor->begin(), cursor->end(),
                           [](char c) { return c >= '0' && c <= '9'; });
        if (!digits || cursor->size() > 18) {
            throw McpProtocolError(error::InvalidParams, "Invalid cursor: " + *cursor);
        }
        start = static_cast<size_t>(std::stoull(*cursor));
    }

    PaginatedResult<T> result;
    if (start >= items.size()) return result;
    size_t end = std::min(start + page_size, items.size());
    result.items.assign(items.begin() + static_cast<std::ptrdiff_t>(start),
                        items.begin() + static_cast<std::ptrdiff_t>(end));
    if (end < items.size()) result.next_cursor = std::to_string(end);
    return result;
}

std::string negotiate_protocol_version(const std::string& requested) {
    auto it = std::find(SUPPORTED_PROTOCOL_VERSIONS.begin(), SUPPORTED_PROTOCOL_VERSIONS.end(),
                        requested);
    if (it != SUPPORTED_PROTOCOL_VERSIONS.end()) return requested;
    return std::string(PROTOCOL_VERSION);
}

} // anonymous namespace

// ----------- McpServer::Impl -----------

struct McpServer::Impl {
    Options opts;
    ToolRegistry tools;
    LogContext& log_context;
    Logger log;
    Session session;
    Router router;

    // Transport reference for sending outbound messages
    ITransport* transport{nullptr};
    std::mutex transport_mutex;

    std::atomic<bool> running{false};
    std::atomic<bool> shutdown_requested{false};

    Impl(Options o, ToolRegistry t, LogContext& ctx)
        : opts(std::move(o))
        , tools(std::move(t))
        , log_context(ctx)
        , log(ctx.logger("ranger.server")) {
        if (opts.page_size == 0) opts.page_size = 1;
    }

    void send_message(const JsonRpcMessage& msg) {
        std::lock_guard<std::mutex> lock(transport_mutex);
        if (!transport) return;
        try {
            transport->send(msg);
        } catch (const McpTransportError& e) {
            log.debug("Reply dropped", {{"reason", e.what()}});
        }
    }

    ServerCapabilities build_capabilities() const {
        ServerCapabilities caps;
        caps.tools = nlohmann::json{{"listChanged", false}};
        caps.logging = nlohmann::json::object();
        return caps;
    }

    void setup_handlers() {
        router.on_notification_error([this](const std::string& method, const std::exception& e) {
            log.warning("Notification handler failed", {{"method", method}, {"error", e.what()}});
        });

        // initialize
        router.on_request("initialize", [this](const nlohmann::json& params) -> HandlerResult {
            std::optional<Implementation> client_info;
            if (params.contains("clientInfo")) {
                client_info = params.at("clientInfo").get<Implementation>();
            }
            ClientCapabilities client_caps;
            if (params.contains("capabilities")) {
                client_caps = params.at("capabilities").get<ClientCapabilities>();
            }

            std::string requested = params.value("protocolVersion", std::string());
            std::string negotiated = negotiate_protocol_version(requested);
            session.begin(negotiated, client_info, std::move(client_caps));

            log.debug("Session initializing", {
                {"protocolVersion", negotiated},
                {"client", client_info ? nlohmann::json(client_info->name) : nlohmann::json()}
            });

            InitializeResult result;
            result.protocol_version = negotiated;
            result.capabilities = build_capabilities();
            result.server_info = opts.server_info;
            result.instructions = opts.instructions;

            nlohmann::json j;
            to_json(j, result);
            return j;
        });

        // notifications/initialized
        router.on_notification("notifications/initialized", [this](const nlohmann::json&) {
            session.set_state(SessionState::Ready);
        });

        // ping
        router.on_request("ping", [](const nlohmann::json&) -> HandlerResult {
            return nlohmann::json::object();
        });

        // tools/list
        router.on_request("tools/list", [this](const nlohmann::json& params) -> HandlerResult {
            std::optional<std::string> cursor;
            if (params.contains("cursor") && !params.at("cursor").is_null()) {
                cursor = params.at("cursor").get<std::string>();
            }
            auto paged = page(tools.definitions(), opts.page_size, cursor);
            nlohmann::json result = {{"tools", paged.items}};
            if (paged.next_cursor) result["nextCursor"] = *paged.next_cursor;
            return result;
        });

        // tools/call
        router.on_request("tools/call", [this](const nlohmann::json& params) -> HandlerResult {
            if (!params.contains("name") || !params.at("name").is_string()) {
                return JsonRpcError{error::InvalidParams, "Missing tool name", std::nullopt};
            }
            std::string name = params.at("name").get<std::string>();
            nlohmann::json arguments = params.value("arguments", nlohmann::json::object());

            const ToolHandler* handler = tools.find(name);
            if (!handler) {
                return JsonRpcError{error::InvalidParams, "Unknown tool: " + name, std::nullopt};
            }

            CallToolResult tool_result;
            try {
                tool_result = (*handler)(arguments);
            } catch (const std::exception& e) {
                log.error("Tool call failed", {{"tool", name}}, std::string(e.what()));
                tool_result = CallToolResult{};
                tool_result.is_error = true;
                tool_result.content.push_back(TextContent{e.what()});
            }
            nlohmann::json j;
            to_json(j, tool_result);
            return j;
        });

        // logging/setLevel
        router.on_request("logging/setLevel", [this](const nlohmann::json& params) -> HandlerResult {
            LogLevel level = LogLevel::Info;
            try {
                from_json(params.at("level"), level);
            } catch (const std::invalid_argument& e) {
                return JsonRpcError{error::InvalidParams, e.what(), std::nullopt};
            }
            log_context.set_min_level(level);
            return nlohmann::json::object();
        });

        // notifications/cancelled: every request completes synchronously,
        // so there is never anything in flight to cancel.
        router.on_notification("notifications/cancelled", [](const nlohmann::json&) {});
    }

    std::optional<JsonRpcMessage> on_message(const JsonRpcMessage& msg) {
        if (std::holds_alternative<JsonRpcResponse>(msg)) {
            log.debug("Ignoring unsolicited response");
            return std::nullopt;
        }
        return router.dispatch(msg);
    }

    void on_error(std::exception_ptr error) {
        if (!error) return;
        try {
            std::rethrow_exception(error);
        } catch (const McpParseError& e) {
            log.warning("Rejected malformed message", {{"code", e.code}, {"error", e.what()}});
            send_message(make_error_response(std::nullopt, e.code, e.what()));
        } catch (const std::exception& e) {
            log.error("Transport error", nlohmann::json::object(), std::string(e.what()));
        }
    }
};

// ----------- McpServer -----------

McpServer::McpServer(Options opts, ToolRegistry tools, LogContext& log)
    : impl_(std::make_unique<Impl>(std::move(opts), std::move(tools), log)) {
    impl_->setup_handlers();
}

McpServer::~McpServer() = default;

std::optional<JsonRpcMessage> McpServer::handle(const JsonRpcMessage& msg) {
    return impl_->on_message(msg);
}

void McpServer::serve(std::unique_ptr<ITransport> transport) {
    if (!transport) {
        throw std::invalid_argument("serve() needs a transport");
    }
    if (impl_->running.exchange(true)) {
        throw McpError("Server is already running");
    }

    auto* t = transport.get();
    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = t;
    }
    // shutdown() may have been called before the transport was attached.
    if (impl_->shutdown_requested) t->shutdown();

    try {
        t->start(
            [this](JsonRpcMessage msg) {
                auto reply = impl_->on_message(msg);
                if (reply) impl_->send_message(*reply);
            },
            [this](std::exception_ptr error) { impl_->on_error(error); });
    } catch (const std::exception&) {
        {
            std::lock_guard<std::mutex> lock(impl_->transport_mutex);
            impl_->transport = nullptr;
        }
        impl_->running = false;
        impl_->session.set_state(SessionState::Closed);
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = nullptr;
    }
    impl_->running = false;
    impl_->session.set_state(SessionState::Closed);
}

void McpServer::serve_stdio() {
    serve(std::make_unique<StdioTransport>());
}

void McpServer::serve_http(const std::string& host, uint16_t port) {
    HttpServerTransport::Options opts;
    opts.host = host;
    opts.port = port;
    serve(std::make_unique<HttpServerTransport>(opts));
}

void McpServer::shutdown() {
    impl_->shutdown_requested = true;
    std::lock_guard<std::mutex> lock(impl_->transport_mutex);
    if (impl_->transport) {
        impl_->transport->shutdown();
    }
}

bool McpServer::is_running() const {
    return impl_->running;
}

const Session& McpServer::session() const {
    return impl_->session;
}

} // namespace ranger
