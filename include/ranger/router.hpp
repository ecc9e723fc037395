#pragma once
#include "json_rpc.hpp"
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

namespace ranger {

using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;
using RequestHandler = std::function<HandlerResult(const nlohmann::json& params)>;
using NotificationHandler = std::function<void(const nlohmann::json& params)>;

/// Called when a notification handler throws; notifications have no reply.
using NotificationErrorHandler =
    std::function<void(const std::string& method, const std::exception& e)>;

class Router {
public:
    /// Register a request handler for a method.
    void on_request(const std::string& method, RequestHandler handler);

    /// Register a notification handler.
    void on_notification(const std::string& method, NotificationHandler handler);

    void on_notification_error(NotificationErrorHandler handler);

    /// Dispatch an incoming request or notification. Returns the response
    /// for requests, std::nullopt otherwise.
    [[nodiscard]] std::optional<JsonRpcMessage> dispatch(const JsonRpcMessage& msg);

    [[nodiscard]] bool has_handler(const std::string& method) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, RequestHandler> request_handlers_;
    std::unordered_map<std::string, NotificationHandler> notification_handlers_;
    NotificationErrorHandler notification_error_handler_;
};

} // namespace ranger
