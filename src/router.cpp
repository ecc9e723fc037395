#include "ranger/router.hpp"
#include "ranger/error.hpp"

namespace ranger {

void Router::on_request(const std::string& method, RequestHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    request_handlers_[method] = std::move(handler);
}

void Router::on_notification(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    notification_handlers_[method] = std::move(handler);
}

void Router::on_notification_error(NotificationErrorHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    notification_error_handler_ = std::move(handler);
}

bool Router::has_handler(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return request_handlers_.count(method) > 0 || notification_handlers_.count(method) > 0;
}

std::optional<JsonRpcMessage> Router::dispatch(const JsonRpcMessage& msg) {
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        RequestHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = request_handlers_.find(req->method);
            if (it == request_handlers_.end()) {
                return make_error_response(req->id, error::MethodNotFound,
                                           "Method not found: " + req->method);
            }
            handler = it->second;
        }

        nlohmann::json params = req->params ? *req->params : nlohmann::json::object();
        // Handlers run unlocked so they may register further handlers.
        try {
            auto result = handler(params);

            JsonRpcResponse resp;
            resp.id = req->id;
            if (auto* ok = std::get_if<nlohmann::json>(&result)) {
                resp.result = std::move(*ok);
            } else {
                resp.error = std::get<JsonRpcError>(std::move(result));
            }
            return resp;
        } catch (const McpProtocolError& e) {
            return make_error_response(req->id, e.code, e.what());
        } catch (const nlohmann::json::exception& e) {
            return make_error_response(req->id, error::InvalidParams, e.what());
        } catch (const std::exception& e) {
            return make_error_response(req->id, error::InternalError, e.what());
        }
    }

    if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        NotificationHandler handler;
        NotificationErrorHandler on_error;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = notification_handlers_.find(notif->method);
            if (it == notification_handlers_.end()) return std::nullopt;
            handler = it->second;
            on_error = notification_error_handler_;
        }

        nlohmann::json params = notif->params ? *notif->params : nlohmann::json::object();
        try {
            handler(params);
        } catch (const std::exception& e) {
            if (on_error) on_error(notif->method, e);
        }
        return std::nullopt;
    }

    // Responses never reach the router; this server issues no requests.
    return std::nullopt;
}

} // namespace ranger
