#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace ranger {

/// JSON-RPC ids are integers or strings; fractional and null ids are
/// rejected when parsing.
using RequestId = std::variant<int64_t, std::string>;

struct JsonRpcError {
    int code = 0;
    std::string message;
    std::optional<nlohmann::json> data;
};

struct JsonRpcRequest {
    RequestId id;
    std::string method;
    std::optional<nlohmann::json> params;
};

/// A response whose id is absent carries a null id on the wire; this only
/// happens for errors raised before the request id could be read.
/// Exactly one of result and error is written; a response with neither
/// is sent as an empty result.
struct JsonRpcResponse {
    std::optional<RequestId> id;
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;
};

struct JsonRpcNotification {
    std::string method;
    std::optional<nlohmann::json> params;
};

using JsonRpcMessage = std::variant<JsonRpcRequest, JsonRpcResponse, JsonRpcNotification>;

bool operator==(const JsonRpcError& a, const JsonRpcError& b);
bool operator==(const JsonRpcRequest& a, const JsonRpcRequest& b);
bool operator==(const JsonRpcResponse& a, const JsonRpcResponse& b);
bool operator==(const JsonRpcNotification& a, const JsonRpcNotification& b);

JsonRpcResponse make_error_response(std::optional<RequestId> id, int code,
                                    std::string message);

void to_json(nlohmann::json& j, const RequestId& id);
/// Throws std::invalid_argument unless `j` is an integer or a string.
void from_json(const nlohmann::json& j, RequestId& id);

void to_json(nlohmann::json& j, const JsonRpcError& e);
void from_json(const nlohmann::json& j, JsonRpcError& e);

void to_json(nlohmann::json& j, const JsonRpcRequest& r);
void from_json(const nlohmann::json& j, JsonRpcRequest& r);

void to_json(nlohmann::json& j, const JsonRpcResponse& r);
void from_json(const nlohmann::json& j, JsonRpcResponse& r);

void to_json(nlohmann::json& j, const JsonRpcNotification& n);
void from_json(const nlohmann::json& j, JsonRpcNotification& n);

void to_json(nlohmann::json& j, const JsonRpcMessage& m);

} // namespace ranger
