#include "ranger/json_rpc.hpp"
#include "ranger/version.hpp"
#include <stdexcept>

namespace ranger {

namespace {

nlohmann::json envelope() {
    return nlohmann::json{{"jsonrpc", std::string(JSONRPC_VERSION)}};
}

std::optional<nlohmann::json> optional_member(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) return std::nullopt;
    return *it;
}

} // anonymous namespace

bool operator==(const JsonRpcError& a, const JsonRpcError& b) {
    return a.code == b.code && a.message == b.message && a.data == b.data;
}

bool operator==(const JsonRpcRequest& a, const JsonRpcRequest& b) {
    return a.id == b.id && a.method == b.method && a.params == b.params;
}

bool operator==(const JsonRpcResponse& a, const JsonRpcResponse& b) {
    return a.id == b.id && a.result == b.result && a.error == b.error;
}

bool operator==(const JsonRpcNotification& a, const JsonRpcNotification& b) {
    return a.method == b.method && a.params == b.params;
}

JsonRpcResponse make_error_response(std::optional<RequestId> id, int code,
                                    std::string message) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.error = JsonRpcError{code, std::move(message), std::nullopt};
    return resp;
}

void to_json(nlohmann::json& j, const RequestId& id) {
    if (const auto* n = std::get_if<int64_t>(&id)) {
        j = *n;
    } else {
        j = std::get<std::string>(id);
    }
}

void from_json(const nlohmann::json& j, RequestId& id) {
    if (j.is_number_integer()) {
        id = j.get<int64_t>();
    } else if (j.is_string()) {
        id = j.get<std::string>();
    } else {
        throw std::invalid_argument("RequestId must be integer or string");
    }
}

void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = {{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

void from_json(const nlohmann::json& j, JsonRpcError& e) {
    j.at("code").get_to(e.code);
    j.at("message").get_to(e.message);
    e.data = optional_member(j, "data");
}

void to_json(nlohmann::json& j, const JsonRpcRequest& r) {
    j = envelope();
    to_json(j["id"], r.id);
    j["method"] = r.method;
    if (r.params) j["params"] = *r.params;
}

void from_json(const nlohmann::json& j, JsonRpcRequest& r) {
    from_json(j.at("id"), r.id);
    j.at("method").get_to(r.method);
    r.params = optional_member(j, "params");
}

void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    j = envelope();
    j["id"] = nullptr;
    if (r.id) to_json(j["id"], *r.id);
    if (r.error) {
        j["error"] = *r.error;
    } else {
        j["result"] = r.result.value_or(nlohmann::json::object());
    }
}

void from_json(const nlohmann::json& j, JsonRpcResponse& r) {
    r.id.reset();
    auto id = j.find("id");
    if (id != j.end() && !id->is_null()) {
        RequestId value;
        from_json(*id, value);
        r.id = std::move(value);
    }
    r.result = optional_member(j, "result");
    r.error.reset();
    if (auto err = optional_member(j, "error")) r.error = err->get<JsonRpcError>();
}

void to_json(nlohmann::json& j, const JsonRpcNotification& n) {
    j = envelope();
    j["method"] = n.method;
    if (n.params) j["params"] = *n.params;
}

void from_json(const nlohmann::json& j, JsonRpcNotification& n) {
    j.at("method").get_to(n.method);
    n.params = optional_member(j, "params");
}

void to_json(nlohmann::json& j, const JsonRpcMessage& m) {
    std::visit([&j](const auto& v) { to_json(j, v); }, m);
}

} // namespace ranger
