#include "ranger/codec.hpp"
#include "ranger/error.hpp"
#include "ranger/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <string>

namespace ranger {

namespace {

nlohmann::json to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            simdjson::ondemand::number_type kind = val.get_number_type();
            if (kind == simdjson::ondemand::number_type::signed_integer) {
                return nlohmann::json(int64_t(val.get_int64()));
            }
            if (kind == simdjson::ondemand::number_type::unsigned_integer) {
                return nlohmann::json(uint64_t(val.get_uint64()));
            }
            return nlohmann::json(double(val.get_double()));
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
        default:
            return nlohmann::json(nullptr);
    }
}

bool is_method_name(const nlohmann::json& j) {
    return j.is_string() && !j.get_ref<const std::string&>().empty();
}

} // anonymous namespace

nlohmann::json Codec::parse_document(std::string_view raw) {
    if (raw.empty()) {
        throw McpParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto err = parser.iterate(padded).get(doc);
    if (err) {
        throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(err));
    }

    // Scalars at the document root are not reachable through get_value().
    simdjson::ondemand::json_type root_type;
    err = doc.type().get(root_type);
    if (err) {
        throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(err));
    }
    if (root_type != simdjson::ondemand::json_type::object
        && root_type != simdjson::ondemand::json_type::array) {
        throw McpParseError("Message must be a JSON object", error::InvalidRequest);
    }

    try {
        simdjson::ondemand::value root;
        err = doc.get_value().get(root);
        if (err) {
            throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(err));
        }
        return to_nlohmann(root);
    } catch (const simdjson::simdjson_error& e) {
        throw McpParseError(std::string("JSON parse error: ") + e.what());
    }
}

JsonRpcMessage Codec::parse_object(const nlohmann::json& j) {
    const auto version = j.find("jsonrpc");
    if (version == j.end()) {
        throw McpParseError("Missing 'jsonrpc' field", error::InvalidRequest);
    }
    if (!version->is_string() || version->get<std::string>() != JSONRPC_VERSION) {
        throw McpParseError("Invalid jsonrpc version, expected '2.0'", error::InvalidRequest);
    }

    const bool has_id = j.contains("id");
    const bool has_method = j.contains("method");

    if (has_method && !is_method_name(j.at("method"))) {
        throw McpParseError("'method' must be a non-empty string", error::InvalidRequest);
    }

    try {
        if (has_method && has_id) {
            if (j.at("id").is_null()) {
                throw McpParseError("Request ID must not be null", error::InvalidRequest);
            }
            return j.get<JsonRpcRequest>();
        }
        if (has_method) {
            return j.get<JsonRpcNotification>();
        }
        if (has_id) {
            if (!j.contains("result") && !j.contains("error")) {
                throw McpParseError("Response carries neither 'result' nor 'error'",
                                    error::InvalidRequest);
            }
            return j.get<JsonRpcResponse>();
        }
    } catch (const McpParseError&) {
        throw;
    } catch (const std::exception& e) {
        throw McpParseError(std::string("Malformed message: ") + e.what(), error::InvalidRequest);
    }
    throw McpParseError("Cannot determine message type: missing both 'id' and 'method'",
                        error::InvalidRequest);
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    nlohmann::json j = parse_document(raw);
    if (!j.is_object()) {
        throw McpParseError("Message must be a JSON object", error::InvalidRequest);
    }
    return parse_object(j);
}

std::vector<JsonRpcMessage> Codec::parse_batch(std::string_view raw) {
    nlohmann::json j = parse_document(raw);
    if (!j.is_array()) {
        throw McpParseError("Batch must be a JSON array", error::InvalidRequest);
    }
    if (j.empty()) {
        throw McpParseError("Batch must not be empty", error::InvalidRequest);
    }

    std::vector<JsonRpcMessage> messages;
    messages.reserve(j.size());
    for (const auto& item : j) {
        if (!item.is_object()) {
            throw McpParseError("Each batch item must be a JSON object", error::InvalidRequest);
        }
        messages.push_back(parse_object(item));
    }
    return messages;
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string Codec::serialize_batch(const std::vector<JsonRpcMessage>& msgs) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& msg : msgs) {
        nlohmann::json j;
        to_json(j, msg);
        arr.push_back(std::move(j));
    }
    return arr.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace ranger
