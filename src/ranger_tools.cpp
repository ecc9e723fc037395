#include "ranger/ranger_tools.hpp"
#include <cmath>
#include <limits>

namespace ranger {

namespace decode {

namespace {

const nlohmann::json* lookup(const nlohmann::json& arguments, const std::string& key) {
    if (!arguments.is_object()) return nullptr;
    auto it = arguments.find(key);
    if (it == arguments.end() || it->is_null()) return nullptr;
    return &*it;
}

} // anonymous namespace

std::optional<std::string> optional_string(const nlohmann::json& arguments, const std::string& key) {
    const auto* value = lookup(arguments, key);
    if (!value) return std::nullopt;
    if (value->is_string()) return value->get<std::string>();
    return value->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<int64_t> optional_integer(const nlohmann::json& arguments, const std::string& key) {
    const auto* value = lookup(arguments, key);
    if (!value) return std::nullopt;
    if (value->is_number_integer() && !value->is_number_unsigned()) {
        return value->get<int64_t>();
    }
    if (value->is_number_unsigned()) {
        const auto u = value->get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return std::nullopt;
        return static_cast<int64_t>(u);
    }
    if (value->is_number_float()) {
        const double d = std::trunc(value->get<double>());
        if (!std::isfinite(d)
            || d < static_cast<double>(std::numeric_limits<int64_t>::min())
            || d >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<int64_t>(d);
    }
    if (value->is_boolean()) return value->get<bool>() ? 1 : 0;
    return std::nullopt;
}

std::optional<ArgValue::Map> optional_map(const nlohmann::json& arguments, const std::string& key) {
    const auto* value = lookup(arguments, key);
    if (!value || !value->is_object()) return std::nullopt;
    return ArgValue::map_from_json(*value);
}

ArgValue::Map remaining(const nlohmann::json& arguments, const std::string& except_key) {
    ArgValue::Map extra;
    if (!arguments.is_object()) return extra;
    for (auto it = arguments.begin(); it != arguments.end(); ++it) {
        if (it.key() == except_key) continue;
        extra.emplace(it.key(), ArgValue::from_json(it.value()));
    }
    return extra;
}

} // namespace decode

namespace {

nlohmann::json nullable(const char* type) {
    return {{"anyOf", nlohmann::json::array({{{"type", type}}, {{"type", "null"}}})},
            {"default", nullptr}};
}

nlohmann::json object_schema(nlohmann::json properties = nlohmann::json::object()) {
    return {{"type", "object"}, {"properties", std::move(properties)}};
}

ToolDefinition make_definition(const char* name, const char* description, nlohmann::json schema) {
    ToolDefinition def;
    def.name = name;
    def.description = description;
    def.input_schema = std::move(schema);
    def.annotations = nlohmann::json{{"readOnlyHint", true}, {"idempotentHint", true}};
    return def;
}

CallToolResult to_result(Response content) {
    CallToolResult result;
    result.content = std::move(content);
    return result;
}

} // anonymous namespace

void register_ranger_tools(ToolRegistry& registry, const ResponderService& responder) {
    const ResponderService* r = &responder;

    registry.add(
        make_definition(tool_names::Plain,
            "A tool that responds with \"Ranger!\" to any question or request.",
            object_schema()),
        [r](const nlohmann::json&) { return to_result(r->plain()); });

    registry.add(
        make_definition(tool_names::WithInput,
            "A tool that accepts user input but always responds with \"Ranger!\".",
            object_schema({{"input_text", {{"type", "string"},
                                           {"description", "Input text from the user."}}}})),
        [r](const nlohmann::json& args) {
            return to_result(r->with_input(decode::optional_string(args, "input_text")));
        });

    registry.add(
        make_definition(tool_names::Json,
            "A tool that responds with \"Ranger!\" in JSON format.",
            object_schema()),
        [r](const nlohmann::json&) { return to_result(r->json()); });

    registry.add(
        make_definition(tool_names::WithOptions,
            "A tool that returns variations of the Ranger response based on different "
            "options ('simple', 'json', 'extended').",
            object_schema({{"option_type", {{"type", "string"},
                                            {"default", "simple"},
                                            {"description", "Response option."}}}})),
        [r](const nlohmann::json& args) {
            auto option = decode::optional_string(args, "option_type");
            return to_result(option ? r->with_options(*option) : r->with_options());
        });

    registry.add(
        make_definition(tool_names::WithParams,
            "A tool that accepts parameters but ignores them and always responds "
            "with \"Ranger!\".",
            object_schema({{"param1", nullable("string")},
                           {"param2", nullable("integer")},
                           {"param3", nullable("object")}})),
        [r](const nlohmann::json& args) {
            return to_result(r->with_params(decode::optional_string(args, "param1"),
                                            decode::optional_integer(args, "param2"),
                                            decode::optional_map(args, "param3")));
        });

    auto catch_all_schema = object_schema({{"request", nullable("string")}});
    catch_all_schema["additionalProperties"] = true;
    registry.add(
        make_definition(tool_names::CatchAll,
            "A generic tool that responds with \"Ranger!\" to any request.",
            std::move(catch_all_schema)),
        [r](const nlohmann::json& args) {
            return to_result(r->any_request(decode::optional_string(args, "request"),
                                            decode::remaining(args, "request")));
        });
}

} // namespace ranger
