#include "ranger/responder.hpp"

namespace ranger {

namespace {

nlohmann::json optional_field(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // anonymous namespace

ResponseKind response_kind_from_option(std::string_view option) {
    if (option == "json") return ResponseKind::Json;
    if (option == "extended") return ResponseKind::Repeated;
    return ResponseKind::Plain;
}

ResponderService::ResponderService(LogContext& logs)
    : ResponderService(logs, Options{}) {}

ResponderService::ResponderService(LogContext& logs, Options opts)
    : logger_(logs.logger(std::move(opts.logger_name)))
    , clock_(opts.clock ? std::move(opts.clock) : system_clock()) {}

std::string ResponderService::render(ResponseKind kind) const {
    const std::string text(RANGER_TEXT);
    switch (kind) {
        case ResponseKind::Json: {
            nlohmann::json body = {
                {"response", text},
                {"timestamp", format_iso8601(clock_())}
            };
            return body.dump();
        }
        case ResponseKind::Repeated:
            return text + " " + text + " " + text;
        case ResponseKind::Plain:
        default:
            return text;
    }
}

Response ResponderService::respond(ResponseKind kind) const {
    return Response{TextContent{render(kind)}};
}

Response ResponderService::plain() const {
    logger_.info("ranger function was called");
    return respond(ResponseKind::Plain);
}

Response ResponderService::with_input(const std::optional<std::string>& input_text) const {
    logger_.info("ranger_with_input function was called",
                 {{"input", optional_field(input_text)}});
    return respond(ResponseKind::Plain);
}

Response ResponderService::json() const {
    logger_.info("ranger_json function was called");
    return respond(ResponseKind::Json);
}

Response ResponderService::with_options(const std::string& option_type) const {
    logger_.info("ranger_with_options function was called", {{"option", option_type}});
    return respond(response_kind_from_option(option_type));
}

Response ResponderService::with_params(const std::optional<std::string>& param1,
                                       std::optional<int64_t> param2,
                                       const std::optional<ArgValue::Map>& param3) const {
    logger_.info("ranger_with_params was called", {
        {"param1", optional_field(param1)},
        {"param2", param2 ? nlohmann::json(*param2) : nlohmann::json(nullptr)},
        {"param3", param3 ? to_display_string(*param3) : std::string("null")}
    });
    return respond(ResponseKind::Plain);
}

Response ResponderService::any_request(const std::optional<std::string>& request,
                                       const ArgValue::Map& extra) const {
    logger_.info("any_request was called", {
        {"request", optional_field(request)},
        {"args", to_display_string(extra)}
    });
    return respond(ResponseKind::Plain);
}

} // namespace ranger
