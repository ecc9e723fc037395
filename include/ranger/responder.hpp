#pragma once
#include "arg_value.hpp"
#include "logging.hpp"
#include "timestamp.hpp"
#include "types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ranger {

/// The reply every operation is built from. Note the full-width "！".
constexpr std::string_view RANGER_TEXT = "Ranger！";

/// Shape of the reply; the only input that influences the output text.
enum class ResponseKind {
    Plain,     // "Ranger！"
    Json,      // {"response":"Ranger！","timestamp":"..."}
    Repeated   // "Ranger！ Ranger！ Ranger！"
};

/// Maps a with-options selector to a kind. Unknown selectors are Plain.
ResponseKind response_kind_from_option(std::string_view option);

using Response = std::vector<TextContent>;

/// Answers every invocation with a fixed payload. Each operation logs
/// exactly one INFO record and never fails; arguments other than the
/// option selector are only logged.
class ResponderService {
public:
    struct Options {
        std::string logger_name = "ranger";
        Clock clock = system_clock();
    };

    explicit ResponderService(LogContext& logs);
    ResponderService(LogContext& logs, Options opts);

    Response plain() const;
    Response with_input(const std::optional<std::string>& input_text) const;
    Response json() const;
    Response with_options(const std::string& option_type = "simple") const;
    Response with_params(const std::optional<std::string>& param1,
                         std::optional<int64_t> param2,
                         const std::optional<ArgValue::Map>& param3) const;
    Response any_request(const std::optional<std::string>& request,
                         const ArgValue::Map& extra) const;

    /// Build the reply for a kind without logging.
    [[nodiscard]] std::string render(ResponseKind kind) const;

private:
    Response respond(ResponseKind kind) const;

    Logger logger_;
    Clock clock_;
};

} // namespace ranger
