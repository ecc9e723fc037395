#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace ranger {

/// A loosely typed tool argument: null, boolean, integer, number, string,
/// list or string-keyed mapping. Nested containers are shared and
/// immutable, so copies are cheap.
class ArgValue {
public:
    using List = std::vector<ArgValue>;
    using Map = std::map<std::string, ArgValue>;

    ArgValue() = default;
    ArgValue(std::nullptr_t) {}
    ArgValue(bool b) : value_(b) {}
    ArgValue(int v) : value_(int64_t{v}) {}
    ArgValue(int64_t v) : value_(v) {}
    ArgValue(double v) : value_(v) {}
    ArgValue(const char* s) : value_(std::string(s)) {}
    ArgValue(std::string s) : value_(std::move(s)) {}
    ArgValue(List list);
    ArgValue(Map map);

    /// Every JSON shape maps; unsigned values beyond int64 become doubles.
    static ArgValue from_json(const nlohmann::json& j);
    static Map map_from_json(const nlohmann::json& object);

    [[nodiscard]] nlohmann::json to_json() const;

    /// Compact JSON text of the value.
    [[nodiscard]] std::string to_display_string() const;

    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(value_); }
    [[nodiscard]] bool is_bool() const noexcept { return std::holds_alternative<bool>(value_); }
    [[nodiscard]] bool is_integer() const noexcept { return std::holds_alternative<int64_t>(value_); }
    [[nodiscard]] bool is_double() const noexcept { return std::holds_alternative<double>(value_); }
    [[nodiscard]] bool is_number() const noexcept { return is_integer() || is_double(); }
    [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<std::string>(value_); }
    [[nodiscard]] bool is_list() const noexcept { return std::holds_alternative<ListPtr>(value_); }
    [[nodiscard]] bool is_map() const noexcept { return std::holds_alternative<MapPtr>(value_); }

    // Accessors throw std::bad_variant_access on the wrong kind.
    [[nodiscard]] bool as_bool() const { return std::get<bool>(value_); }
    [[nodiscard]] int64_t as_integer() const { return std::get<int64_t>(value_); }
    [[nodiscard]] double as_double() const { return std::get<double>(value_); }
    [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(value_); }
    [[nodiscard]] const List& as_list() const { return *std::get<ListPtr>(value_); }
    [[nodiscard]] const Map& as_map() const { return *std::get<MapPtr>(value_); }

    bool operator==(const ArgValue& o) const;
    bool operator!=(const ArgValue& o) const { return !(*this == o); }

private:
    using ListPtr = std::shared_ptr<const List>;
    using MapPtr = std::shared_ptr<const Map>;

    std::variant<std::monostate, bool, int64_t, double, std::string, ListPtr, MapPtr> value_;
};

/// Compact JSON text of a whole mapping ("{}" when empty).
std::string to_display_string(const ArgValue::Map& map);

nlohmann::json map_to_json(const ArgValue::Map& map);

} // namespace ranger
