#include "ranger/arg_value.hpp"
#include <limits>

namespace ranger {

ArgValue::ArgValue(List list)
    : value_(std::make_shared<const List>(std::move(list))) {}

ArgValue::ArgValue(Map map)
    : value_(std::make_shared<const Map>(std::move(map))) {}

ArgValue ArgValue::from_json(const nlohmann::json& j) {
    switch (j.type()) {
        case nlohmann::json::value_t::null:
            return ArgValue{};
        case nlohmann::json::value_t::boolean:
            return ArgValue{j.get<bool>()};
        case nlohmann::json::value_t::number_integer:
            return ArgValue{j.get<int64_t>()};
        case nlohmann::json::value_t::number_unsigned: {
            const auto u = j.get<uint64_t>();
            if (u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return ArgValue{static_cast<int64_t>(u)};
            }
            return ArgValue{static_cast<double>(u)};
        }
        case nlohmann::json::value_t::number_float:
            return ArgValue{j.get<double>()};
        case nlohmann::json::value_t::string:
            return ArgValue{j.get<std::string>()};
        case nlohmann::json::value_t::array: {
            List list;
            list.reserve(j.size());
            for (const auto& item : j) list.push_back(from_json(item));
            return ArgValue{std::move(list)};
        }
        case nlohmann::json::value_t::object:
            return ArgValue{map_from_json(j)};
        default:
            // binary and discarded values never come off the wire
            return ArgValue{};
    }
}

ArgValue::Map ArgValue::map_from_json(const nlohmann::json& object) {
    Map map;
    if (!object.is_object()) return map;
    for (auto it = object.begin(); it != object.end(); ++it) {
        map.emplace(it.key(), from_json(it.value()));
    }
    return map;
}

nlohmann::json ArgValue::to_json() const {
    struct Visitor {
        nlohmann::json operator()(std::monostate) const { return nullptr; }
        nlohmann::json operator()(bool b) const { return b; }
        nlohmann::json operator()(int64_t v) const { return v; }
        nlohmann::json operator()(double v) const { return v; }
        nlohmann::json operator()(const std::string& s) const { return s; }
        nlohmann::json operator()(const ListPtr& list) const {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : *list) arr.push_back(item.to_json());
            return arr;
        }
        nlohmann::json operator()(const MapPtr& map) const { return map_to_json(*map); }
    };
    return std::visit(Visitor{}, value_);
}

std::string ArgValue::to_display_string() const {
    return to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool ArgValue::operator==(const ArgValue& o) const {
    if (value_.index() != o.value_.index()) return false;
    if (is_list()) return as_list() == o.as_list();
    if (is_map()) return as_map() == o.as_map();
    return value_ == o.value_;
}

nlohmann::json map_to_json(const ArgValue::Map& map) {
    nlohmann::json obj = nlohmann::json::object();
    for (const auto& [key, value] : map) {
        obj[key] = value.to_json();
    }
    return obj;
}

std::string to_display_string(const ArgValue::Map& map) {
    return map_to_json(map).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace ranger
