#include "ranger/tool_registry.hpp"
#include <algorithm>
#include <stdexcept>

namespace ranger {

void ToolRegistry::add(ToolDefinition def, ToolHandler handler) {
    if (def.name.empty()) {
        throw std::invalid_argument("Tool name must not be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Tool '" + def.name + "' has no handler");
    }

    auto it = std::find_if(definitions_.begin(), definitions_.end(),
        [&def](const ToolDefinition& t) { return t.name == def.name; });
    handlers_[def.name] = std::move(handler);
    if (it != definitions_.end()) {
        *it = std::move(def);
    } else {
        definitions_.push_back(std::move(def));
    }
}

bool ToolRegistry::contains(const std::string& name) const {
    return handlers_.count(name) > 0;
}

const ToolHandler* ToolRegistry::find(const std::string& name) const {
    auto it = handlers_.find(name);
    return it == handlers_.end() ? nullptr : &it->second;
}

} // namespace ranger
