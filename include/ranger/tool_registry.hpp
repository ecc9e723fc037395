#pragma once
#include "types.hpp"
#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ranger {

using ToolHandler = std::function<CallToolResult(const nlohmann::json& arguments)>;

/// Identifier -> (definition, handler). Filled once at startup and then
/// handed to the server, which only reads it.
class ToolRegistry {
public:
    /// Register a tool. A tool with the same name is replaced in place.
    void add(ToolDefinition def, ToolHandler handler);

    [[nodiscard]] bool contains(const std::string& name) const;

    /// Handler for `name`, or nullptr when unknown.
    [[nodiscard]] const ToolHandler* find(const std::string& name) const;

    /// Definitions in registration order.
    [[nodiscard]] const std::vector<ToolDefinition>& definitions() const noexcept { return definitions_; }

    [[nodiscard]] std::size_t size() const noexcept { return definitions_.size(); }
    [[nodiscard]] bool empty() const noexcept { return definitions_.empty(); }

private:
    std::vector<ToolDefinition> definitions_;
    std::unordered_map<std::string, ToolHandler> handlers_;
};

} // namespace ranger
