#pragma once

#include <homelib/core/result.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace homelib {

// ---------------------------------------------------------------------------
// ToolSchema — JSON Schema for a tool's input parameters.
// ---------------------------------------------------------------------------
struct ToolSchema {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
};

// ---------------------------------------------------------------------------
// ToolResult — result of executing a tool. `content` is an array of MCP
// content blocks; errors carry the structured Error JSON as text.
// ---------------------------------------------------------------------------
struct ToolResult {
    bool is_error = false;
    nlohmann::json content;

    // One text block holding `data` serialised as JSON.
    static ToolResult Json(const nlohmann::json& data);
    // One text block holding error.ToJson(), flagged as an error.
    static ToolResult Failure(const Error& error);
};

using ToolHandler = std::function<ToolResult(const nlohmann::json& params)>;

// ---------------------------------------------------------------------------
// ToolRegistry — registry of tools, listed in registration order.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    void Register(const std::string& name,
                  const std::string& description,
                  const nlohmann::json& input_schema,
                  ToolHandler handler);

    [[nodiscard]] const std::vector<ToolSchema>& Tools() const noexcept {
        return schemas_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;

    [[nodiscard]] ToolResult Execute(const std::string& name,
                                     const nlohmann::json& params) const;

private:
    std::vector<ToolSchema> schemas_;
    std::map<std::string, ToolHandler> handlers_;
};

} // namespace homelib
