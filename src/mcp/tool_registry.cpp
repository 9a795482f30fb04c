#include <homelib/mcp/tool_registry.hpp>

#include <homelib/core/log.hpp>
#include <homelib/core/result.hpp>

namespace homelib {

namespace {

ToolResult InternalFailure(const std::string& tool, const std::string& what) {
    Error error;
    error.operation = tool;
    error.message = what;
    error.category = ErrorCategory::Internal;
    return ToolResult::Failure(error);
}

} // anonymous namespace

ToolResult ToolResult::Json(const nlohmann::json& data) {
    return ToolResult{
        false, nlohmann::json::array({{{"type", "text"}, {"text", data.dump()}}})};
}

ToolResult ToolResult::Failure(const Error& error) {
    return ToolResult{
        true, nlohmann::json::array({{{"type", "text"}, {"text", error.ToJson()}}})};
}

void ToolRegistry::Register(const std::string& name,
                            const std::string& description,
                            const nlohmann::json& input_schema,
                            ToolHandler handler) {
    schemas_.push_back({name, description, input_schema});
    handlers_[name] = std::move(handler);
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

ToolResult ToolRegistry::Execute(const std::string& name,
                                 const nlohmann::json& params) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return InternalFailure(name, "Unknown tool: " + name);
    }

    try {
        return it->second(params);
    } catch (const std::exception& e) {
        LogError("mcp", "Tool " + name + " threw: " + e.what());
        return InternalFailure(name, std::string("Tool error: ") + e.what());
    }
}

} // namespace homelib
