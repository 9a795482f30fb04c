#pragma once

#include <homelib/mcp/tool_registry.hpp>

#include <iostream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace homelib {

// ---------------------------------------------------------------------------
// McpServer — MCP 2024-11-05 server over stdin/stdout.
//
// One JSON-RPC 2.0 message per line. Methods:
//   - initialize
//   - ping
//   - tools/list
//   - tools/call
//   - notifications/* (no response)
// ---------------------------------------------------------------------------
class McpServer {
public:
    explicit McpServer(ToolRegistry registry,
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout);

    // Blocks until EOF on the input stream.
    void Run();

    // Returns nullopt for notifications.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

    [[nodiscard]] bool Initialized() const noexcept { return initialized_; }

private:
    // Method handlers share one signature so HandleMessage can table them.
    nlohmann::json HandleInitialize(const nlohmann::json& params, const nlohmann::json& id);
    nlohmann::json HandlePing(const nlohmann::json& params, const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& params, const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const nlohmann::json& params, const nlohmann::json& id);
    static nlohmann::json MakeError(const nlohmann::json& id,
                                    int code, const std::string& message);
    static nlohmann::json MakeResult(const nlohmann::json& id,
                                     const nlohmann::json& result);

    ToolRegistry registry_;
    std::istream& in_;
    std::ostream& out_;
    bool initialized_ = false;
};

} // namespace homelib
