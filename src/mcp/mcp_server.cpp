#include <homelib/mcp/mcp_server.hpp>

#include <homelib/core/log.hpp>
#include <homelib/core/version.hpp>

#include <map>
#include <optional>
#include <string>

namespace homelib {

namespace {

// JSON-RPC 2.0 error codes.
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

constexpr const char* kProtocolVersion = "2024-11-05";

} // anonymous namespace

McpServer::McpServer(ToolRegistry registry,
                     std::istream& in,
                     std::ostream& out)
    : registry_(std::move(registry)), in_(in), out_(out) {}

void McpServer::Run() {
    LogInfo("mcp", "Serving " + std::to_string(registry_.Tools().size()) + " tool(s) on stdio");
    std::string line;
    while (std::getline(in_, line)) {
        if (line.empty()) continue;

        std::optional<nlohmann::json> response;
        try {
            response = HandleMessage(nlohmann::json::parse(line));
        } catch (const nlohmann::json::parse_error& e) {
            LogWarn("mcp", std::string("Unparseable message: ") + e.what());
            response = MakeError(nullptr, kParseError, "Parse error");
        } catch (const nlohmann::json::exception& e) {
            LogError("mcp", std::string("Malformed message: ") + e.what());
            response = MakeError(nullptr, kInternalError, "Internal error");
        }
        if (response) {
            out_ << response->dump() << "\n";
            out_.flush();
        }
    }
    LogInfo("mcp", "Input closed, shutting down");
}

// A request carries an id and gets exactly one response. A notification
// (no id) and an invalid envelope without an id get none.
std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) {
    if (!message.is_object()) {
        return MakeError(nullptr, kInvalidRequest, "Request must be a JSON object");
    }
    const bool is_request = message.contains("id");
    auto version = message.find("jsonrpc");
    if (version == message.end() || *version != "2.0") {
        if (!is_request) return std::nullopt;
        return MakeError(message["id"], kInvalidRequest, "Invalid JSON-RPC version");
    }

    auto method_it = message.find("method");
    const std::string method =
        method_it != message.end() && method_it->is_string() ? method_it->get<std::string>() : "";
    if (!is_request) {
        LogDebug("mcp", "Notification " + method);
        return std::nullopt;
    }

    using Handler = nlohmann::json (McpServer::*)(const nlohmann::json&, const nlohmann::json&);
    static const std::map<std::string, Handler> kMethods = {
        {"initialize", &McpServer::HandleInitialize},
        {"ping", &McpServer::HandlePing},
        {"tools/list", &McpServer::HandleToolsList},
        {"tools/call", &McpServer::HandleToolsCall},
    };

    const auto& id = message["id"];
    auto it = kMethods.find(method);
    if (it == kMethods.end()) {
        return MakeError(id, kMethodNotFound, "Method not found: " + method);
    }
    LogDebug("mcp", "Request " + method);
    return (this->*(it->second))(message.value("params", nlohmann::json::object()), id);
}

nlohmann::json McpServer::HandleInitialize(
    const nlohmann::json& params, const nlohmann::json& id) {
    initialized_ = true;
    auto requested = params.contains("protocolVersion") && params["protocolVersion"].is_string()
                         ? params["protocolVersion"].get<std::string>()
                         : std::string();
    if (!requested.empty() && requested != kProtocolVersion) {
        LogInfo("mcp", "Client asked for protocol " + requested + ", offering " +
                           kProtocolVersion);
    }
    return MakeResult(id, {{"protocolVersion", kProtocolVersion},
                           {"capabilities", {{"tools", nlohmann::json::object()}}},
                           {"serverInfo", {{"name", "homelib"}, {"version", kVersion}}}});
}

nlohmann::json McpServer::HandlePing(const nlohmann::json& /*params*/,
                                     const nlohmann::json& id) {
    return MakeResult(id, nlohmann::json::object());
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& /*params*/,
                                          const nlohmann::json& id) {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& schema : registry_.Tools()) {
        tools.push_back({{"name", schema.name},
                         {"description", schema.description},
                         {"inputSchema", schema.input_schema}});
    }
    return MakeResult(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(
    const nlohmann::json& params, const nlohmann::json& id) {
    if (!params.contains("name") || !params["name"].is_string()) {
        return MakeError(id, kInvalidParams, "Missing 'name' parameter");
    }

    auto tool_name = params["name"].get<std::string>();
    auto arguments = params.value("arguments", nlohmann::json::object());

    if (!registry_.HasTool(tool_name)) {
        return MakeError(id, kInvalidParams, "Unknown tool: " + tool_name);
    }

    auto result = registry_.Execute(tool_name, arguments);
    if (result.is_error) {
        LogInfo("mcp", "Tool " + tool_name + " returned an error");
    }

    nlohmann::json response_result;
    response_result["content"] = result.content;
    if (result.is_error) {
        response_result["isError"] = true;
    }
    return MakeResult(id, response_result);
}

nlohmann::json McpServer::MakeError(
    const nlohmann::json& id, int code, const std::string& message) {
    return {{"jsonrpc", "2.0"},
            {"id", id},
            {"error", {{"code", code}, {"message", message}}}};
}

nlohmann::json McpServer::MakeResult(
    const nlohmann::json& id, const nlohmann::json& result) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

} // namespace homelib
