#include <lazymcp/mcp/mcp_server.hpp>

#include <lazymcp/backend/mcp_connection.hpp>
#include <lazymcp/core/log.hpp>
#include <lazymcp/core/version.hpp>

#include <string>

namespace lazymcp {

namespace {

constexpr const char* kComponent = "mcp";

constexpr const char* kInstructions =
    "Tools are organized in a hierarchy. Call get_tools_in_category with an "
    "empty path to see the top-level categories, drill down by dot-separated "
    "path, then run a tool with execute_tool.";

bool IsToolsCall(const nlohmann::json& message) {
    return message.is_object() && message.contains("id") &&
           message.value("method", "") == "tools/call";
}

} // anonymous namespace

McpServer::McpServer(ToolRegistry registry,
                     std::size_t workers,
                     std::istream& in,
                     std::ostream& out)
    : registry_(std::move(registry)), pool_(workers), in_(in), out_(out) {}

void McpServer::Run() {
    LogInfo(kComponent, "serving " + std::to_string(registry_.Tools().size()) +
                            " tools on stdio with " + std::to_string(pool_.ThreadCount()) +
                            " workers");
    std::string line;
    while (std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) continue;

        auto message = nlohmann::json::parse(line, nullptr, /*allow_exceptions=*/false);
        if (message.is_discarded()) {
            LogWarn(kComponent, "unparseable request line");
            Send(MakeError(nullptr, -32700, "Parse error"));
            continue;
        }

        if (IsToolsCall(message)) {
            bool queued = pool_.Submit([this, message] {
                auto response = HandleMessage(message);
                if (response) {
                    Send(*response);
                }
            });
            if (queued) {
                continue;
            }
        }

        auto response = HandleMessage(message);
        if (response) {
            Send(*response);
        }
    }
    pool_.Shutdown();
    LogInfo(kComponent, "input closed, server stopped");
}

void McpServer::Send(const nlohmann::json& message) {
    auto text = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    std::lock_guard<std::mutex> lock(out_mutex_);
    out_ << text << "\n";
    out_.flush();
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) {
    if (!message.is_object()) {
        return MakeError(nullptr, -32600, "Invalid request");
    }

    // Check for JSON-RPC 2.0.
    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        if (message.contains("id")) {
            return MakeError(message["id"], -32600, "Invalid JSON-RPC version");
        }
        return std::nullopt;
    }

    // Notifications have no "id"; responses to our own requests are not expected.
    if (!message.contains("id") || !message.contains("method")) {
        return std::nullopt;
    }

    const auto& id = message["id"];
    if (!message["method"].is_string()) {
        return MakeError(id, -32600, "Invalid request: 'method' must be a string");
    }
    auto method = message["method"].get<std::string>();
    auto params = message.value("params", nlohmann::json::object());

    if (method == "initialize") {
        return HandleInitialize(params, id);
    } else if (method == "ping") {
        return MakeResult(id, nlohmann::json::object());
    } else if (method == "tools/list") {
        return HandleToolsList(id);
    } else if (method == "tools/call") {
        return HandleToolsCall(params, id);
    } else {
        return MakeError(id, -32601, "Method not found: " + method);
    }
}

nlohmann::json McpServer::HandleInitialize(
    const nlohmann::json& params, const nlohmann::json& id) {
    if (params.is_object() && params.contains("clientInfo") && params["clientInfo"].is_object()) {
        LogInfo(kComponent, "client: " + params["clientInfo"].value("name", "?") + " " +
                                params["clientInfo"].value("version", ""));
    }

    nlohmann::json result;
    result["protocolVersion"] = kMcpProtocolVersion;
    result["capabilities"] = {
        {"tools", nlohmann::json::object()}
    };
    result["serverInfo"] = {
        {"name", "lazymcp"},
        {"version", kVersion}
    };
    result["instructions"] = kInstructions;

    return MakeResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) {
    nlohmann::json tools = nlohmann::json::array();

    for (const auto& schema : registry_.Tools()) {
        tools.push_back({
            {"name", schema.name},
            {"description", schema.description},
            {"inputSchema", schema.input_schema}
        });
    }

    return MakeResult(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(
    const nlohmann::json& params, const nlohmann::json& id) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return MakeError(id, -32602, "Missing 'name' parameter");
    }

    auto tool_name = params["name"].get<std::string>();
    auto arguments = params.value("arguments", nlohmann::json::object());

    if (!registry_.HasTool(tool_name)) {
        return MakeError(id, -32602, "Unknown tool: " + tool_name);
    }

    auto result = registry_.Execute(tool_name, arguments);
    return MakeResult(id, result.ToJson());
}

nlohmann::json McpServer::MakeError(
    const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

nlohmann::json McpServer::MakeResult(
    const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

} // namespace lazymcp
