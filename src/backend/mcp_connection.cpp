#include <lazymcp/backend/mcp_connection.hpp>

#include <lazymcp/core/log.hpp>
#include <lazymcp/core/version.hpp>

namespace lazymcp {

namespace {

constexpr const char* kComponent = "mcp-client";

// First text block of a CallToolResult, for a one-line error message.
std::string FirstText(const nlohmann::json& result) {
    if (result.contains("content") && result["content"].is_array()) {
        for (const auto& block : result["content"]) {
            if (block.is_object() && block.value("type", "") == "text" &&
                block.contains("text") && block["text"].is_string()) {
                return block["text"].get<std::string>();
            }
        }
    }
    return "";
}

} // anonymous namespace

Result<std::unique_ptr<McpConnection>, Error> McpConnection::Open(
    std::string server_name,
    std::unique_ptr<IRpcTransport> transport,
    std::chrono::milliseconds handshake_timeout) {
    using R = Result<std::unique_ptr<McpConnection>, Error>;
    auto conn = std::make_unique<McpConnection>(Key{}, std::move(server_name),
                                                std::move(transport));
    auto handshake = conn->Handshake(handshake_timeout);
    if (handshake.IsErr()) {
        conn->Close();
        return R::Err(std::move(handshake).Error());
    }
    return R::Ok(std::move(conn));
}

McpConnection::~McpConnection() {
    Close();
}

Result<void, Error> McpConnection::Handshake(std::chrono::milliseconds timeout) {
    auto deadline = SteadyClock::now() + timeout;

    nlohmann::json params = {
        {"protocolVersion", kMcpProtocolVersion},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", "lazymcp"}, {"version", kVersion}}},
    };
    auto result = Invoke("initialize", params, timeout, "Initialize");
    if (result.IsErr()) {
        return Result<void, Error>::Err(std::move(result).Error());
    }

    const auto& init = result.Value();
    if (init.contains("serverInfo") && init["serverInfo"].is_object()) {
        peer_info_ = init["serverInfo"].value("name", "") + " " +
                     init["serverInfo"].value("version", "");
    }
    auto protocol = init.value("protocolVersion", "");
    if (!protocol.empty() && protocol != kMcpProtocolVersion) {
        LogDebug(kComponent, "[" + server_name_ + "] negotiated protocol " + protocol);
    }

    nlohmann::json initialized = {
        {"jsonrpc", "2.0"},
        {"method", "notifications/initialized"},
    };
    auto notified = transport_->Notify(initialized, deadline);
    if (notified.IsErr()) {
        return notified;
    }

    LogInfo(kComponent, "[" + server_name_ + "] connected (" + peer_info_ + ")");
    return Result<void, Error>::Ok();
}

Result<nlohmann::json, Error> McpConnection::Invoke(const std::string& method,
                                                    const nlohmann::json& params,
                                                    std::chrono::milliseconds timeout,
                                                    const std::string& operation) {
    using R = Result<nlohmann::json, Error>;
    nlohmann::json request = {
        {"jsonrpc", "2.0"},
        {"id", next_id_++},
        {"method", method},
        {"params", params},
    };

    auto response = transport_->Request(request, SteadyClock::now() + timeout);
    if (response.IsErr()) {
        auto err = std::move(response).Error();
        err.operation = operation;
        err.target = server_name_;
        return R::Err(std::move(err));
    }

    auto& message = response.Value();
    if (message.contains("error")) {
        const auto& rpc_error = message["error"];
        auto text = rpc_error.is_object() ? rpc_error.value("message", "") : rpc_error.dump();
        auto err = Error::Make(ErrorCategory::BackendError, operation, server_name_,
                               "Backend returned error: " + text);
        err.backend_detail = rpc_error.dump();
        return R::Err(std::move(err));
    }
    if (!message.contains("result")) {
        return R::Err(Error::Make(ErrorCategory::BackendError, operation, server_name_,
                                  "Response has neither result nor error"));
    }
    return R::Ok(message["result"]);
}

Result<nlohmann::json, Error> McpConnection::CallTool(const std::string& tool_id,
                                                      const nlohmann::json& arguments,
                                                      std::chrono::milliseconds timeout) {
    using R = Result<nlohmann::json, Error>;
    nlohmann::json params = {
        {"name", tool_id},
        {"arguments", arguments},
    };
    auto result = Invoke("tools/call", params, timeout, "CallTool");
    if (result.IsErr()) {
        return result;
    }

    auto payload = std::move(result).Value();
    if (payload.is_object() && payload.value("isError", false)) {
        auto text = FirstText(payload);
        auto err = Error::Make(ErrorCategory::BackendError, "CallTool", server_name_,
                               text.empty() ? "Tool '" + tool_id + "' reported an error" : text);
        err.backend_detail = payload.dump();
        return R::Err(std::move(err));
    }
    return R::Ok(std::move(payload));
}

Result<std::vector<NativeTool>, Error> McpConnection::ListTools(std::chrono::milliseconds timeout) {
    using R = Result<std::vector<NativeTool>, Error>;
    std::vector<NativeTool> tools;
    nlohmann::json params = nlohmann::json::object();

    // Follow pagination cursors; the deadline covers all pages.
    auto deadline = SteadyClock::now() + timeout;
    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - SteadyClock::now());
        if (remaining.count() <= 0) {
            return R::Err(Error::Make(ErrorCategory::Timeout, "ListTools", server_name_,
                                      "Timed out listing tools"));
        }
        auto page = Invoke("tools/list", params, remaining, "ListTools");
        if (page.IsErr()) {
            return R::Err(std::move(page).Error());
        }
        const auto& value = page.Value();
        if (value.contains("tools") && value["tools"].is_array()) {
            for (const auto& t : value["tools"]) {
                NativeTool tool;
                tool.name = t.value("name", "");
                tool.description = t.value("description", "");
                if (t.contains("inputSchema") && t["inputSchema"].is_object()) {
                    tool.input_schema = t["inputSchema"];
                }
                tools.push_back(std::move(tool));
            }
        }
        if (!value.contains("nextCursor") || !value["nextCursor"].is_string()) {
            break;
        }
        params["cursor"] = value["nextCursor"];
    }
    return R::Ok(std::move(tools));
}

bool McpConnection::IsAlive() {
    return transport_ && transport_->IsAlive();
}

void McpConnection::Close() {
    if (transport_) {
        transport_->Close();
        transport_.reset();
    }
}

} // namespace lazymcp
