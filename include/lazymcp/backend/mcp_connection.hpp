#pragma once

#include <lazymcp/backend/i_backend_connection.hpp>
#include <lazymcp/backend/i_rpc_transport.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace lazymcp {

// Protocol revision we speak to backends.
constexpr const char* kMcpProtocolVersion = "2024-11-05";

// ---------------------------------------------------------------------------
// McpConnection: MCP client session over any IRpcTransport.
//
// Open() performs the initialize handshake; CallTool()/ListTools() map the
// MCP replies onto Result:
//   - JSON-RPC error object     -> BackendError (payload in backend_detail)
//   - result with isError: true -> BackendError (payload in backend_detail)
//   - transport deadline        -> Timeout
// ---------------------------------------------------------------------------
class McpConnection : public IBackendConnection {
private:
    // Constructor key: only the factories can build one.
    struct Key {
        explicit Key() = default;
    };

public:
    [[nodiscard]] static Result<std::unique_ptr<McpConnection>, Error> Open(
        std::string server_name,
        std::unique_ptr<IRpcTransport> transport,
        std::chrono::milliseconds handshake_timeout);

    McpConnection(Key, std::string server_name, std::unique_ptr<IRpcTransport> transport)
        : server_name_(std::move(server_name)), transport_(std::move(transport)) {}

    ~McpConnection() override;

    [[nodiscard]] Result<nlohmann::json, Error> CallTool(
        const std::string& tool_id,
        const nlohmann::json& arguments,
        std::chrono::milliseconds timeout) override;

    [[nodiscard]] Result<std::vector<NativeTool>, Error> ListTools(
        std::chrono::milliseconds timeout) override;

    [[nodiscard]] bool IsAlive() override;

    void Close() override;

    [[nodiscard]] const std::string& ServerName() const noexcept { return server_name_; }

    /// serverInfo reported during the handshake ("name version").
    [[nodiscard]] const std::string& PeerInfo() const noexcept { return peer_info_; }

private:
    Result<void, Error> Handshake(std::chrono::milliseconds timeout);

    /// Send a request and return its "result" member.
    Result<nlohmann::json, Error> Invoke(const std::string& method,
                                         const nlohmann::json& params,
                                         std::chrono::milliseconds timeout,
                                         const std::string& operation);

    std::string server_name_;
    std::unique_ptr<IRpcTransport> transport_;
    std::int64_t next_id_ = 1;
    std::string peer_info_;
};

} // namespace lazymcp
