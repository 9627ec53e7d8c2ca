#pragma once

#include <lazymcp/backend/backend_config.hpp>
#include <lazymcp/core/result.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace lazymcp {

// A tool as the backend itself advertises it (tools/list).
struct NativeTool {
    std::string name;
    std::string description;
    nlohmann::json input_schema = nlohmann::json::object();
};

// ---------------------------------------------------------------------------
// IBackendConnection: an established, handshaken link to one backend.
//
// This is the opaque handle the server registry caches per backend. It is
// only ever used while the backend's mutex is held.
// ---------------------------------------------------------------------------
class IBackendConnection {
public:
    virtual ~IBackendConnection() = default;

    IBackendConnection(const IBackendConnection&) = delete;
    IBackendConnection& operator=(const IBackendConnection&) = delete;
    IBackendConnection(IBackendConnection&&) = delete;
    IBackendConnection& operator=(IBackendConnection&&) = delete;

    /// Forward one tool invocation. Returns the backend's CallToolResult
    /// object. Never retried: tool calls may have side effects.
    [[nodiscard]] virtual Result<nlohmann::json, Error> CallTool(
        const std::string& tool_id,
        const nlohmann::json& arguments,
        std::chrono::milliseconds timeout) = 0;

    [[nodiscard]] virtual Result<std::vector<NativeTool>, Error> ListTools(
        std::chrono::milliseconds timeout) = 0;

    [[nodiscard]] virtual bool IsAlive() = 0;

    virtual void Close() = 0;

protected:
    IBackendConnection() = default;
};

// ---------------------------------------------------------------------------
// IBackendConnector: establishes connections from configuration.
// Start() failures are reported as ErrorCategory::ServerSpawnFailed.
// ---------------------------------------------------------------------------
class IBackendConnector {
public:
    virtual ~IBackendConnector() = default;

    IBackendConnector(const IBackendConnector&) = delete;
    IBackendConnector& operator=(const IBackendConnector&) = delete;
    IBackendConnector(IBackendConnector&&) = delete;
    IBackendConnector& operator=(IBackendConnector&&) = delete;

    [[nodiscard]] virtual Result<std::unique_ptr<IBackendConnection>, Error> Start(
        const BackendConfig& config) = 0;

protected:
    IBackendConnector() = default;
};

} // namespace lazymcp
