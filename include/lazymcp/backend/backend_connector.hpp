#pragma once

#include <lazymcp/backend/i_backend_connection.hpp>

namespace lazymcp {

// ---------------------------------------------------------------------------
// BackendConnector: the production IBackendConnector.
//
// stdio: spawns the configured command and talks JSON-RPC over its pipes.
// http:  opens a streamable-HTTP session against the configured URL.
// Either way the MCP initialize handshake must finish within the backend's
// startup timeout, or Start() fails with ServerSpawnFailed.
// ---------------------------------------------------------------------------
class BackendConnector : public IBackendConnector {
public:
    BackendConnector() = default;

    [[nodiscard]] Result<std::unique_ptr<IBackendConnection>, Error> Start(
        const BackendConfig& config) override;
};

} // namespace lazymcp
