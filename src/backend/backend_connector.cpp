#include <lazymcp/backend/backend_connector.hpp>

#include <lazymcp/backend/http_transport.hpp>
#include <lazymcp/backend/mcp_connection.hpp>
#include <lazymcp/backend/stdio_transport.hpp>
#include <lazymcp/core/log.hpp>

namespace lazymcp {

namespace {

constexpr const char* kComponent = "connector";

// Anything that goes wrong before the handshake completes is a start failure.
Error AsSpawnFailure(Error err, const std::string& server_name) {
    auto detail = err.message;
    if (err.category == ErrorCategory::Timeout) {
        detail = "Handshake timed out: " + detail;
    }
    err.category = ErrorCategory::ServerSpawnFailed;
    err.operation = "Start";
    err.target = server_name;
    err.message = detail;
    return err;
}

Result<std::unique_ptr<IRpcTransport>, Error> OpenTransport(const BackendConfig& config) {
    using R = Result<std::unique_ptr<IRpcTransport>, Error>;
    switch (config.transport) {
        case TransportKind::Stdio: {
            if (config.command.empty()) {
                return R::Err(Error::Make(ErrorCategory::ServerSpawnFailed, "Start", config.name,
                                          "No command configured for stdio backend"));
            }
            SpawnOptions options;
            options.command = config.command;
            options.args = config.args;
            options.env = config.env;
            auto process = Subprocess::Spawn(options);
            if (process.IsErr()) {
                return R::Err(std::move(process).Error());
            }
            LogDebug(kComponent, "[" + config.name + "] spawned '" + config.command +
                                     "' pid=" + std::to_string(process.Value()->Pid()));
            return R::Ok(std::make_unique<StdioTransport>(config.name,
                                                          std::move(process).Value()));
        }
        case TransportKind::Http: {
            auto transport = HttpTransport::Create(config);
            if (transport.IsErr()) {
                return R::Err(std::move(transport).Error());
            }
            return R::Ok(std::move(transport).Value());
        }
    }
    return R::Err(Error::Make(ErrorCategory::Internal, "Start", config.name,
                              "Unknown transport kind"));
}

} // anonymous namespace

Result<std::unique_ptr<IBackendConnection>, Error> BackendConnector::Start(
    const BackendConfig& config) {
    using R = Result<std::unique_ptr<IBackendConnection>, Error>;
    LogInfo(kComponent, "[" + config.name + "] starting (" +
                            TransportKindName(config.transport) + ")");

    auto transport = OpenTransport(config);
    if (transport.IsErr()) {
        return R::Err(AsSpawnFailure(std::move(transport).Error(), config.name));
    }

    auto conn = McpConnection::Open(config.name, std::move(transport).Value(),
                                    config.startup_timeout);
    if (conn.IsErr()) {
        return R::Err(AsSpawnFailure(std::move(conn).Error(), config.name));
    }
    return R::Ok(std::move(conn).Value());
}

} // namespace lazymcp
