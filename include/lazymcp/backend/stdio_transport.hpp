#pragma once

#include <lazymcp/backend/i_rpc_transport.hpp>
#include <lazymcp/core/subprocess.hpp>

#include <memory>
#include <string>

namespace lazymcp {

// ---------------------------------------------------------------------------
// StdioTransport: JSON-RPC over a child process's stdin/stdout, one
// message per line.
//
// While waiting for a response it skips:
//   - lines that are not JSON (servers that log to stdout),
//   - notifications from the server,
//   - responses with a different id (late replies to a timed-out request).
// Server-initiated requests are answered with -32601 so the server never
// blocks on us.
// ---------------------------------------------------------------------------
class StdioTransport : public IRpcTransport {
public:
    StdioTransport(std::string server_name, std::unique_ptr<Subprocess> process);
    ~StdioTransport() override;

    [[nodiscard]] Result<nlohmann::json, Error> Request(
        const nlohmann::json& request, Deadline deadline) override;

    [[nodiscard]] Result<void, Error> Notify(
        const nlohmann::json& notification, Deadline deadline) override;

    [[nodiscard]] bool IsAlive() override;

    void Close() override;

private:
    Result<void, Error> WriteMessage(const nlohmann::json& message, Deadline deadline);
    void RejectServerRequest(const nlohmann::json& message, Deadline deadline);

    std::string server_name_;
    std::unique_ptr<Subprocess> process_;
};

} // namespace lazymcp
