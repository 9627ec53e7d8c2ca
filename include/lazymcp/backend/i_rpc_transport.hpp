#pragma once

#include <lazymcp/core/result.hpp>
#include <lazymcp/core/subprocess.hpp>

#include <nlohmann/json.hpp>

namespace lazymcp {

// ---------------------------------------------------------------------------
// IRpcTransport: moves JSON-RPC 2.0 messages to and from one backend.
//
// Request() sends a message carrying an "id" and returns the backend's
// response message with the same id (which holds either "result" or
// "error"). Expiry of `deadline` yields ErrorCategory::Timeout; a broken
// channel yields ErrorCategory::BackendError.
//
// Implementations are not thread-safe; the owning backend's mutex
// serializes every call.
// ---------------------------------------------------------------------------
class IRpcTransport {
public:
    virtual ~IRpcTransport() = default;

    IRpcTransport(const IRpcTransport&) = delete;
    IRpcTransport& operator=(const IRpcTransport&) = delete;
    IRpcTransport(IRpcTransport&&) = delete;
    IRpcTransport& operator=(IRpcTransport&&) = delete;

    [[nodiscard]] virtual Result<nlohmann::json, Error> Request(
        const nlohmann::json& request, Deadline deadline) = 0;

    [[nodiscard]] virtual Result<void, Error> Notify(
        const nlohmann::json& notification, Deadline deadline) = 0;

    /// False once the channel can no longer carry requests.
    [[nodiscard]] virtual bool IsAlive() = 0;

    virtual void Close() = 0;

protected:
    IRpcTransport() = default;
};

} // namespace lazymcp
