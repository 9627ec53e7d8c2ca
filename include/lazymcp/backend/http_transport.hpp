#pragma once

#include <lazymcp/backend/backend_config.hpp>
#include <lazymcp/backend/i_rpc_transport.hpp>

#include <memory>
#include <string>
#include <vector>

namespace lazymcp {

// ---------------------------------------------------------------------------
// HttpTransport: MCP streamable-HTTP client using cpp-httplib.
//
// Every JSON-RPC message is POSTed to the configured URL. The server may
// answer with a JSON body or with an SSE stream (text/event-stream) whose
// "data:" events carry the response. A session id returned in the
// Mcp-Session-Id header is sent back on every later request. A 404 for
// an established session means the server dropped it; the transport then
// reports itself dead so the owner can open a fresh session.
//
// Uses pimpl so httplib stays out of the public header.
// ---------------------------------------------------------------------------
class HttpTransport : public IRpcTransport {
    struct Impl;

public:
    [[nodiscard]] static Result<std::unique_ptr<HttpTransport>, Error> Create(
        const BackendConfig& config);

    // Impl is private, so only Create() can supply one.
    explicit HttpTransport(std::unique_ptr<Impl> impl);
    ~HttpTransport() override;

    [[nodiscard]] Result<nlohmann::json, Error> Request(
        const nlohmann::json& request, Deadline deadline) override;

    [[nodiscard]] Result<void, Error> Notify(
        const nlohmann::json& notification, Deadline deadline) override;

    [[nodiscard]] bool IsAlive() override;

    void Close() override;

private:
    std::unique_ptr<Impl> impl_;
};

/// Split an http(s) URL into "scheme://host[:port]" and the request path.
/// Returns false for anything that is not an http(s) URL with a host.
bool SplitUrl(const std::string& url, std::string& scheme_host_port, std::string& path);

/// Extract the JSON payloads of the "data:" fields of an SSE body, one per event.
std::vector<std::string> ParseSseData(const std::string& body);

} // namespace lazymcp
