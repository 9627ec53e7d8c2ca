#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lazymcp {

enum class TransportKind {
    Stdio,  // long-lived subprocess, JSON-RPC lines over stdin/stdout
    Http,   // MCP streamable-HTTP endpoint
};

[[nodiscard]] const char* TransportKindName(TransportKind kind);
[[nodiscard]] std::optional<TransportKind> ParseTransportKind(std::string_view text);

// ---------------------------------------------------------------------------
// BackendConfig: launch/connection parameters for one backend server.
// Loaded once at startup and treated as immutable.
// ---------------------------------------------------------------------------
struct BackendConfig {
    std::string name;
    TransportKind transport = TransportKind::Stdio;

    // stdio
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;

    // http
    std::string url;
    std::map<std::string, std::string> headers;

    std::chrono::milliseconds startup_timeout{30000};
    std::optional<std::chrono::milliseconds> call_timeout;  // falls back to the gateway default
    bool preload = false;
};

} // namespace lazymcp
