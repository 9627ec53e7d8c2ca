#pragma once

#include <lazymcp/core/worker_pool.hpp>
#include <lazymcp/mcp/tool_registry.hpp>

#include <cstddef>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace lazymcp {

// ---------------------------------------------------------------------------
// McpServer: MCP 2024-11-05 server over stdin/stdout.
//
// Implements JSON-RPC 2.0 protocol with MCP methods:
//   - initialize
//   - ping
//   - tools/list
//   - tools/call (run on the worker pool, answered out of order)
//   - notifications/* (no response)
//
// Responses are written one per line; a mutex keeps lines from interleaving.
// ---------------------------------------------------------------------------
class McpServer {
public:
    McpServer(ToolRegistry registry,
              std::size_t workers,
              std::istream& in = std::cin,
              std::ostream& out = std::cout);

    /// Serve until EOF on the input stream, then wait for in-flight calls.
    void Run();

    // Process a single JSON-RPC message and return the response (if any).
    // Returns nullopt for notifications.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

    [[nodiscard]] const ToolRegistry& Tools() const noexcept { return registry_; }

private:
    nlohmann::json HandleInitialize(const nlohmann::json& params,
                                    const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id);
    static nlohmann::json MakeError(const nlohmann::json& id,
                                    int code, const std::string& message);
    static nlohmann::json MakeResult(const nlohmann::json& id,
                                     const nlohmann::json& result);

    void Send(const nlohmann::json& message);

    ToolRegistry registry_;
    WorkerPool pool_;
    std::istream& in_;
    std::ostream& out_;
    std::mutex out_mutex_;
};

} // namespace lazymcp
