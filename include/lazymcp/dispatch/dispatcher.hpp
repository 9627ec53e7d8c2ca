#pragma once

#include <lazymcp/core/result.hpp>
#include <lazymcp/hierarchy/hierarchy_store.hpp>
#include <lazymcp/registry/server_registry.hpp>

#include <chrono>
#include <string_view>

#include <nlohmann/json.hpp>

namespace lazymcp {

// ---------------------------------------------------------------------------
// Dispatcher: the two gateway operations.
//
// GetToolsInCategory() only reads the immutable hierarchy and never blocks.
// ExecuteTool() resolves the path, then holds exactly one backend mutex
// across connection setup and the single forwarded call.
// ---------------------------------------------------------------------------
class Dispatcher {
public:
    Dispatcher(const HierarchyStore& store,
               ServerRegistry& registry,
               std::chrono::milliseconds default_call_timeout);

    [[nodiscard]] Result<CategoryListing, Error> GetToolsInCategory(std::string_view path) const;

    /// Forward `arguments` unmodified to the backend owning `tool_path`.
    /// Returns the backend's CallToolResult.
    [[nodiscard]] Result<nlohmann::json, Error> ExecuteTool(std::string_view tool_path,
                                                            const nlohmann::json& arguments);

    [[nodiscard]] std::chrono::milliseconds CallTimeoutFor(const std::string& server) const;

private:
    const HierarchyStore& store_;
    ServerRegistry& registry_;
    std::chrono::milliseconds default_call_timeout_;
};

} // namespace lazymcp
