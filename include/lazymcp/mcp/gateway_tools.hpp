#pragma once

#include <lazymcp/core/result.hpp>
#include <lazymcp/dispatch/dispatcher.hpp>
#include <lazymcp/hierarchy/hierarchy_store.hpp>
#include <lazymcp/mcp/tool_policy.hpp>
#include <lazymcp/mcp/tool_registry.hpp>

#include <nlohmann/json.hpp>

namespace lazymcp {

/// {"path", "overview", "categories", "tools", "schemas"} for the agent.
[[nodiscard]] nlohmann::json ListingToJson(const CategoryListing& listing);

/// Error as a CallToolResult with isError set. A backend's own failed
/// CallToolResult is returned unchanged.
[[nodiscard]] ToolResult ErrorToToolResult(const Error& error);

// ---------------------------------------------------------------------------
// Register the two gateway tools:
//   - get_tools_in_category {path}
//   - execute_tool {tool_path, arguments}
//
// `dispatcher` (and `policy`, when given) must outlive the registry.
// ---------------------------------------------------------------------------
void RegisterGatewayTools(ToolRegistry& registry,
                          Dispatcher& dispatcher,
                          IToolPolicy* policy = nullptr);

} // namespace lazymcp
