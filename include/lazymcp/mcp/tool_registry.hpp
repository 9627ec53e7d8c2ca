#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace lazymcp {

// ---------------------------------------------------------------------------
// ToolSchema: JSON Schema for a tool's input parameters.
// ---------------------------------------------------------------------------
struct ToolSchema {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object
};

// ---------------------------------------------------------------------------
// ToolResult: an MCP CallToolResult.
// ---------------------------------------------------------------------------
struct ToolResult {
    bool is_error = false;
    nlohmann::json content = nlohmann::json::array();  // content blocks
    std::optional<nlohmann::json> structured_content;

    static ToolResult Text(const std::string& text, bool is_error = false);

    /// Adopt a CallToolResult object returned by a backend as-is.
    static ToolResult FromCallResult(const nlohmann::json& result);

    [[nodiscard]] nlohmann::json ToJson() const;
};

// A tool handler takes a JSON params object and returns a ToolResult.
// Handlers are invoked concurrently from the server's worker threads.
using ToolHandler = std::function<ToolResult(const nlohmann::json& params)>;

// ---------------------------------------------------------------------------
// ToolRegistry: the tools this server exposes to the agent.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    void Register(const std::string& name,
                  const std::string& description,
                  const nlohmann::json& input_schema,
                  ToolHandler handler);

    [[nodiscard]] const std::vector<ToolSchema>& Tools() const noexcept {
        return schemas_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;

    [[nodiscard]] ToolResult Execute(const std::string& name,
                                     const nlohmann::json& params) const;

private:
    std::vector<ToolSchema> schemas_;
    std::map<std::string, ToolHandler> handlers_;
};

} // namespace lazymcp
