#include <lazymcp/mcp/tool_registry.hpp>

#include <lazymcp/core/log.hpp>

namespace lazymcp {

ToolResult ToolResult::Text(const std::string& text, bool is_error) {
    ToolResult result;
    result.is_error = is_error;
    result.content = nlohmann::json::array({
        {{"type", "text"}, {"text", text}}
    });
    return result;
}

ToolResult ToolResult::FromCallResult(const nlohmann::json& result) {
    ToolResult out;
    if (!result.is_object()) {
        return Text(result.dump());
    }
    out.is_error = result.value("isError", false);
    if (result.contains("content") && result["content"].is_array()) {
        out.content = result["content"];
    }
    if (result.contains("structuredContent")) {
        out.structured_content = result["structuredContent"];
    }
    return out;
}

nlohmann::json ToolResult::ToJson() const {
    nlohmann::json j;
    j["content"] = content;
    if (structured_content.has_value()) {
        j["structuredContent"] = *structured_content;
    }
    if (is_error) {
        j["isError"] = true;
    }
    return j;
}

void ToolRegistry::Register(const std::string& name,
                            const std::string& description,
                            const nlohmann::json& input_schema,
                            ToolHandler handler) {
    if (handlers_.count(name) == 0) {
        schemas_.push_back({name, description, input_schema});
    }
    handlers_[name] = std::move(handler);
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

ToolResult ToolRegistry::Execute(const std::string& name,
                                 const nlohmann::json& params) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return ToolResult::Text("Unknown tool: " + name, true);
    }

    try {
        return it->second(params);
    } catch (const std::exception& e) {
        LogError("tools", name + " threw: " + e.what());
        return ToolResult::Text(std::string("Tool error: ") + e.what(), true);
    }
}

} // namespace lazymcp
