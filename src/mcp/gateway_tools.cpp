#include <lazymcp/mcp/gateway_tools.hpp>

#include <lazymcp/core/log.hpp>

#include <string>

namespace lazymcp {

namespace {

constexpr const char* kComponent = "gateway";

nlohmann::json CategorySchema() {
    return {
        {"type", "object"},
        {"properties", {
            {"path", {
                {"type", "string"},
                {"description", "Dot-separated category path, e.g. \"coding_tools.serena\". "
                                "Use \"\" for the top level."}
            }}
        }},
        {"required", nlohmann::json::array({"path"})}
    };
}

nlohmann::json ExecuteSchema() {
    return {
        {"type", "object"},
        {"properties", {
            {"tool_path", {
                {"type", "string"},
                {"description", "Full dot-separated path of the tool, e.g. "
                                "\"coding_tools.serena.find_symbol\""}
            }},
            {"arguments", {
                {"type", "object"},
                {"description", "Arguments for the tool, as described by its input schema"}
            }}
        }},
        {"required", nlohmann::json::array({"tool_path"})}
    };
}

ToolResult InvalidArgument(const std::string& operation, const std::string& message) {
    return ErrorToToolResult(
        Error::Make(ErrorCategory::InvalidArgument, operation, "", message));
}

ToolResult HandleGetToolsInCategory(const Dispatcher& dispatcher, const nlohmann::json& params) {
    std::string path;
    if (params.contains("path")) {
        if (!params["path"].is_string()) {
            return InvalidArgument("GetToolsInCategory", "'path' must be a string");
        }
        path = params["path"].get<std::string>();
    }

    auto listing = dispatcher.GetToolsInCategory(path);
    if (listing.IsErr()) {
        return ErrorToToolResult(listing.Error());
    }
    return ToolResult::Text(ListingToJson(listing.Value()).dump(2));
}

ToolResult HandleExecuteTool(Dispatcher& dispatcher, IToolPolicy* policy,
                             const nlohmann::json& params) {
    if (!params.contains("tool_path") || !params["tool_path"].is_string()) {
        return InvalidArgument("ExecuteTool", "Missing required string parameter 'tool_path'");
    }
    auto tool_path = params["tool_path"].get<std::string>();

    auto arguments = nlohmann::json::object();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        if (!params["arguments"].is_object()) {
            return InvalidArgument("ExecuteTool", "'arguments' must be an object");
        }
        arguments = params["arguments"];
    }

    if (policy != nullptr) {
        auto allowed = policy->Check(tool_path, arguments);
        if (allowed.IsErr()) {
            return ErrorToToolResult(allowed.Error());
        }
    }

    auto result = dispatcher.ExecuteTool(tool_path, arguments);
    if (result.IsErr()) {
        const auto& err = result.Error();
        LogInfo(kComponent, tool_path + " failed: " + err.ToString());
        return ErrorToToolResult(err);
    }
    return ToolResult::FromCallResult(result.Value());
}

} // anonymous namespace

nlohmann::json ListingToJson(const CategoryListing& listing) {
    nlohmann::json j;
    j["path"] = listing.path;
    if (!listing.overview.empty()) {
        j["overview"] = listing.overview;
    }
    j["categories"] = listing.categories;
    j["tools"] = listing.tools;
    if (!listing.schemas.empty()) {
        j["schemas"] = listing.schemas;
    }
    return j;
}

ToolResult ErrorToToolResult(const Error& error) {
    if (error.category == ErrorCategory::BackendError && error.backend_detail.has_value()) {
        auto payload = nlohmann::json::parse(*error.backend_detail, nullptr,
                                             /*allow_exceptions=*/false);
        if (payload.is_object() && payload.contains("content") &&
            payload["content"].is_array()) {
            auto result = ToolResult::FromCallResult(payload);
            result.is_error = true;
            return result;
        }
    }
    return ToolResult::Text(error.ToJson(), true);
}

void RegisterGatewayTools(ToolRegistry& registry,
                          Dispatcher& dispatcher,
                          IToolPolicy* policy) {
    registry.Register(
        "get_tools_in_category",
        "Browse the tool hierarchy. Returns the sub-categories and tools under a "
        "category path, with descriptions and tool input schemas.",
        CategorySchema(),
        [&dispatcher](const nlohmann::json& params) {
            return HandleGetToolsInCategory(dispatcher, params);
        });

    registry.Register(
        "execute_tool",
        "Run a tool by its full hierarchy path. The backend server providing it "
        "is started on first use.",
        ExecuteSchema(),
        [&dispatcher, policy](const nlohmann::json& params) {
            return HandleExecuteTool(dispatcher, policy, params);
        });
}

} // namespace lazymcp
