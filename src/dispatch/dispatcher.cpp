#include <lazymcp/dispatch/dispatcher.hpp>

#include <lazymcp/core/log.hpp>

#include <exception>
#include <mutex>

namespace lazymcp {

namespace {

constexpr const char* kComponent = "dispatch";

} // anonymous namespace

Dispatcher::Dispatcher(const HierarchyStore& store,
                       ServerRegistry& registry,
                       std::chrono::milliseconds default_call_timeout)
    : store_(store), registry_(registry), default_call_timeout_(default_call_timeout) {}

Result<CategoryListing, Error> Dispatcher::GetToolsInCategory(std::string_view path) const {
    return store_.ListChildren(path);
}

std::chrono::milliseconds Dispatcher::CallTimeoutFor(const std::string& server) const {
    const auto* config = registry_.FindConfig(server);
    if (config != nullptr && config->call_timeout.has_value()) {
        return *config->call_timeout;
    }
    return default_call_timeout_;
}

Result<nlohmann::json, Error> Dispatcher::ExecuteTool(std::string_view tool_path,
                                                      const nlohmann::json& arguments) {
    using R = Result<nlohmann::json, Error>;
    auto resolved = store_.Lookup(tool_path);
    if (resolved.IsErr()) {
        return R::Err(std::move(resolved).Error());
    }
    const auto* node = resolved.Value();
    if (!node->IsTool()) {
        return R::Err(Error::Make(ErrorCategory::NotATool, "ExecuteTool", std::string(tool_path),
                                  "'" + std::string(tool_path) +
                                      "' is a category; browse it with get_tools_in_category"));
    }

    const auto& binding = node->Binding();
    auto timeout = CallTimeoutFor(binding.server);
    LogDebug(kComponent, std::string(tool_path) + " -> " + binding.server + "/" +
                             binding.native_tool_id);

    std::lock_guard<std::mutex> lock(registry_.GetClientMutex(binding.server));
    try {
        auto conn = registry_.GetOrCreateConnection(binding.server);
        if (conn.IsErr()) {
            return R::Err(std::move(conn).Error());
        }
        return conn.Value()->CallTool(binding.native_tool_id, arguments, timeout);
    } catch (const std::exception& e) {
        LogError(kComponent, "[" + binding.server + "] call to " + binding.native_tool_id +
                                 " threw: " + e.what());
        return R::Err(Error::Make(ErrorCategory::BackendError, "ExecuteTool",
                                  std::string(tool_path),
                                  std::string("Backend call failed: ") + e.what()));
    }
}

} // namespace lazymcp
