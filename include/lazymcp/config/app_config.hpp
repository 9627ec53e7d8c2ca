#pragma once

#include <lazymcp/backend/backend_config.hpp>
#include <lazymcp/core/log.hpp>
#include <lazymcp/mcp/tool_policy.hpp>
#include <lazymcp/registry/server_registry.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace lazymcp {

struct LogConfig {
    LogLevel level = LogLevel::Info;
    bool json = false;
    std::optional<std::string> file;
};

struct GatewayConfig {
    std::string hierarchy_path;                   // file or directory
    std::chrono::milliseconds call_timeout{60000};
    std::size_t workers = 8;
    RegistryOptions registry;
    std::optional<PolicyHookConfig> policy_hook;
    LogConfig log;
    std::vector<BackendConfig> servers;
};

// Command-line flags. Unset members leave the YAML value alone.
struct CliOptions {
    std::optional<std::string> config_path;
    std::optional<std::string> hierarchy_path;
    std::optional<int> timeout_ms;
    std::optional<int> workers;
    std::optional<std::string> log_file;
    bool log_json = false;
    bool verbose = false;
    bool quiet = false;
    bool show_version = false;
};

} // namespace lazymcp
