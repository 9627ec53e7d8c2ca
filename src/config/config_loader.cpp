#include <lazymcp/config/config_loader.hpp>

#include <lazymcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <set>

namespace lazymcp {

namespace {

Error MakeConfigError(const std::string& message, const std::string& target = "") {
    return Error::Make(ErrorCategory::Config, "ConfigLoader", target, message);
}

std::chrono::milliseconds Millis(const YAML::Node& node) {
    return std::chrono::milliseconds(node.as<long long>());
}

std::map<std::string, std::string> StringMap(const YAML::Node& node) {
    std::map<std::string, std::string> out;
    for (const auto& kv : node) {
        out[kv.first.as<std::string>()] = kv.second.as<std::string>();
    }
    return out;
}

std::vector<std::string> StringList(const YAML::Node& node) {
    std::vector<std::string> out;
    for (const auto& item : node) {
        out.push_back(item.as<std::string>());
    }
    return out;
}

// Build a BackendConfig from one entry of the servers list.
Result<BackendConfig, Error> ParseYamlServer(const YAML::Node& node) {
    if (!node.IsMap()) {
        return Result<BackendConfig, Error>::Err(
            MakeConfigError("Server entry must be a mapping"));
    }
    if (!node["name"]) {
        return Result<BackendConfig, Error>::Err(
            MakeConfigError("Server entry missing 'name' field"));
    }

    BackendConfig server;
    server.name = node["name"].as<std::string>();

    if (node["transport"]) {
        auto text = node["transport"].as<std::string>();
        auto kind = ParseTransportKind(text);
        if (!kind.has_value()) {
            return Result<BackendConfig, Error>::Err(
                MakeConfigError("Unknown transport '" + text + "'", server.name));
        }
        server.transport = *kind;
    } else if (node["url"] && !node["command"]) {
        server.transport = TransportKind::Http;
    }

    if (node["command"]) {
        server.command = node["command"].as<std::string>();
    }
    if (node["args"]) {
        server.args = StringList(node["args"]);
    }
    if (node["env"]) {
        server.env = StringMap(node["env"]);
    }
    if (node["url"]) {
        server.url = node["url"].as<std::string>();
    }
    if (node["headers"]) {
        server.headers = StringMap(node["headers"]);
    }
    if (node["startup_timeout_ms"]) {
        server.startup_timeout = Millis(node["startup_timeout_ms"]);
    }
    if (node["call_timeout_ms"]) {
        server.call_timeout = Millis(node["call_timeout_ms"]);
    }
    if (node["preload"]) {
        server.preload = node["preload"].as<bool>();
    }

    return Result<BackendConfig, Error>::Ok(std::move(server));
}

Result<GatewayConfig, Error> ParseRoot(const YAML::Node& root) {
    GatewayConfig config;
    if (!root || root.IsNull()) {
        return Result<GatewayConfig, Error>::Ok(std::move(config));
    }
    if (!root.IsMap()) {
        return Result<GatewayConfig, Error>::Err(
            MakeConfigError("Top level of the config must be a mapping"));
    }

    if (root["hierarchy"]) {
        config.hierarchy_path = root["hierarchy"].as<std::string>();
    }
    if (root["call_timeout_ms"]) {
        config.call_timeout = Millis(root["call_timeout_ms"]);
    }
    if (root["workers"]) {
        auto workers = root["workers"].as<int>();
        if (workers < 1) {
            return Result<GatewayConfig, Error>::Err(
                MakeConfigError("'workers' must be at least 1"));
        }
        config.workers = static_cast<std::size_t>(workers);
    }

    // -- Registry --
    if (const auto& reg = root["registry"]) {
        if (reg["cooldown_ms"]) {
            config.registry.cooldown = Millis(reg["cooldown_ms"]);
        }
        if (reg["max_cooldown_ms"]) {
            config.registry.max_cooldown = Millis(reg["max_cooldown_ms"]);
        }
        if (reg["max_failures"]) {
            config.registry.max_failures = reg["max_failures"].as<int>();
        }
    }

    // -- Policy hook --
    if (const auto& hook = root["policy_hook"]) {
        PolicyHookConfig policy;
        if (hook["command"]) {
            policy.command = hook["command"].as<std::string>();
        }
        if (hook["args"]) {
            policy.args = StringList(hook["args"]);
        }
        if (hook["env"]) {
            policy.env = StringMap(hook["env"]);
        }
        if (hook["timeout_ms"]) {
            policy.timeout = Millis(hook["timeout_ms"]);
        }
        if (hook["match"]) {
            policy.match = StringList(hook["match"]);
        }
        config.policy_hook = std::move(policy);
    }

    // -- Logging --
    if (const auto& log = root["log"]) {
        if (log["level"]) {
            auto text = log["level"].as<std::string>();
            auto level = ParseLogLevel(text);
            if (!level.has_value()) {
                return Result<GatewayConfig, Error>::Err(
                    MakeConfigError("Unknown log level '" + text + "'"));
            }
            config.log.level = *level;
        }
        if (log["json"]) {
            config.log.json = log["json"].as<bool>();
        }
        if (log["file"]) {
            config.log.file = log["file"].as<std::string>();
        }
    }

    // -- Servers --
    if (const auto& servers = root["servers"]) {
        if (!servers.IsSequence()) {
            return Result<GatewayConfig, Error>::Err(
                MakeConfigError("'servers' must be a list"));
        }
        for (const auto& server_node : servers) {
            auto server = ParseYamlServer(server_node);
            if (server.IsErr()) {
                return Result<GatewayConfig, Error>::Err(std::move(server).Error());
            }
            config.servers.push_back(std::move(server).Value());
        }
    }

    return Result<GatewayConfig, Error>::Ok(std::move(config));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<GatewayConfig, Error> LoadFromYaml(std::string_view file_path) {
    std::string path(file_path);
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        return Result<GatewayConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what()), path));
    }

    Result<GatewayConfig, Error> parsed = [&] {
        try {
            return ParseRoot(root);
        } catch (const YAML::Exception& e) {
            return Result<GatewayConfig, Error>::Err(
                MakeConfigError("Invalid value in config: " + std::string(e.what()), path));
        }
    }();
    if (parsed.IsErr()) {
        auto err = std::move(parsed).Error();
        if (err.target.empty()) {
            err.target = path;
        }
        return Result<GatewayConfig, Error>::Err(std::move(err));
    }

    auto config = std::move(parsed).Value();
    namespace fs = std::filesystem;
    if (!config.hierarchy_path.empty() && fs::path(config.hierarchy_path).is_relative()) {
        auto base = fs::path(path).parent_path();
        config.hierarchy_path = (base / config.hierarchy_path).lexically_normal().string();
    }
    return Result<GatewayConfig, Error>::Ok(std::move(config));
}

Result<GatewayConfig, Error> LoadFromYamlString(std::string_view yaml) {
    try {
        return ParseRoot(YAML::Load(std::string(yaml)));
    } catch (const YAML::Exception& e) {
        return Result<GatewayConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML: " + std::string(e.what())));
    }
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("lazymcp", kVersion, argparse::default_arguments::help);
    program.add_description(
        "MCP gateway exposing a browsable tool hierarchy over stdio. "
        "Backend servers are started on first use.");

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--hierarchy")
        .help("Hierarchy JSON file or directory");
    program.add_argument("--timeout")
        .help("Default backend call timeout in milliseconds")
        .scan<'i', int>();
    program.add_argument("--workers")
        .help("Number of request worker threads")
        .scan<'i', int>();
    program.add_argument("--log-json")
        .help("Write logs as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Write logs to this file instead of stderr");
    program.add_argument("-v", "--verbose")
        .help("Debug logging")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Only log warnings and errors")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliOptions options;
    options.config_path = program.present("--config");
    options.hierarchy_path = program.present("--hierarchy");
    options.timeout_ms = program.present<int>("--timeout");
    options.workers = program.present<int>("--workers");
    options.log_file = program.present("--log-file");
    options.log_json = program.get<bool>("--log-json");
    options.verbose = program.get<bool>("--verbose");
    options.quiet = program.get<bool>("--quiet");
    options.show_version = program.get<bool>("--version");

    if (options.verbose && options.quiet) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("--verbose and --quiet are mutually exclusive"));
    }
    if (options.timeout_ms.has_value() && *options.timeout_ms <= 0) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("--timeout must be positive"));
    }
    if (options.workers.has_value() && *options.workers < 1) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("--workers must be at least 1"));
    }

    return Result<CliOptions, Error>::Ok(std::move(options));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
GatewayConfig MergeConfigs(const GatewayConfig& yaml_base, const CliOptions& cli_overrides) {
    GatewayConfig merged = yaml_base;

    if (cli_overrides.hierarchy_path.has_value()) {
        merged.hierarchy_path = *cli_overrides.hierarchy_path;
    }
    if (cli_overrides.timeout_ms.has_value()) {
        merged.call_timeout = std::chrono::milliseconds(*cli_overrides.timeout_ms);
    }
    if (cli_overrides.workers.has_value()) {
        merged.workers = static_cast<std::size_t>(*cli_overrides.workers);
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log.file = *cli_overrides.log_file;
    }
    if (cli_overrides.log_json) {
        merged.log.json = true;
    }
    if (cli_overrides.verbose) {
        merged.log.level = LogLevel::Debug;
    }
    if (cli_overrides.quiet) {
        merged.log.level = LogLevel::Warn;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const GatewayConfig& config) {
    using R = Result<void, Error>;

    if (config.hierarchy_path.empty()) {
        return R::Err(MakeConfigError(
            "No hierarchy configured (set 'hierarchy' or pass --hierarchy)"));
    }
    if (config.call_timeout.count() <= 0) {
        return R::Err(MakeConfigError("'call_timeout_ms' must be positive"));
    }
    if (config.workers < 1) {
        return R::Err(MakeConfigError("'workers' must be at least 1"));
    }
    if (config.registry.cooldown.count() < 0 ||
        config.registry.max_cooldown < config.registry.cooldown) {
        return R::Err(MakeConfigError(
            "'registry.cooldown_ms' must be >= 0 and <= 'registry.max_cooldown_ms'"));
    }
    if (config.registry.max_failures < 1) {
        return R::Err(MakeConfigError("'registry.max_failures' must be at least 1"));
    }
    if (config.policy_hook.has_value()) {
        if (config.policy_hook->command.empty()) {
            return R::Err(MakeConfigError("'policy_hook.command' is required"));
        }
        if (config.policy_hook->timeout.count() <= 0) {
            return R::Err(MakeConfigError("'policy_hook.timeout_ms' must be positive"));
        }
    }

    std::set<std::string> names;
    for (const auto& server : config.servers) {
        if (server.name.empty()) {
            return R::Err(MakeConfigError("Server name must not be empty"));
        }
        if (!names.insert(server.name).second) {
            return R::Err(MakeConfigError("Duplicate server name", server.name));
        }
        switch (server.transport) {
            case TransportKind::Stdio:
                if (server.command.empty()) {
                    return R::Err(MakeConfigError(
                        "stdio server needs a 'command'", server.name));
                }
                break;
            case TransportKind::Http:
                if (server.url.rfind("http://", 0) != 0 &&
                    server.url.rfind("https://", 0) != 0) {
                    return R::Err(MakeConfigError(
                        "http server needs an http(s) 'url'", server.name));
                }
                break;
        }
        if (server.startup_timeout.count() <= 0) {
            return R::Err(MakeConfigError("'startup_timeout_ms' must be positive", server.name));
        }
        if (server.call_timeout.has_value() && server.call_timeout->count() <= 0) {
            return R::Err(MakeConfigError("'call_timeout_ms' must be positive", server.name));
        }
    }

    return R::Ok();
}

} // namespace lazymcp
