#include <lazymcp/backend/backend_connector.hpp>
#include <lazymcp/config/config_loader.hpp>
#include <lazymcp/core/log.hpp>
#include <lazymcp/core/version.hpp>
#include <lazymcp/dispatch/dispatcher.hpp>
#include <lazymcp/hierarchy/hierarchy_store.hpp>
#include <lazymcp/mcp/gateway_tools.hpp>
#include <lazymcp/mcp/mcp_server.hpp>
#include <lazymcp/mcp/tool_policy.hpp>
#include <lazymcp/registry/server_registry.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <thread>

#include <unistd.h>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitConfig = 1;
constexpr int kExitInternal = 99;

constexpr const char* kComponent = "main";

volatile std::sig_atomic_t reset_requested = 0;

void HandleResetSignal(int /*signal*/) {
    reset_requested = 1;
}

// ---------------------------------------------------------------------------
// ResetWatcher: turns SIGHUP into ServerRegistry::ResetFailed(), so an
// operator can revive backends that gave up after max_failures.
// ---------------------------------------------------------------------------
class ResetWatcher {
public:
    explicit ResetWatcher(lazymcp::ServerRegistry& registry) : registry_(registry) {
        std::signal(SIGHUP, HandleResetSignal);
        thread_ = std::thread([this] { Loop(); });
    }

    ~ResetWatcher() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        thread_.join();
        std::signal(SIGHUP, SIG_DFL);
    }

    ResetWatcher(const ResetWatcher&) = delete;
    ResetWatcher& operator=(const ResetWatcher&) = delete;

private:
    void Loop() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stop_) {
            cv_.wait_for(lock, std::chrono::milliseconds(250));
            if (reset_requested == 0) {
                continue;
            }
            reset_requested = 0;
            lock.unlock();
            auto count = registry_.ResetFailed();
            lazymcp::LogInfo(kComponent, "SIGHUP: reset " + std::to_string(count) +
                                             " failed backend(s)");
            lock.lock();
        }
    }

    lazymcp::ServerRegistry& registry_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
    std::thread thread_;
};

bool NoColorEnvSet() {
    const char* value = std::getenv("NO_COLOR");
    return value != nullptr && value[0] != '\0';
}

// Logs never go to stdout: it carries the MCP protocol.
int InitLogging(const lazymcp::LogConfig& log) {
    using namespace lazymcp;
    if (log.file.has_value()) {
        auto sink = std::make_unique<FileSink>(*log.file, log.json);
        if (!sink->IsOpen()) {
            std::cerr << "Error: cannot open log file " << *log.file << "\n";
            return kExitConfig;
        }
        InitGlobalLogger(std::move(sink), log.level);
    } else if (log.json) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), log.level);
    } else {
        bool use_color = !NoColorEnvSet() && ::isatty(STDERR_FILENO) != 0;
        InitGlobalLogger(std::make_unique<ColorConsoleSink>(use_color), log.level);
    }
    return kExitSuccess;
}

int Run(int argc, const char* argv[]) {
    using namespace lazymcp;

    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        std::cerr << "Error: " << cli.Error().message << "\n";
        return kExitConfig;
    }
    if (cli.Value().show_version) {
        std::cout << "lazymcp " << kVersion << "\n";
        return kExitSuccess;
    }

    GatewayConfig file_config;
    if (cli.Value().config_path.has_value()) {
        auto loaded = LoadFromYaml(*cli.Value().config_path);
        if (loaded.IsErr()) {
            std::cerr << "Error: " << loaded.Error().ToString() << "\n";
            return kExitConfig;
        }
        file_config = std::move(loaded).Value();
    }
    auto config = MergeConfigs(file_config, cli.Value());

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        std::cerr << "Error: " << valid.Error().ToString() << "\n";
        return kExitConfig;
    }

    if (auto rc = InitLogging(config.log); rc != kExitSuccess) {
        return rc;
    }

    // A backend that dies mid-write must not take the gateway down.
    std::signal(SIGPIPE, SIG_IGN);

    auto store = HierarchyStore::Load(config.hierarchy_path);
    if (store.IsErr()) {
        LogError(kComponent, store.Error().ToString());
        return kExitConfig;
    }
    const auto& hierarchy = store.Value();
    LogInfo(kComponent, "loaded " + std::to_string(hierarchy.ToolCount()) + " tools from " +
                            config.hierarchy_path);

    std::set<std::string> configured;
    for (const auto& server : config.servers) {
        configured.insert(server.name);
    }
    for (const auto& name : hierarchy.ReferencedServers()) {
        if (configured.count(name) == 0) {
            LogWarn(kComponent, "hierarchy references unconfigured server '" + name + "'");
        }
    }

    BackendConnector connector;
    ServerRegistry registry(config.servers, connector, config.registry);
    registry.Preload();
    ResetWatcher reset_watcher(registry);

    Dispatcher dispatcher(hierarchy, registry, config.call_timeout);

    std::unique_ptr<IToolPolicy> policy;
    if (config.policy_hook.has_value()) {
        policy = std::make_unique<CommandPolicyHook>(*config.policy_hook);
        LogInfo(kComponent, "policy hook: " + config.policy_hook->command);
    }

    ToolRegistry tools;
    RegisterGatewayTools(tools, dispatcher, policy.get());

    McpServer server(std::move(tools), config.workers);
    server.Run();

    registry.Shutdown();
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    try {
        return Run(argc, argv);
    } catch (const std::exception& e) {
        lazymcp::LogError(kComponent, std::string("fatal: ") + e.what());
        std::cerr << "Fatal: " << e.what() << "\n";
        return kExitInternal;
    }
}
