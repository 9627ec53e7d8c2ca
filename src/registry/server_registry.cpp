#include <lazymcp/registry/server_registry.hpp>

#include <lazymcp/core/log.hpp>

#include <algorithm>
#include <exception>
#include <thread>

namespace lazymcp {

namespace {

constexpr const char* kComponent = "registry";

std::string Millis(std::chrono::milliseconds ms) {
    return std::to_string(ms.count()) + "ms";
}

// A throwing connector must not leave the entry stuck in Starting.
Result<std::unique_ptr<IBackendConnection>, Error> StartCatching(IBackendConnector& connector,
                                                                 const BackendConfig& config) {
    try {
        return connector.Start(config);
    } catch (const std::exception& e) {
        return Result<std::unique_ptr<IBackendConnection>, Error>::Err(
            Error::Make(ErrorCategory::ServerSpawnFailed, "Start", config.name,
                        std::string("Connector threw: ") + e.what()));
    }
}

} // anonymous namespace

const char* ConnectionStateName(ConnectionState state) {
    switch (state) {
        case ConnectionState::NotStarted: return "not_started";
        case ConnectionState::Starting:   return "starting";
        case ConnectionState::Ready:      return "ready";
        case ConnectionState::Failed:     return "failed";
    }
    return "unknown";
}

ServerRegistry::ServerRegistry(std::vector<BackendConfig> configs,
                               IBackendConnector& connector,
                               RegistryOptions options)
    : connector_(connector), options_(options) {
    for (auto& config : configs) {
        auto name = config.name;
        configs_.emplace(std::move(name), std::move(config));
    }
}

ServerRegistry::~ServerRegistry() {
    Shutdown();
}

// ---------------------------------------------------------------------------
// Entry lookup
// ---------------------------------------------------------------------------

ServerRegistry::ServerEntry& ServerRegistry::EntryFor(const std::string& name) {
    std::lock_guard<std::mutex> guard(map_mutex_);
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        it = entries_.emplace(name, std::make_unique<ServerEntry>(name)).first;
    }
    return *it->second;
}

ServerRegistry::ServerEntry* ServerRegistry::FindEntry(const std::string& name) const {
    std::lock_guard<std::mutex> guard(map_mutex_);
    auto it = entries_.find(name);
    return it == entries_.end() ? nullptr : it->second.get();
}

std::mutex& ServerRegistry::GetClientMutex(const std::string& name) {
    return EntryFor(name).client_mutex;
}

const BackendConfig* ServerRegistry::FindConfig(const std::string& name) const {
    auto it = configs_.find(name);
    return it == configs_.end() ? nullptr : &it->second;
}

std::chrono::milliseconds ServerRegistry::CooldownAfter(int failures) const {
    if (failures <= 0) {
        return std::chrono::milliseconds(0);
    }
    auto cooldown = options_.cooldown;
    for (int i = 1; i < failures && cooldown < options_.max_cooldown; ++i) {
        cooldown *= 2;
    }
    return std::min(cooldown, options_.max_cooldown);
}

// ---------------------------------------------------------------------------
// Connection lifecycle (entry.client_mutex held)
// ---------------------------------------------------------------------------

void ServerRegistry::SetState(ServerEntry& entry, ConnectionState state) {
    std::lock_guard<std::mutex> guard(entry.state_mutex);
    entry.state = state;
}

void ServerRegistry::CloseConnection(ServerEntry& entry) {
    std::unique_ptr<IBackendConnection> connection;
    {
        std::lock_guard<std::mutex> guard(entry.state_mutex);
        connection = std::move(entry.connection);
    }
    if (connection) {
        connection->Close();
    }
}

Result<IBackendConnection*, Error> ServerRegistry::GetOrCreateConnection(
    const std::string& name) {
    using R = Result<IBackendConnection*, Error>;
    if (shut_down_) {
        return R::Err(Error::Make(ErrorCategory::ServerUnavailable, "GetConnection", name,
                                  "Registry is shut down"));
    }

    auto& entry = EntryFor(name);
    const auto* config = FindConfig(name);
    if (config == nullptr) {
        // Recorded like any failed start, but never retried: there is
        // nothing to start until the configuration names it.
        auto err = Error::Make(ErrorCategory::ServerSpawnFailed, "GetConnection", name,
                               "Backend '" + name + "' has no configuration");
        std::lock_guard<std::mutex> guard(entry.state_mutex);
        entry.state = ConnectionState::Failed;
        entry.failure_count++;
        entry.last_failure = SteadyClock::now();
        entry.last_error = err;
        return R::Err(std::move(err));
    }

    ConnectionState state;
    int failures;
    SteadyClock::time_point last_failure;
    {
        std::lock_guard<std::mutex> guard(entry.state_mutex);
        state = entry.state;
        failures = entry.failure_count;
        last_failure = entry.last_failure;
    }

    if (state == ConnectionState::Ready) {
        if (entry.connection && entry.connection->IsAlive()) {
            std::lock_guard<std::mutex> guard(entry.state_mutex);
            entry.last_activity = SteadyClock::now();
            return R::Ok(entry.connection.get());
        }
        LogWarn(kComponent, "[" + name + "] connection lost, restarting");
        CloseConnection(entry);
        SetState(entry, ConnectionState::NotStarted);
        state = ConnectionState::NotStarted;
    }

    if (state == ConnectionState::Failed) {
        if (failures >= options_.max_failures) {
            std::lock_guard<std::mutex> guard(entry.state_mutex);
            auto err = Error::Make(ErrorCategory::ServerUnavailable, "GetConnection", name,
                                   "Backend failed " + std::to_string(failures) +
                                       " times in a row and needs a reset");
            if (entry.last_error) {
                err.message += ": " + entry.last_error->message;
            }
            return R::Err(std::move(err));
        }
        auto cooldown = CooldownAfter(failures);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            SteadyClock::now() - last_failure);
        if (elapsed < cooldown) {
            std::lock_guard<std::mutex> guard(entry.state_mutex);
            auto err = Error::Make(ErrorCategory::ServerUnavailable, "GetConnection", name,
                                   "Backend is cooling down for another " +
                                       Millis(cooldown - elapsed));
            if (entry.last_error) {
                err.message += " after: " + entry.last_error->message;
            }
            return R::Err(std::move(err));
        }
    }

    return Start(entry, *config);
}

Result<IBackendConnection*, Error> ServerRegistry::Start(ServerEntry& entry,
                                                         const BackendConfig& config) {
    using R = Result<IBackendConnection*, Error>;
    SetState(entry, ConnectionState::Starting);

    auto started = StartCatching(connector_, config);

    std::lock_guard<std::mutex> guard(entry.state_mutex);
    if (started.IsErr()) {
        auto err = std::move(started).Error();
        err.category = ErrorCategory::ServerSpawnFailed;
        entry.state = ConnectionState::Failed;
        entry.failure_count++;
        entry.last_failure = SteadyClock::now();
        entry.last_error = err;
        LogWarn(kComponent, "[" + entry.name + "] start failed (" +
                                std::to_string(entry.failure_count) + "): " + err.message);
        return R::Err(std::move(err));
    }

    entry.connection = std::move(started).Value();
    entry.state = ConnectionState::Ready;
    entry.failure_count = 0;
    entry.last_error.reset();
    entry.last_activity = SteadyClock::now();
    LogInfo(kComponent, "[" + entry.name + "] ready");
    return R::Ok(entry.connection.get());
}

void ServerRegistry::Reset(const std::string& name) {
    auto& entry = EntryFor(name);
    std::lock_guard<std::mutex> lock(entry.client_mutex);
    CloseConnection(entry);
    std::lock_guard<std::mutex> guard(entry.state_mutex);
    entry.state = ConnectionState::NotStarted;
    entry.failure_count = 0;
    entry.last_error.reset();
    LogInfo(kComponent, "[" + name + "] reset");
}

std::size_t ServerRegistry::ResetFailed() {
    std::vector<std::string> failed;
    {
        std::lock_guard<std::mutex> guard(map_mutex_);
        for (const auto& [name, entry] : entries_) {
            std::lock_guard<std::mutex> state_guard(entry->state_mutex);
            if (entry->state == ConnectionState::Failed) {
                failed.push_back(name);
            }
        }
    }
    for (const auto& name : failed) {
        Reset(name);
    }
    return failed.size();
}

// ---------------------------------------------------------------------------
// Introspection
// ---------------------------------------------------------------------------

ServerStatus ServerRegistry::StatusOf(const ServerEntry& entry) const {
    ServerStatus status;
    status.name = entry.name;
    status.configured = configs_.count(entry.name) > 0;
    std::lock_guard<std::mutex> guard(entry.state_mutex);
    status.state = entry.state;
    status.failure_count = entry.failure_count;
    status.last_error = entry.last_error;
    return status;
}

std::optional<ServerStatus> ServerRegistry::Status(const std::string& name) const {
    const auto* entry = FindEntry(name);
    if (entry == nullptr) {
        return std::nullopt;
    }
    return StatusOf(*entry);
}

std::vector<ServerStatus> ServerRegistry::Snapshot() const {
    std::vector<ServerStatus> result;
    std::lock_guard<std::mutex> guard(map_mutex_);
    result.reserve(entries_.size());
    for (const auto& [name, entry] : entries_) {
        result.push_back(StatusOf(*entry));
    }
    return result;
}

// ---------------------------------------------------------------------------
// Preload / shutdown
// ---------------------------------------------------------------------------

void ServerRegistry::Preload() {
    std::vector<std::thread> threads;
    for (const auto& [name, config] : configs_) {
        if (!config.preload) {
            continue;
        }
        threads.emplace_back([this, name = name] {
            std::lock_guard<std::mutex> lock(GetClientMutex(name));
            auto conn = GetOrCreateConnection(name);
            if (conn.IsErr()) {
                LogWarn(kComponent, "[" + name + "] preload failed: " + conn.Error().ToString());
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
}

void ServerRegistry::Shutdown() {
    if (shut_down_.exchange(true)) {
        return;
    }
    std::vector<ServerEntry*> entries;
    {
        std::lock_guard<std::mutex> guard(map_mutex_);
        for (auto& [name, entry] : entries_) {
            entries.push_back(entry.get());
        }
    }
    for (auto* entry : entries) {
        std::lock_guard<std::mutex> lock(entry->client_mutex);
        if (entry->connection) {
            LogDebug(kComponent, "[" + entry->name + "] closing");
        }
        CloseConnection(*entry);
        SetState(*entry, ConnectionState::NotStarted);
    }
}

} // namespace lazymcp
