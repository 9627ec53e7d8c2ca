#pragma once

#include <lazymcp/backend/backend_config.hpp>
#include <lazymcp/backend/i_backend_connection.hpp>
#include <lazymcp/core/result.hpp>
#include <lazymcp/core/subprocess.hpp>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lazymcp {

enum class ConnectionState {
    NotStarted,
    Starting,
    Ready,
    Failed,
};

[[nodiscard]] const char* ConnectionStateName(ConnectionState state);

struct RegistryOptions {
    std::chrono::milliseconds cooldown{5000};        // after the first failure
    std::chrono::milliseconds max_cooldown{300000};
    int max_failures = 5;                            // then Reset() is required
};

// Point-in-time copy of one entry's bookkeeping.
struct ServerStatus {
    std::string name;
    ConnectionState state = ConnectionState::NotStarted;
    int failure_count = 0;
    bool configured = false;
    std::optional<Error> last_error;
};

// ---------------------------------------------------------------------------
// ServerRegistry: one lazily started connection per backend name.
//
// Every backend gets exactly one entry, created on first reference and kept
// until the registry is destroyed. Each entry owns the mutex that serializes
// all traffic to that backend. The map itself is guarded by a separate lock
// that is only held to find or insert an entry, never across I/O.
//
// Usage (the dispatcher's pattern):
//
//   std::lock_guard<std::mutex> lock(registry.GetClientMutex(name));
//   auto conn = registry.GetOrCreateConnection(name);
//   if (conn.IsOk()) conn.Value()->CallTool(...);
//
// Failed starts put the entry into a cooldown that doubles with each
// consecutive failure. After max_failures the entry stays Failed until
// Reset() or ResetFailed() (the gateway calls the latter on SIGHUP).
// ---------------------------------------------------------------------------
class ServerRegistry {
public:
    ServerRegistry(std::vector<BackendConfig> configs,
                   IBackendConnector& connector,
                   RegistryOptions options = {});
    ~ServerRegistry();

    ServerRegistry(const ServerRegistry&) = delete;
    ServerRegistry& operator=(const ServerRegistry&) = delete;

    /// The serialization mutex for `name`. Same name, same mutex, for the
    /// lifetime of the registry.
    [[nodiscard]] std::mutex& GetClientMutex(const std::string& name);

    /// Caller must hold GetClientMutex(name). The returned connection stays
    /// valid while that mutex is held.
    [[nodiscard]] Result<IBackendConnection*, Error> GetOrCreateConnection(
        const std::string& name);

    /// Drop any connection and clear failure history. Takes the name's mutex.
    void Reset(const std::string& name);

    /// Reset every entry currently in Failed. Returns how many were reset.
    std::size_t ResetFailed();

    [[nodiscard]] std::optional<ServerStatus> Status(const std::string& name) const;
    [[nodiscard]] std::vector<ServerStatus> Snapshot() const;

    /// Start every backend configured with preload, one thread per backend.
    void Preload();

    /// Close every live connection. Later calls fail with ServerUnavailable.
    void Shutdown();

    [[nodiscard]] const BackendConfig* FindConfig(const std::string& name) const;

    /// Cooldown that applies after `failures` consecutive failed starts.
    [[nodiscard]] std::chrono::milliseconds CooldownAfter(int failures) const;

private:
    struct ServerEntry {
        explicit ServerEntry(std::string n) : name(std::move(n)) {}

        const std::string name;
        std::mutex client_mutex;  // serializes all backend traffic

        // Written only while client_mutex is held; state_mutex lets Status()
        // read without waiting on an in-flight call.
        mutable std::mutex state_mutex;
        ConnectionState state = ConnectionState::NotStarted;
        std::unique_ptr<IBackendConnection> connection;
        int failure_count = 0;
        SteadyClock::time_point last_activity{};
        SteadyClock::time_point last_failure{};
        std::optional<Error> last_error;
    };

    ServerEntry& EntryFor(const std::string& name);
    ServerEntry* FindEntry(const std::string& name) const;
    ServerStatus StatusOf(const ServerEntry& entry) const;

    void SetState(ServerEntry& entry, ConnectionState state);
    Result<IBackendConnection*, Error> Start(ServerEntry& entry, const BackendConfig& config);
    void CloseConnection(ServerEntry& entry);

    std::map<std::string, BackendConfig> configs_;
    IBackendConnector& connector_;
    RegistryOptions options_;

    mutable std::mutex map_mutex_;
    std::map<std::string, std::unique_ptr<ServerEntry>> entries_;
    std::atomic<bool> shut_down_{false};
};

} // namespace lazymcp
