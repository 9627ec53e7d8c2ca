#pragma once

#include <lazymcp/backend/i_backend_connection.hpp>
#include <lazymcp/backend/i_rpc_transport.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace lazymcp {
namespace testing {

// ---------------------------------------------------------------------------
// CallTracker: records every CallTool() across all mock connections and
// measures how many were in flight at once.
// ---------------------------------------------------------------------------
struct CallRecord {
    std::string server;
    std::string tool;
    nlohmann::json arguments;
    std::chrono::milliseconds timeout{0};
};

class CallTracker {
public:
    void Enter(const CallRecord& record) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++active_;
        ++per_server_active_[record.server];
        peak_ = std::max(peak_, active_);
        per_server_peak_[record.server] =
            std::max(per_server_peak_[record.server], per_server_active_[record.server]);
        records_.push_back(record);
        cv_.notify_all();
    }

    void Leave(const std::string& server) {
        std::lock_guard<std::mutex> lock(mutex_);
        --active_;
        --per_server_active_[server];
        cv_.notify_all();
    }

    // Block until `count` calls are in flight together, or the timeout passes.
    bool WaitForActive(int count, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return active_ >= count; });
    }

    int Peak() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return peak_;
    }

    int PeakFor(const std::string& server) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = per_server_peak_.find(server);
        return it == per_server_peak_.end() ? 0 : it->second;
    }

    std::size_t CallCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }

    std::vector<CallRecord> Calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    int active_ = 0;
    int peak_ = 0;
    std::map<std::string, int> per_server_active_;
    std::map<std::string, int> per_server_peak_;
    std::vector<CallRecord> records_;
};

// How a mock backend behaves. Counters are consumed by the calls they affect.
struct MockBackendBehavior {
    std::chrono::milliseconds call_delay{0};
    int rendezvous = 0;                  // wait until this many calls are in flight
    int failing_starts = 0;              // next N Start() calls fail
    int throwing_calls = 0;              // next N CallTool() calls throw
    int erroring_calls = 0;              // next N CallTool() calls return call_error
    Error call_error = Error::Make(ErrorCategory::Timeout, "CallTool", "", "mock timeout");
    std::chrono::milliseconds start_delay{0};
};

class MockConnector;

// ---------------------------------------------------------------------------
// MockConnection: answers tools/call with {"content":[{"type":"text",
// "text":"<server>:<tool>"}]} and reports to the shared CallTracker.
// ---------------------------------------------------------------------------
class MockConnection : public IBackendConnection {
public:
    MockConnection(std::string server, MockConnector& owner,
                   std::shared_ptr<std::atomic<bool>> alive)
        : server_(std::move(server)), owner_(owner), alive_(std::move(alive)) {}

    Result<nlohmann::json, Error> CallTool(const std::string& tool_id,
                                           const nlohmann::json& arguments,
                                           std::chrono::milliseconds timeout) override;

    Result<std::vector<NativeTool>, Error> ListTools(std::chrono::milliseconds) override {
        std::vector<NativeTool> tools;
        tools.push_back(NativeTool{"echo", "Echo", nlohmann::json::object()});
        return Result<std::vector<NativeTool>, Error>::Ok(std::move(tools));
    }

    bool IsAlive() override { return alive_->load(); }

    void Close() override { alive_->store(false); }

private:
    std::string server_;
    MockConnector& owner_;
    std::shared_ptr<std::atomic<bool>> alive_;
};

// ---------------------------------------------------------------------------
// MockConnector: hand-written IBackendConnector for offline tests.
//
// Usage:
//   MockConnector connector;
//   connector.Behavior("alpha").failing_starts = 1;
//   ServerRegistry registry({MakeBackend("alpha")}, connector);
//   ...
//   CHECK(connector.StartCount("alpha") == 2);
// ---------------------------------------------------------------------------
class MockConnector : public IBackendConnector {
public:
    Result<std::unique_ptr<IBackendConnection>, Error> Start(
        const BackendConfig& config) override {
        using R = Result<std::unique_ptr<IBackendConnection>, Error>;
        std::chrono::milliseconds delay{0};
        bool fail = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++start_counts_[config.name];
            auto& behavior = behaviors_[config.name];
            delay = behavior.start_delay;
            if (behavior.failing_starts > 0) {
                --behavior.failing_starts;
                fail = true;
            }
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        if (fail) {
            return R::Err(Error::Make(ErrorCategory::ServerSpawnFailed, "Start", config.name,
                                      "mock start failure"));
        }
        auto alive = std::make_shared<std::atomic<bool>>(true);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            alive_flags_[config.name].push_back(alive);
        }
        return R::Ok(std::make_unique<MockConnection>(config.name, *this, std::move(alive)));
    }

    // Not thread-safe; configure before starting worker threads.
    MockBackendBehavior& Behavior(const std::string& server) {
        std::lock_guard<std::mutex> lock(mutex_);
        return behaviors_[server];
    }

    int StartCount(const std::string& server) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = start_counts_.find(server);
        return it == start_counts_.end() ? 0 : it->second;
    }

    int TotalStarts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        int total = 0;
        for (const auto& [name, count] : start_counts_) total += count;
        return total;
    }

    // Simulate the backend process dying.
    void KillConnections(const std::string& server) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& flag : alive_flags_[server]) {
            flag->store(false);
        }
    }

    CallTracker& Tracker() { return tracker_; }

    // Called by MockConnection; decides how this call behaves.
    struct CallPlan {
        std::chrono::milliseconds delay{0};
        int rendezvous = 0;
        bool throw_now = false;
        std::optional<Error> error;
    };

    CallPlan NextCall(const std::string& server) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& behavior = behaviors_[server];
        CallPlan plan;
        plan.delay = behavior.call_delay;
        plan.rendezvous = behavior.rendezvous;
        if (behavior.throwing_calls > 0) {
            --behavior.throwing_calls;
            plan.throw_now = true;
        } else if (behavior.erroring_calls > 0) {
            --behavior.erroring_calls;
            plan.error = behavior.call_error;
        }
        return plan;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, MockBackendBehavior> behaviors_;
    std::map<std::string, int> start_counts_;
    std::map<std::string, std::vector<std::shared_ptr<std::atomic<bool>>>> alive_flags_;
    CallTracker tracker_;
};

inline Result<nlohmann::json, Error> MockConnection::CallTool(
    const std::string& tool_id, const nlohmann::json& arguments,
    std::chrono::milliseconds timeout) {
    auto plan = owner_.NextCall(server_);
    auto& tracker = owner_.Tracker();

    tracker.Enter({server_, tool_id, arguments, timeout});
    if (plan.rendezvous > 0) {
        tracker.WaitForActive(plan.rendezvous, std::chrono::seconds(5));
    }
    if (plan.delay.count() > 0) {
        std::this_thread::sleep_for(plan.delay);
    }
    tracker.Leave(server_);

    if (plan.throw_now) {
        throw std::runtime_error("mock backend exploded");
    }
    if (plan.error.has_value()) {
        return Result<nlohmann::json, Error>::Err(*plan.error);
    }
    nlohmann::json result = {
        {"content", nlohmann::json::array({
            {{"type", "text"}, {"text", server_ + ":" + tool_id}}
        })}
    };
    return Result<nlohmann::json, Error>::Ok(std::move(result));
}

// ---------------------------------------------------------------------------
// ScriptedTransport: IRpcTransport with canned replies, FIFO.
// A reply's "id" is filled in from the request when absent.
// ---------------------------------------------------------------------------
class ScriptedTransport : public IRpcTransport {
public:
    void EnqueueReply(Result<nlohmann::json, Error> reply) {
        replies_.push_back(std::move(reply));
    }

    Result<nlohmann::json, Error> Request(const nlohmann::json& request,
                                          Deadline) override {
        requests_.push_back(request);
        if (replies_.empty()) {
            return Result<nlohmann::json, Error>::Err(Error::Make(
                ErrorCategory::Internal, "Request", "scripted", "No scripted reply"));
        }
        auto reply = std::move(replies_.front());
        replies_.pop_front();
        if (reply.IsOk()) {
            auto message = std::move(reply).Value();
            if (message.is_object() && !message.contains("id")) {
                message["id"] = request["id"];
            }
            return Result<nlohmann::json, Error>::Ok(std::move(message));
        }
        return reply;
    }

    Result<void, Error> Notify(const nlohmann::json& notification, Deadline) override {
        notifications_.push_back(notification);
        return Result<void, Error>::Ok();
    }

    bool IsAlive() override { return !closed_; }
    void Close() override { closed_ = true; }

    const std::vector<nlohmann::json>& Requests() const { return requests_; }
    const std::vector<nlohmann::json>& Notifications() const { return notifications_; }
    bool Closed() const { return closed_; }

private:
    std::deque<Result<nlohmann::json, Error>> replies_;
    std::vector<nlohmann::json> requests_;
    std::vector<nlohmann::json> notifications_;
    bool closed_ = false;
};

inline nlohmann::json RpcResult(const nlohmann::json& result) {
    return {{"jsonrpc", "2.0"}, {"result", result}};
}

inline nlohmann::json RpcError(int code, const std::string& message) {
    return {{"jsonrpc", "2.0"}, {"error", {{"code", code}, {"message", message}}}};
}

inline nlohmann::json InitializeReply() {
    return RpcResult({
        {"protocolVersion", "2024-11-05"},
        {"capabilities", {{"tools", nlohmann::json::object()}}},
        {"serverInfo", {{"name", "scripted"}, {"version", "1.0"}}},
    });
}

inline BackendConfig MakeBackend(const std::string& name) {
    BackendConfig config;
    config.name = name;
    config.command = "mock-" + name;
    return config;
}

} // namespace testing
} // namespace lazymcp
