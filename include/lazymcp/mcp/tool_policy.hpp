#pragma once

#include <lazymcp/core/result.hpp>

#include <chrono>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace lazymcp {

// ---------------------------------------------------------------------------
// IToolPolicy: consulted by execute_tool before anything is dispatched.
// Ok means proceed; Err (PolicyDenied) is returned to the agent as-is.
// ---------------------------------------------------------------------------
class IToolPolicy {
public:
    virtual ~IToolPolicy() = default;

    [[nodiscard]] virtual Result<void, Error> Check(const std::string& tool_path,
                                                    const nlohmann::json& arguments) = 0;
};

struct PolicyHookConfig {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::chrono::milliseconds timeout{10000};
    // Glob patterns over tool paths ("gmail.*", "*.delete_*"). Empty means
    // every tool goes through the hook.
    std::vector<std::string> match;
};

/// Shell-style match where '*' spans any run of characters, dots included.
[[nodiscard]] bool MatchToolPattern(std::string_view pattern, std::string_view tool_path);

// ---------------------------------------------------------------------------
// CommandPolicyHook: delegates the decision to an external program.
//
// The program receives on stdin
//   {"tool_path": ..., "arguments": ...,
//    "tool_name": "execute_tool", "tool_input": {"tool_path": ..., "arguments": ...}}
// Exit status 0 allows the call unless stdout holds a permissionDecision
// of "deny" or "ask" (optionally under "hookSpecificOutput"); both deny,
// with permissionDecisionReason as the reason. Any other exit status
// denies, with the program's stderr (or stdout) as the reason.
// ---------------------------------------------------------------------------
class CommandPolicyHook : public IToolPolicy {
public:
    explicit CommandPolicyHook(PolicyHookConfig config);

    [[nodiscard]] Result<void, Error> Check(const std::string& tool_path,
                                            const nlohmann::json& arguments) override;

    [[nodiscard]] bool Applies(const std::string& tool_path) const;

private:
    PolicyHookConfig config_;
};

} // namespace lazymcp
