#include <lazymcp/mcp/tool_policy.hpp>

#include <lazymcp/core/log.hpp>
#include <lazymcp/core/subprocess.hpp>

namespace lazymcp {

namespace {

constexpr const char* kComponent = "policy";

std::string Trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// A hook that exits 0 may still decide through a PreToolUse-style reply:
//   {"hookSpecificOutput": {"permissionDecision": "allow" | "deny" | "ask",
//                           "permissionDecisionReason": "..."}}
// Returns the decision object, or null when stdout carries none.
nlohmann::json ParseDecision(const std::string& out) {
    auto text = Trim(out);
    if (text.empty() || text.front() != '{') {
        return nullptr;
    }
    auto reply = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (reply.is_discarded() || !reply.is_object()) {
        return nullptr;
    }
    const nlohmann::json* decision = &reply;
    if (reply.contains("hookSpecificOutput") && reply["hookSpecificOutput"].is_object()) {
        decision = &reply["hookSpecificOutput"];
    }
    if (!decision->contains("permissionDecision") ||
        !(*decision)["permissionDecision"].is_string()) {
        return nullptr;
    }
    return *decision;
}

} // anonymous namespace

bool MatchToolPattern(std::string_view pattern, std::string_view tool_path) {
    // Iterative wildcard match with single-star backtracking.
    std::size_t p = 0;
    std::size_t t = 0;
    std::size_t star = std::string_view::npos;
    std::size_t resume = 0;
    while (t < tool_path.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            resume = t;
        } else if (p < pattern.size() && pattern[p] == tool_path[t]) {
            ++p;
            ++t;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            t = ++resume;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

CommandPolicyHook::CommandPolicyHook(PolicyHookConfig config)
    : config_(std::move(config)) {}

bool CommandPolicyHook::Applies(const std::string& tool_path) const {
    if (config_.match.empty()) {
        return true;
    }
    for (const auto& pattern : config_.match) {
        if (MatchToolPattern(pattern, tool_path)) {
            return true;
        }
    }
    return false;
}

Result<void, Error> CommandPolicyHook::Check(const std::string& tool_path,
                                             const nlohmann::json& arguments) {
    using R = Result<void, Error>;
    if (!Applies(tool_path)) {
        return R::Ok();
    }

    SpawnOptions options;
    options.command = config_.command;
    options.args = config_.args;
    options.env = config_.env;
    options.capture_stderr = true;

    auto process = Subprocess::Spawn(options);
    if (process.IsErr()) {
        auto err = std::move(process).Error();
        LogError(kComponent, "hook could not start: " + err.message);
        return R::Err(Error::Make(ErrorCategory::PolicyDenied, "PolicyCheck", tool_path,
                                  "Policy hook could not be run: " + err.message));
    }

    // Flat fields for simple hooks, plus the tool_name/tool_input envelope
    // that PreToolUse hooks written for agent hosts expect.
    nlohmann::json input = {
        {"tool_path", tool_path},
        {"arguments", arguments},
        {"tool_name", "execute_tool"},
        {"tool_input", {{"tool_path", tool_path}, {"arguments", arguments}}},
    };
    auto payload = input.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    auto output = process.Value()->Communicate(payload, SteadyClock::now() + config_.timeout);
    if (output.IsErr()) {
        auto err = std::move(output).Error();
        LogWarn(kComponent, tool_path + ": hook failed: " + err.message);
        return R::Err(Error::Make(ErrorCategory::PolicyDenied, "PolicyCheck", tool_path,
                                  "Policy hook failed: " + err.message));
    }

    const auto& result = output.Value();
    if (result.exit_code == 0) {
        auto decision = ParseDecision(result.out);
        if (decision.is_null()) {
            LogDebug(kComponent, tool_path + ": allowed");
            return R::Ok();
        }
        auto verdict = decision["permissionDecision"].get<std::string>();
        if (verdict == "allow") {
            LogDebug(kComponent, tool_path + ": allowed");
            return R::Ok();
        }
        // No one can answer "ask" on a headless gateway, so it denies.
        std::string reason;
        if (decision.contains("permissionDecisionReason") &&
            decision["permissionDecisionReason"].is_string()) {
            reason = decision["permissionDecisionReason"].get<std::string>();
        }
        if (reason.empty()) {
            reason = "Denied by policy hook (" + verdict + ")";
        }
        LogInfo(kComponent, tool_path + ": denied (" + verdict + ")");
        return R::Err(Error::Make(ErrorCategory::PolicyDenied, "PolicyCheck", tool_path, reason));
    }

    auto reason = Trim(result.err);
    if (reason.empty()) {
        reason = Trim(result.out);
    }
    if (reason.empty()) {
        reason = "Denied by policy hook (exit " + std::to_string(result.exit_code) + ")";
    }
    LogInfo(kComponent, tool_path + ": denied");
    return R::Err(Error::Make(ErrorCategory::PolicyDenied, "PolicyCheck", tool_path, reason));
}

} // namespace lazymcp
