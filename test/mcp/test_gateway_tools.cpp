#include <catch2/catch_test_macros.hpp>

#include <lazymcp/mcp/gateway_tools.hpp>
#include <lazymcp/mcp/mcp_server.hpp>

#include "mocks/mock_backend.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace lazymcp;
using namespace lazymcp::testing;
using namespace std::chrono_literals;

namespace {

HierarchyStore MakeStore() {
    nlohmann::json root = {
        {"overview", "All tools"},
        {"categories", {
            {"mail", {
                {"description", "Mail tools"},
                {"tools", {
                    {"send", {
                        {"description", "Send a message"},
                        {"server", "gmail"},
                        {"maps_to", "send_message"},
                        {"input_schema", {{"type", "object"},
                                          {"properties", {{"to", {{"type", "string"}}}}}}},
                    }},
                    {"delete", {
                        {"description", "Delete a message"},
                        {"server", "gmail"},
                    }},
                }},
            }},
        }},
    };
    auto store = HierarchyStore::FromJson(root);
    REQUIRE(store.IsOk());
    return std::move(store).Value();
}

// Denies tool paths listed in `denied`; records every check.
class RecordingPolicy : public IToolPolicy {
public:
    Result<void, Error> Check(const std::string& tool_path,
                              const nlohmann::json& arguments) override {
        checked.push_back({tool_path, arguments});
        for (const auto& d : denied) {
            if (d == tool_path) {
                return Result<void, Error>::Err(Error::Make(
                    ErrorCategory::PolicyDenied, "PolicyHook", tool_path, "not allowed"));
            }
        }
        return Result<void, Error>::Ok();
    }

    std::vector<std::string> denied;
    std::vector<std::pair<std::string, nlohmann::json>> checked;
};

struct Fixture {
    HierarchyStore store = MakeStore();
    MockConnector connector;
    ServerRegistry registry{{MakeBackend("gmail")}, connector};
    Dispatcher dispatcher{store, registry, 30000ms};
    RecordingPolicy policy;
    ToolRegistry tools;

    explicit Fixture(bool with_policy = false) {
        RegisterGatewayTools(tools, dispatcher, with_policy ? &policy : nullptr);
    }

    // Parse the JSON text block of an error or listing result.
    static nlohmann::json TextJson(const ToolResult& result) {
        return nlohmann::json::parse(result.content[0]["text"].get<std::string>());
    }
};

} // anonymous namespace

// ===========================================================================
// Registration
// ===========================================================================

TEST_CASE("Gateway tools: exactly two tools are exposed", "[mcp][gateway]") {
    Fixture f;
    REQUIRE(f.tools.Tools().size() == 2);
    CHECK(f.tools.Tools()[0].name == "get_tools_in_category");
    CHECK(f.tools.Tools()[1].name == "execute_tool");
    CHECK(f.tools.Tools()[1].input_schema["required"][0] == "tool_path");
}

// ===========================================================================
// get_tools_in_category
// ===========================================================================

TEST_CASE("get_tools_in_category: root listing", "[mcp][gateway]") {
    Fixture f;
    auto result = f.tools.Execute("get_tools_in_category", {{"path", ""}});
    REQUIRE_FALSE(result.is_error);

    auto listing = Fixture::TextJson(result);
    CHECK(listing["path"] == "");
    CHECK(listing["overview"] == "All tools");
    CHECK(listing["categories"]["mail"] == "Mail tools");
    CHECK(listing["tools"].empty());
    CHECK_FALSE(listing.contains("schemas"));
}

TEST_CASE("get_tools_in_category: path defaults to root", "[mcp][gateway]") {
    Fixture f;
    auto result = f.tools.Execute("get_tools_in_category", nlohmann::json::object());
    REQUIRE_FALSE(result.is_error);
    CHECK(Fixture::TextJson(result)["categories"].contains("mail"));
}

TEST_CASE("get_tools_in_category: tools carry their schemas", "[mcp][gateway]") {
    Fixture f;
    auto result = f.tools.Execute("get_tools_in_category", {{"path", "mail"}});
    REQUIRE_FALSE(result.is_error);

    auto listing = Fixture::TextJson(result);
    CHECK(listing["tools"]["send"] == "Send a message");
    CHECK(listing["schemas"]["send"]["properties"].contains("to"));
    CHECK(listing["schemas"]["delete"] == nlohmann::json::object());
    CHECK(f.connector.TotalStarts() == 0);
}

TEST_CASE("get_tools_in_category: errors are structured", "[mcp][gateway]") {
    Fixture f;

    auto missing = f.tools.Execute("get_tools_in_category", {{"path", "nope"}});
    REQUIRE(missing.is_error);
    CHECK(Fixture::TextJson(missing)["error"]["category"] == "path_not_found");

    auto tool = f.tools.Execute("get_tools_in_category", {{"path", "mail.send"}});
    REQUIRE(tool.is_error);
    CHECK(Fixture::TextJson(tool)["error"]["category"] == "not_a_category");

    auto bad = f.tools.Execute("get_tools_in_category", {{"path", 3}});
    REQUIRE(bad.is_error);
    CHECK(Fixture::TextJson(bad)["error"]["category"] == "invalid_argument");
}

// ===========================================================================
// execute_tool
// ===========================================================================

TEST_CASE("execute_tool: routes to the backend's native tool", "[mcp][gateway]") {
    Fixture f;
    nlohmann::json args = {{"to", "a@example.com"}, {"nested", {{"k", {1, 2}}}}};
    auto result = f.tools.Execute("execute_tool",
                                  {{"tool_path", "mail.send"}, {"arguments", args}});
    REQUIRE_FALSE(result.is_error);
    CHECK(result.content[0]["text"] == "gmail:send_message");

    auto calls = f.connector.Tracker().Calls();
    REQUIRE(calls.size() == 1);
    CHECK(calls[0].tool == "send_message");
    CHECK(calls[0].arguments == args);
}

TEST_CASE("execute_tool: missing or null arguments become an empty object", "[mcp][gateway]") {
    Fixture f;
    CHECK_FALSE(f.tools.Execute("execute_tool", {{"tool_path", "mail.delete"}}).is_error);
    CHECK_FALSE(f.tools.Execute("execute_tool",
                                {{"tool_path", "mail.delete"}, {"arguments", nullptr}})
                    .is_error);

    auto calls = f.connector.Tracker().Calls();
    REQUIRE(calls.size() == 2);
    CHECK(calls[0].arguments == nlohmann::json::object());
    CHECK(calls[1].arguments == nlohmann::json::object());
}

TEST_CASE("execute_tool: parameter validation", "[mcp][gateway]") {
    Fixture f;

    auto no_path = f.tools.Execute("execute_tool", nlohmann::json::object());
    REQUIRE(no_path.is_error);
    CHECK(Fixture::TextJson(no_path)["error"]["category"] == "invalid_argument");

    auto bad_args = f.tools.Execute("execute_tool",
                                    {{"tool_path", "mail.send"}, {"arguments", "to=x"}});
    REQUIRE(bad_args.is_error);
    CHECK(Fixture::TextJson(bad_args)["error"]["category"] == "invalid_argument");
    CHECK(f.connector.TotalStarts() == 0);
}

TEST_CASE("execute_tool: a category path is not executable", "[mcp][gateway]") {
    Fixture f;
    auto result = f.tools.Execute("execute_tool", {{"tool_path", "mail"}});
    REQUIRE(result.is_error);
    auto error = Fixture::TextJson(result)["error"];
    CHECK(error["category"] == "not_a_tool");
    CHECK(error["target"] == "mail");
    CHECK(f.connector.TotalStarts() == 0);
}

TEST_CASE("execute_tool: a backend's failed result is passed through", "[mcp][gateway]") {
    Fixture f;
    nlohmann::json payload = {
        {"content", {{{"type", "text"}, {"text", "quota exceeded"}}}},
        {"isError", true},
    };
    auto error = Error::Make(ErrorCategory::BackendError, "CallTool", "gmail", "quota exceeded");
    error.backend_detail = payload.dump();
    f.connector.Behavior("gmail").erroring_calls = 1;
    f.connector.Behavior("gmail").call_error = error;

    auto result = f.tools.Execute("execute_tool", {{"tool_path", "mail.send"}});
    REQUIRE(result.is_error);
    CHECK(result.ToJson() == payload);
}

TEST_CASE("execute_tool: transport failures come back as error JSON", "[mcp][gateway]") {
    Fixture f;
    f.connector.Behavior("gmail").erroring_calls = 1;

    auto result = f.tools.Execute("execute_tool", {{"tool_path", "mail.send"}});
    REQUIRE(result.is_error);
    CHECK(Fixture::TextJson(result)["error"]["category"] == "timeout");
}

TEST_CASE("execute_tool: spawn failure is reported", "[mcp][gateway]") {
    Fixture f;
    f.connector.Behavior("gmail").failing_starts = 1;

    auto result = f.tools.Execute("execute_tool", {{"tool_path", "mail.send"}});
    REQUIRE(result.is_error);
    CHECK(Fixture::TextJson(result)["error"]["category"] == "server_spawn_failed");
}

// ===========================================================================
// Policy
// ===========================================================================

TEST_CASE("execute_tool: policy sees the call before dispatch", "[mcp][gateway][policy]") {
    Fixture f(true);
    nlohmann::json args = {{"to", "b@example.com"}};
    auto result = f.tools.Execute("execute_tool",
                                  {{"tool_path", "mail.send"}, {"arguments", args}});
    REQUIRE_FALSE(result.is_error);
    REQUIRE(f.policy.checked.size() == 1);
    CHECK(f.policy.checked[0].first == "mail.send");
    CHECK(f.policy.checked[0].second == args);
}

TEST_CASE("execute_tool: policy denial prevents dispatch", "[mcp][gateway][policy]") {
    Fixture f(true);
    f.policy.denied = {"mail.delete"};

    auto result = f.tools.Execute("execute_tool", {{"tool_path", "mail.delete"}});
    REQUIRE(result.is_error);
    auto error = Fixture::TextJson(result)["error"];
    CHECK(error["category"] == "policy_denied");
    CHECK(error["message"] == "not allowed");
    CHECK(f.connector.TotalStarts() == 0);
    CHECK(f.connector.Tracker().CallCount() == 0);
}

TEST_CASE("execute_tool: browsing does not consult the policy", "[mcp][gateway][policy]") {
    Fixture f(true);
    auto listing = f.tools.Execute("get_tools_in_category", {{"path", "mail"}});
    CHECK_FALSE(listing.is_error);
    CHECK(f.policy.checked.empty());
}

// ===========================================================================
// End to end through the MCP server
// ===========================================================================

TEST_CASE("Gateway tools: tools/call over stdio", "[mcp][gateway]") {
    Fixture f;
    std::string input =
        nlohmann::json({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/call"},
                        {"params", {{"name", "execute_tool"},
                                    {"arguments", {{"tool_path", "mail.send"}}}}}})
            .dump() + "\n";
    std::istringstream in(input);
    std::ostringstream out;

    McpServer server(std::move(f.tools), 2, in, out);
    server.Run();

    auto response = nlohmann::json::parse(out.str());
    CHECK(response["id"] == 1);
    CHECK(response["result"]["content"][0]["text"] == "gmail:send_message");
    CHECK_FALSE(response["result"].contains("isError"));
}
