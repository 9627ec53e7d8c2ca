#include <catch2/catch_test_macros.hpp>

#include <lazymcp/backend/backend_connector.hpp>

#include <chrono>
#include <string>

using namespace lazymcp;
using namespace std::chrono_literals;

namespace {

BackendConfig FakeServerConfig() {
    BackendConfig config;
    config.name = "fake";
    config.transport = TransportKind::Stdio;
    config.command = "sh";
    config.args = {std::string(LAZYMCP_TEST_DATA_DIR) + "/fake_mcp_server.sh"};
    config.startup_timeout = 5s;
    return config;
}

} // anonymous namespace

TEST_CASE("BackendConnector: starts a stdio backend and calls a tool", "[backend][connector]") {
    BackendConnector connector;
    auto conn = connector.Start(FakeServerConfig());
    REQUIRE(conn.IsOk());

    auto& connection = *conn.Value();
    CHECK(connection.IsAlive());

    auto result = connection.CallTool("echo", {{"text", "hello"}}, 5s);
    REQUIRE(result.IsOk());
    CHECK(result.Value()["content"][0]["text"] == "echo");

    auto tools = connection.ListTools(5s);
    REQUIRE(tools.IsOk());
    REQUIRE(tools.Value().size() == 1);
    CHECK(tools.Value()[0].name == "echo");

    connection.Close();
    CHECK_FALSE(connection.IsAlive());
}

TEST_CASE("BackendConnector: tool errors carry the backend payload", "[backend][connector]") {
    BackendConnector connector;
    auto conn = connector.Start(FakeServerConfig());
    REQUIRE(conn.IsOk());

    auto result = conn.Value()->CallTool("fail", nlohmann::json::object(), 5s);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::BackendError);
    CHECK(result.Error().message == "tool failed");
    REQUIRE(result.Error().backend_detail.has_value());
    CHECK(nlohmann::json::parse(*result.Error().backend_detail)["isError"] == true);
    CHECK(conn.Value()->IsAlive());
}

TEST_CASE("BackendConnector: missing command is a spawn failure", "[backend][connector]") {
    BackendConnector connector;
    auto config = FakeServerConfig();
    config.command = "lazymcp-no-such-command-xyz";
    config.args.clear();

    auto conn = connector.Start(config);
    REQUIRE(conn.IsErr());
    CHECK(conn.Error().category == ErrorCategory::ServerSpawnFailed);
    CHECK(conn.Error().target == "fake");
}

TEST_CASE("BackendConnector: silent backend fails the handshake", "[backend][connector]") {
    BackendConnector connector;
    auto config = FakeServerConfig();
    config.args = {"-c", "sleep 5"};
    config.startup_timeout = 200ms;

    auto started = std::chrono::steady_clock::now();
    auto conn = connector.Start(config);
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(conn.IsErr());
    CHECK(conn.Error().category == ErrorCategory::ServerSpawnFailed);
    CHECK(conn.Error().message.find("Handshake timed out") != std::string::npos);
    CHECK(elapsed < 4s);
}

TEST_CASE("BackendConnector: backend exiting at startup fails", "[backend][connector]") {
    BackendConnector connector;
    auto config = FakeServerConfig();
    config.args = {"-c", "exit 1"};

    auto conn = connector.Start(config);
    REQUIRE(conn.IsErr());
    CHECK(conn.Error().category == ErrorCategory::ServerSpawnFailed);
}

TEST_CASE("BackendConnector: invalid http URL fails", "[backend][connector]") {
    BackendConnector connector;
    BackendConfig config;
    config.name = "remote";
    config.transport = TransportKind::Http;
    config.url = "not-a-url";

    auto conn = connector.Start(config);
    REQUIRE(conn.IsErr());
    CHECK(conn.Error().category == ErrorCategory::ServerSpawnFailed);
    CHECK(conn.Error().target == "remote");
}
