#include <catch2/catch_test_macros.hpp>

#include <lazymcp/backend/stdio_transport.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <thread>

using namespace lazymcp;
using namespace std::chrono_literals;

namespace {

const std::string kFakeServer = std::string(LAZYMCP_TEST_DATA_DIR) + "/fake_mcp_server.sh";

std::unique_ptr<StdioTransport> StartFakeServer() {
    SpawnOptions options;
    options.command = "sh";
    options.args = {kFakeServer};
    auto process = Subprocess::Spawn(options);
    REQUIRE(process.IsOk());
    return std::make_unique<StdioTransport>("fake", std::move(process).Value());
}

nlohmann::json Call(int id, const std::string& tool) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", "tools/call"},
        {"params", {{"name", tool}, {"arguments", nlohmann::json::object()}}},
    };
}

std::string ReplyText(const nlohmann::json& response) {
    return response["result"]["content"][0]["text"].get<std::string>();
}

Deadline In(std::chrono::milliseconds ms) {
    return SteadyClock::now() + ms;
}

} // anonymous namespace

TEST_CASE("StdioTransport: request gets the matching response", "[backend][stdio]") {
    auto transport = StartFakeServer();
    auto response = transport->Request(Call(1, "echo"), In(5s));
    REQUIRE(response.IsOk());
    CHECK(response.Value()["id"] == 1);
    CHECK(ReplyText(response.Value()) == "echo");
    CHECK(transport->IsAlive());
}

TEST_CASE("StdioTransport: skips non-JSON output and notifications", "[backend][stdio]") {
    auto transport = StartFakeServer();
    auto response = transport->Request(Call(7, "noisy"), In(5s));
    REQUIRE(response.IsOk());
    CHECK(ReplyText(response.Value()) == "noisy");
}

TEST_CASE("StdioTransport: discards responses for other ids", "[backend][stdio]") {
    auto transport = StartFakeServer();
    auto response = transport->Request(Call(3, "stale"), In(5s));
    REQUIRE(response.IsOk());
    CHECK(response.Value()["id"] == 3);
    CHECK(ReplyText(response.Value()) == "stale");
}

TEST_CASE("StdioTransport: answers server requests with method-not-found", "[backend][stdio]") {
    auto transport = StartFakeServer();
    auto response = transport->Request(Call(4, "ask"), In(5s));
    REQUIRE(response.IsOk());
    CHECK(ReplyText(response.Value()) == "rejected");
}

TEST_CASE("StdioTransport: deadline expiry is a Timeout and the late reply is dropped",
          "[backend][stdio]") {
    auto transport = StartFakeServer();

    auto timed_out = transport->Request(Call(10, "slow"), In(200ms));
    REQUIRE(timed_out.IsErr());
    CHECK(timed_out.Error().category == ErrorCategory::Timeout);
    CHECK(timed_out.Error().target == "fake");
    CHECK(transport->IsAlive());

    auto next = transport->Request(Call(11, "echo"), In(5s));
    REQUIRE(next.IsOk());
    CHECK(next.Value()["id"] == 11);
    CHECK(ReplyText(next.Value()) == "echo");
}

TEST_CASE("StdioTransport: a crashed server is a BackendError", "[backend][stdio]") {
    auto transport = StartFakeServer();
    auto response = transport->Request(Call(5, "crash"), In(5s));
    REQUIRE(response.IsErr());
    CHECK(response.Error().category == ErrorCategory::BackendError);

    // The child may take a moment to be reaped.
    for (int i = 0; i < 100 && transport->IsAlive(); ++i) {
        std::this_thread::sleep_for(10ms);
    }
    CHECK_FALSE(transport->IsAlive());
}

TEST_CASE("StdioTransport: closed transport refuses requests", "[backend][stdio]") {
    auto transport = StartFakeServer();
    transport->Close();
    CHECK_FALSE(transport->IsAlive());

    auto response = transport->Request(Call(1, "echo"), In(1s));
    REQUIRE(response.IsErr());
    CHECK(response.Error().category == ErrorCategory::BackendError);

    auto notified = transport->Notify({{"jsonrpc", "2.0"}, {"method", "x"}}, In(1s));
    CHECK(notified.IsErr());
}
