#include <catch2/catch_test_macros.hpp>

#include <lazymcp/config/config_loader.hpp>

#include <filesystem>
#include <string>
#include <vector>

using namespace lazymcp;
using namespace std::chrono_literals;

namespace {

std::string TestDataPath(const std::string& filename) {
    return std::string(LAZYMCP_TEST_DATA_DIR) + "/config/" + filename;
}

Result<CliOptions, Error> ParseArgs(std::vector<const char*> args) {
    args.insert(args.begin(), "lazymcp");
    return LoadFromCli(static_cast<int>(args.size()), args.data());
}

GatewayConfig MinimalConfig() {
    GatewayConfig config;
    config.hierarchy_path = "/tmp/hierarchy";
    BackendConfig server;
    server.name = "serena";
    server.command = "uvx";
    config.servers.push_back(server);
    return config;
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("gateway.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.call_timeout == 45000ms);
    CHECK(config.workers == 4);
    CHECK(config.registry.cooldown == 1000ms);
    CHECK(config.registry.max_cooldown == 60000ms);
    CHECK(config.registry.max_failures == 3);

    REQUIRE(config.policy_hook.has_value());
    CHECK(config.policy_hook->command == "/usr/local/bin/check-tool");
    CHECK(config.policy_hook->args == std::vector<std::string>{"--strict"});
    CHECK(config.policy_hook->env.at("LAZY_MCP_DENIED_TOOLS") == "gmail.delete_email");
    CHECK(config.policy_hook->timeout == 2000ms);
    CHECK(config.policy_hook->match == std::vector<std::string>{"gmail.*"});

    CHECK(config.log.level == LogLevel::Debug);
    CHECK(config.log.json);
    CHECK_FALSE(config.log.file.has_value());

    REQUIRE(config.servers.size() == 3);

    const auto& serena = config.servers[0];
    CHECK(serena.name == "serena");
    CHECK(serena.transport == TransportKind::Stdio);
    CHECK(serena.command == "uvx");
    CHECK((serena.args == std::vector<std::string>{"serena", "start-mcp-server"}));
    CHECK(serena.env.at("SERENA_LOG") == "warn");
    CHECK(serena.startup_timeout == 20000ms);
    CHECK_FALSE(serena.call_timeout.has_value());
    CHECK(serena.preload);

    const auto& gmail = config.servers[1];
    CHECK(gmail.transport == TransportKind::Http);
    CHECK(gmail.url == "http://localhost:9000/mcp");
    CHECK(gmail.headers.at("Authorization") == "Bearer secret");
    REQUIRE(gmail.call_timeout.has_value());
    CHECK(*gmail.call_timeout == 15000ms);
    CHECK_FALSE(gmail.preload);

    CHECK(config.servers[2].transport == TransportKind::Http);

    CHECK(ValidateConfig(config).IsOk());
}

TEST_CASE("LoadFromYaml: relative hierarchy path resolves against the file", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("gateway.yaml"));
    REQUIRE(result.IsOk());

    namespace fs = std::filesystem;
    auto expected = (fs::path(LAZYMCP_TEST_DATA_DIR) / "hierarchy").lexically_normal();
    CHECK(fs::path(result.Value().hierarchy_path) == expected);
}

TEST_CASE("LoadFromYaml: missing file", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("does_not_exist.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().target == TestDataPath("does_not_exist.yaml"));
}

TEST_CASE("LoadFromYaml: syntax error", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("bad_syntax.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().message.find("Failed to parse YAML file") != std::string::npos);
}

// ===========================================================================
// LoadFromYamlString
// ===========================================================================

TEST_CASE("LoadFromYamlString: empty document gives defaults", "[config][yaml]") {
    auto result = LoadFromYamlString("");
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK(config.hierarchy_path.empty());
    CHECK(config.call_timeout == 60000ms);
    CHECK(config.workers == 8);
    CHECK(config.registry.cooldown == 5000ms);
    CHECK(config.registry.max_failures == 5);
    CHECK_FALSE(config.policy_hook.has_value());
    CHECK(config.log.level == LogLevel::Info);
    CHECK(config.servers.empty());
}

TEST_CASE("LoadFromYamlString: relative paths kept as written", "[config][yaml]") {
    auto result = LoadFromYamlString("hierarchy: tools/root.json\n");
    REQUIRE(result.IsOk());
    CHECK(result.Value().hierarchy_path == "tools/root.json");
}

TEST_CASE("LoadFromYamlString: structural errors", "[config][yaml]") {
    SECTION("unknown transport") {
        auto r = LoadFromYamlString("servers:\n  - name: x\n    transport: sse\n");
        REQUIRE(r.IsErr());
        CHECK(r.Error().message == "Unknown transport 'sse'");
        CHECK(r.Error().target == "x");
    }
    SECTION("server without name") {
        auto r = LoadFromYamlString("servers:\n  - command: uvx\n");
        REQUIRE(r.IsErr());
        CHECK(r.Error().message.find("'name'") != std::string::npos);
    }
    SECTION("servers not a list") {
        auto r = LoadFromYamlString("servers:\n  serena: uvx\n");
        REQUIRE(r.IsErr());
        CHECK(r.Error().message == "'servers' must be a list");
    }
    SECTION("unknown log level") {
        auto r = LoadFromYamlString("log:\n  level: loud\n");
        REQUIRE(r.IsErr());
        CHECK(r.Error().message == "Unknown log level 'loud'");
    }
    SECTION("wrong value type") {
        auto r = LoadFromYamlString("call_timeout_ms: soon\n");
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::Config);
    }
    SECTION("zero workers") {
        auto r = LoadFromYamlString("workers: 0\n");
        REQUIRE(r.IsErr());
    }
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: no arguments", "[config][cli]") {
    auto result = ParseArgs({});
    REQUIRE(result.IsOk());
    const auto& cli = result.Value();
    CHECK_FALSE(cli.config_path.has_value());
    CHECK_FALSE(cli.hierarchy_path.has_value());
    CHECK_FALSE(cli.timeout_ms.has_value());
    CHECK_FALSE(cli.verbose);
    CHECK_FALSE(cli.show_version);
}

TEST_CASE("LoadFromCli: all flags", "[config][cli]") {
    auto result = ParseArgs({"-c", "gw.yaml", "--hierarchy", "/srv/tools", "--timeout", "1500",
                             "--workers", "3", "--log-json", "--log-file", "/tmp/gw.log", "-v"});
    REQUIRE(result.IsOk());
    const auto& cli = result.Value();
    CHECK(cli.config_path == "gw.yaml");
    CHECK(cli.hierarchy_path == "/srv/tools");
    CHECK(cli.timeout_ms == 1500);
    CHECK(cli.workers == 3);
    CHECK(cli.log_json);
    CHECK(cli.log_file == "/tmp/gw.log");
    CHECK(cli.verbose);
    CHECK_FALSE(cli.quiet);
}

TEST_CASE("LoadFromCli: --version", "[config][cli]") {
    auto result = ParseArgs({"--version"});
    REQUIRE(result.IsOk());
    CHECK(result.Value().show_version);
}

TEST_CASE("LoadFromCli: invalid combinations", "[config][cli]") {
    CHECK(ParseArgs({"-v", "-q"}).IsErr());
    CHECK(ParseArgs({"--timeout", "0"}).IsErr());
    CHECK(ParseArgs({"--workers", "0"}).IsErr());
    CHECK(ParseArgs({"--timeout", "soon"}).IsErr());
    CHECK(ParseArgs({"--no-such-flag"}).IsErr());

    auto err = ParseArgs({"-v", "-q"});
    CHECK(err.Error().category == ErrorCategory::Config);
}

// ===========================================================================
// MergeConfigs
// ===========================================================================

TEST_CASE("MergeConfigs: CLI overrides YAML", "[config][merge]") {
    auto base = MinimalConfig();
    base.call_timeout = 10000ms;
    base.log.level = LogLevel::Info;

    CliOptions cli;
    cli.hierarchy_path = "/other";
    cli.timeout_ms = 2500;
    cli.workers = 2;
    cli.log_file = "/tmp/x.log";
    cli.log_json = true;
    cli.quiet = true;

    auto merged = MergeConfigs(base, cli);
    CHECK(merged.hierarchy_path == "/other");
    CHECK(merged.call_timeout == 2500ms);
    CHECK(merged.workers == 2);
    CHECK(merged.log.file == "/tmp/x.log");
    CHECK(merged.log.json);
    CHECK(merged.log.level == LogLevel::Warn);
    CHECK(merged.servers.size() == 1);
}

TEST_CASE("MergeConfigs: unset flags leave YAML values", "[config][merge]") {
    auto base = MinimalConfig();
    base.workers = 5;
    base.log.level = LogLevel::Error;

    auto merged = MergeConfigs(base, CliOptions{});
    CHECK(merged.hierarchy_path == base.hierarchy_path);
    CHECK(merged.workers == 5);
    CHECK(merged.log.level == LogLevel::Error);

    CliOptions verbose;
    verbose.verbose = true;
    CHECK(MergeConfigs(base, verbose).log.level == LogLevel::Debug);
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: minimal config passes", "[config][validate]") {
    CHECK(ValidateConfig(MinimalConfig()).IsOk());
}

TEST_CASE("ValidateConfig: rejects bad values", "[config][validate]") {
    auto config = MinimalConfig();

    SECTION("missing hierarchy") {
        config.hierarchy_path.clear();
    }
    SECTION("non-positive call timeout") {
        config.call_timeout = 0ms;
    }
    SECTION("cooldown above its cap") {
        config.registry.cooldown = 10000ms;
        config.registry.max_cooldown = 5000ms;
    }
    SECTION("max_failures below one") {
        config.registry.max_failures = 0;
    }
    SECTION("policy hook without command") {
        config.policy_hook = PolicyHookConfig{};
    }
    SECTION("duplicate server names") {
        config.servers.push_back(config.servers[0]);
    }
    SECTION("stdio server without command") {
        config.servers[0].command.clear();
    }
    SECTION("http server without url") {
        config.servers[0].transport = TransportKind::Http;
        config.servers[0].url = "localhost:9000";
    }
    SECTION("non-positive per-server call timeout") {
        config.servers[0].call_timeout = 0ms;
    }

    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().operation == "ConfigLoader");
}

TEST_CASE("ValidateConfig: duplicate names point at the server", "[config][validate]") {
    auto config = MinimalConfig();
    config.servers.push_back(config.servers[0]);
    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().target == "serena");
}
