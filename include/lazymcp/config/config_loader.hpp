#pragma once

#include <lazymcp/config/app_config.hpp>
#include <lazymcp/core/result.hpp>

#include <string>
#include <string_view>

namespace lazymcp {

// Parse a YAML config file into a GatewayConfig. A relative hierarchy path
// is resolved against the directory of the config file.
Result<GatewayConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse YAML text. Relative paths are kept as written.
Result<GatewayConfig, Error> LoadFromYamlString(std::string_view yaml);

// Parse CLI arguments.
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv);

// Apply CLI overrides on top of the file configuration.
GatewayConfig MergeConfigs(const GatewayConfig& yaml_base, const CliOptions& cli_overrides);

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const GatewayConfig& config);

} // namespace lazymcp
