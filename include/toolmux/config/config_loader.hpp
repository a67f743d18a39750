#pragma once

#include <toolmux/config/app_config.hpp>
#include <toolmux/core/result.hpp>

#include <string>
#include <string_view>

namespace toolmux {

// Parse a YAML config file into an AppConfig. Endpoint order follows the
// order of aliases under `servers:`.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments into an AppConfig. argv must not contain the
// subcommand word (see StripSubcommand in main).
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: cli_overrides take precedence over yaml_base.
// CLI endpoints with an alias already present in yaml_base replace it;
// others are appended.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Validate that at least one endpoint is configured and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Handshake identity used when the config names none: toolmux/<kVersion>.
ClientIdentity DefaultClientIdentity();

// Split "NAME=URL" into an SSE EndpointConfig.
Result<EndpointConfig, Error> ParseServerSpec(std::string_view spec);

} // namespace toolmux
