#pragma once

#include <ddlogs_mcp/config/app_config.hpp>
#include <ddlogs_mcp/core/result.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace ddlogs_mcp {

// Datadog sites accepted without an explicit api_url.
const std::vector<std::string>& KnownSites();

// Parse a YAML config file into an AppConfig. Credentials are never read
// from the file; only the names of the variables that hold them.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// CLI arguments, plus the config file path if -c/--config was given.
struct CliOptions {
    AppConfig config;
    std::optional<std::string> config_path;
};

// Parse CLI arguments. --help and --version are handled by argparse.
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: fields set in overrides replace those in base.
AppConfig MergeConfigs(const AppConfig& base, const AppConfig& overrides);

// Fill the API/application keys from the environment variables named in
// config.datadog, and DD_SITE when no site was set explicitly.
Result<AppConfig, Error> ResolveEnvironment(AppConfig config);

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Base URL for the Datadog API: api_url if set, else https://api.<site>.
std::string ApiBaseUrl(const DatadogConfig& config);

} // namespace ddlogs_mcp
