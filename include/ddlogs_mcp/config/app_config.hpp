#pragma once

#include <ddlogs_mcp/core/log.hpp>

#include <optional>
#include <string>

namespace ddlogs_mcp {

constexpr const char* kDefaultSite = "datadoghq.com";
constexpr int kDefaultTimeoutSeconds = 30;

struct DatadogConfig {
    std::string api_key;
    std::string app_key;
    std::string site = kDefaultSite;
    std::optional<std::string> api_url;      // overrides https://api.<site>
    std::string api_key_env = "DD_API_KEY";  // env var names to read keys from
    std::string app_key_env = "DD_APP_KEY";
};

enum class LogFormat {
    Text,
    Json,
};

struct AppConfig {
    DatadogConfig datadog;
    int timeout_seconds = kDefaultTimeoutSeconds;
    std::optional<std::string> log_file;
    LogFormat log_format = LogFormat::Text;
    LogLevel log_level = LogLevel::Warn;

    // Which fields were set explicitly; consulted by MergeConfigs.
    bool site_set = false;
    bool timeout_set = false;
    bool log_format_set = false;
    bool log_level_set = false;
};

} // namespace ddlogs_mcp
