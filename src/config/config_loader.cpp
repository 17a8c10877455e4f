#include <ddlogs_mcp/config/config_loader.hpp>

#include <ddlogs_mcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdlib>

namespace ddlogs_mcp {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, ErrorCategory::Config};
}

Result<LogFormat, Error> ParseLogFormat(const std::string& value) {
    if (value == "text") return Result<LogFormat, Error>::Ok(LogFormat::Text);
    if (value == "json") return Result<LogFormat, Error>::Ok(LogFormat::Json);
    return Result<LogFormat, Error>::Err(
        MakeConfigError("Invalid log_format '" + value + "' (expected text or json)"));
}

std::optional<std::string> GetEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) return std::nullopt;
    return std::string(value);
}

} // anonymous namespace

const std::vector<std::string>& KnownSites() {
    static const std::vector<std::string> sites = {
        "datadoghq.com",
        "us3.datadoghq.com",
        "us5.datadoghq.com",
        "datadoghq.eu",
        "ap1.datadoghq.com",
        "ap2.datadoghq.com",
        "ddog-gov.com",
    };
    return sites;
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    AppConfig config;
    try {
        if (const auto dd = root["datadog"]) {
            if (dd["api_key"] || dd["app_key"]) {
                return Result<AppConfig, Error>::Err(MakeConfigError(
                    "Keys must not be stored in the config file; "
                    "use api_key_env/app_key_env instead"));
            }
            if (dd["site"]) {
                config.datadog.site = dd["site"].as<std::string>();
                config.site_set = true;
            }
            if (dd["api_url"]) {
                config.datadog.api_url = dd["api_url"].as<std::string>();
            }
            if (dd["api_key_env"]) {
                config.datadog.api_key_env = dd["api_key_env"].as<std::string>();
            }
            if (dd["app_key_env"]) {
                config.datadog.app_key_env = dd["app_key_env"].as<std::string>();
            }
        }

        if (root["timeout"]) {
            config.timeout_seconds = root["timeout"].as<int>();
            config.timeout_set = true;
        }
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        if (root["log_format"]) {
            auto format = ParseLogFormat(root["log_format"].as<std::string>());
            if (format.IsErr()) {
                return Result<AppConfig, Error>::Err(format.Error());
            }
            config.log_format = format.Value();
            config.log_format_set = true;
        }
        if (root["log_level"]) {
            auto level = ParseLogLevel(root["log_level"].as<std::string>());
            if (level.IsErr()) {
                return Result<AppConfig, Error>::Err(MakeConfigError(level.Error()));
            }
            config.log_level = level.Value();
            config.log_level_set = true;
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program(kServerName, kVersion);
    program.add_description(
        "MCP server exposing Datadog log search over stdin/stdout.\n"
        "Reads DD_API_KEY and DD_APP_KEY (required) and DD_SITE from the environment.");

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--site")
        .help("Datadog site, e.g. datadoghq.eu");
    program.add_argument("--api-url")
        .help("Override the Datadog API base URL");
    program.add_argument("--timeout")
        .help("HTTP read timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--log-file")
        .help("Append logs to this file instead of stderr");
    program.add_argument("--log-json")
        .help("Write logs as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("-v", "--verbose")
        .help("Shorthand for --log-level info")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliOptions options;
    auto& config = options.config;

    if (auto val = program.present("--config")) {
        options.config_path = *val;
    }
    if (auto val = program.present("--site")) {
        config.datadog.site = *val;
        config.site_set = true;
    }
    if (auto val = program.present("--api-url")) {
        config.datadog.api_url = *val;
    }
    if (auto val = program.present<int>("--timeout")) {
        config.timeout_seconds = *val;
        config.timeout_set = true;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    if (program.get<bool>("--log-json")) {
        config.log_format = LogFormat::Json;
        config.log_format_set = true;
    }
    if (program.get<bool>("--verbose")) {
        config.log_level = LogLevel::Info;
        config.log_level_set = true;
    }
    if (auto val = program.present("--log-level")) {
        auto level = ParseLogLevel(*val);
        if (level.IsErr()) {
            return Result<CliOptions, Error>::Err(
                MakeConfigError("Invalid --log-level: " + level.Error()));
        }
        config.log_level = level.Value();
        config.log_level_set = true;
    }

    return Result<CliOptions, Error>::Ok(std::move(options));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& base, const AppConfig& overrides) {
    AppConfig merged = base;

    if (!overrides.datadog.api_key.empty()) {
        merged.datadog.api_key = overrides.datadog.api_key;
    }
    if (!overrides.datadog.app_key.empty()) {
        merged.datadog.app_key = overrides.datadog.app_key;
    }
    if (overrides.site_set) {
        merged.datadog.site = overrides.datadog.site;
        merged.site_set = true;
    }
    if (overrides.datadog.api_url.has_value()) {
        merged.datadog.api_url = overrides.datadog.api_url;
    }
    if (overrides.timeout_set) {
        merged.timeout_seconds = overrides.timeout_seconds;
        merged.timeout_set = true;
    }
    if (overrides.log_file.has_value()) {
        merged.log_file = overrides.log_file;
    }
    if (overrides.log_format_set) {
        merged.log_format = overrides.log_format;
        merged.log_format_set = true;
    }
    if (overrides.log_level_set) {
        merged.log_level = overrides.log_level;
        merged.log_level_set = true;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ResolveEnvironment
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveEnvironment(AppConfig config) {
    if (config.datadog.api_key_env.empty() || config.datadog.app_key_env.empty()) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("api_key_env and app_key_env must name environment variables"));
    }

    if (auto key = GetEnv(config.datadog.api_key_env)) {
        config.datadog.api_key = *key;
    }
    if (auto key = GetEnv(config.datadog.app_key_env)) {
        config.datadog.app_key = *key;
    }
    if (auto site = GetEnv("DD_SITE"); site.has_value() && !site->empty()) {
        config.datadog.site = *site;
        config.site_set = true;
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    const auto& dd = config.datadog;
    if (dd.api_key.empty() || dd.app_key.empty()) {
        return Result<void, Error>::Err(MakeConfigError(
            dd.api_key_env + " and " + dd.app_key_env +
            " environment variables must be set"));
    }
    if (dd.api_url.has_value()) {
        const auto& url = *dd.api_url;
        if (url.rfind("https://", 0) != 0 && url.rfind("http://", 0) != 0) {
            return Result<void, Error>::Err(
                MakeConfigError("api_url must start with http:// or https://, got '" +
                                url + "'"));
        }
        // httplib::Client keeps only scheme, host and port.
        auto path = url.find('/', url.find("://") + 3);
        if (path != std::string::npos &&
            url.find_first_not_of('/', path) != std::string::npos) {
            return Result<void, Error>::Err(
                MakeConfigError("api_url must not contain a path, got '" +
                                url + "'"));
        }
    } else {
        const auto& sites = KnownSites();
        if (std::find(sites.begin(), sites.end(), dd.site) == sites.end()) {
            return Result<void, Error>::Err(
                MakeConfigError("Unknown Datadog site '" + dd.site +
                                "' (set api_url to use a custom endpoint)"));
        }
    }
    if (config.timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Timeout must be positive, got " +
                            std::to_string(config.timeout_seconds)));
    }
    return Result<void, Error>::Ok();
}

std::string ApiBaseUrl(const DatadogConfig& config) {
    if (config.api_url.has_value()) {
        auto url = *config.api_url;
        while (!url.empty() && url.back() == '/') {
            url.pop_back();
        }
        return url;
    }
    return "https://api." + config.site;
}

} // namespace ddlogs_mcp
