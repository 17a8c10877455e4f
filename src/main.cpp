#include <ddlogs_mcp/backend/datadog_logs_client.hpp>
#include <ddlogs_mcp/backend/http_session.hpp>
#include <ddlogs_mcp/config/config_loader.hpp>
#include <ddlogs_mcp/core/log.hpp>
#include <ddlogs_mcp/core/terminal.hpp>
#include <ddlogs_mcp/core/version.hpp>
#include <ddlogs_mcp/mcp/log_tools.hpp>
#include <ddlogs_mcp/mcp/mcp_server.hpp>

#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitConfig  = 1;

void PrintError(const ddlogs_mcp::Error& error) {
    std::cerr << "Error: " << error.message << "\n";
}

// CLI > environment > YAML file > defaults.
ddlogs_mcp::Result<ddlogs_mcp::AppConfig, ddlogs_mcp::Error> LoadConfig(
    int argc, const char* const* argv) {
    using namespace ddlogs_mcp;
    using R = Result<AppConfig, Error>;

    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        return R::Err(cli.Error());
    }
    const auto& options = cli.Value();

    AppConfig base;
    if (options.config_path.has_value()) {
        auto file = LoadFromYaml(*options.config_path);
        if (file.IsErr()) {
            return R::Err(file.Error());
        }
        base = std::move(file).Value();
    }

    auto with_env = ResolveEnvironment(std::move(base));
    if (with_env.IsErr()) {
        return with_env;
    }

    auto config = MergeConfigs(with_env.Value(), options.config);
    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return R::Err(valid.Error());
    }
    return R::Ok(std::move(config));
}

std::unique_ptr<ddlogs_mcp::ILogSink> MakeLogSink(
    const ddlogs_mcp::AppConfig& config) {
    using namespace ddlogs_mcp;

    const bool json = config.log_format == LogFormat::Json;
    if (config.log_file.has_value()) {
        auto file = FileSink::Open(*config.log_file, json);
        if (file.IsOk()) {
            return std::move(file).Value();
        }
        std::cerr << "Warning: " << file.Error().message
                  << "; logging to stderr\n";
    }
    if (json) {
        return std::make_unique<JsonSink>();
    }
    return std::make_unique<TextSink>(ShouldColorLogs());
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace ddlogs_mcp;

    auto loaded = LoadConfig(argc, argv);
    if (loaded.IsErr()) {
        PrintError(loaded.Error());
        return kExitConfig;
    }
    const auto config = std::move(loaded).Value();

    InitGlobalLogger(MakeLogSink(config), config.log_level);
    LogInfo("main", std::string(kServerName) + " " + kVersion + " starting");

    const auto base_url = ApiBaseUrl(config.datadog);
    LogInfo("main", "Datadog API at " + base_url);

    HttpSessionOptions http_options;
    http_options.read_timeout = std::chrono::seconds(config.timeout_seconds);
    http_options.default_headers =
        MakeDatadogHeaders(config.datadog.api_key, config.datadog.app_key);
    HttpSession session(base_url, http_options);
    DatadogLogsClient client(session);

    ToolRegistry registry;
    RegisterLogTools(registry, client);

    McpServer server(std::move(registry));
    server.Run();
    return kExitSuccess;
}
