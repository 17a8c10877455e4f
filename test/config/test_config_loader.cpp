#include <catch2/catch_test_macros.hpp>

#include <ddlogs_mcp/config/config_loader.hpp>

#include <cstdlib>
#include <string>
#include <vector>

#ifdef _WIN32
#include <stdlib.h>  // _putenv_s
#endif

using namespace ddlogs_mcp;

namespace {
void SetEnv(const char* name, const char* value) {
#ifdef _WIN32
    _putenv_s(name, value);
#else
    setenv(name, value, 1);
#endif
}

void UnsetEnv(const char* name) {
#ifdef _WIN32
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
}

// Clears every variable ResolveEnvironment looks at, on entry and exit.
struct EnvGuard {
    EnvGuard() { Clear(); }
    ~EnvGuard() { Clear(); }

    static void Clear() {
        UnsetEnv("DD_API_KEY");
        UnsetEnv("DD_APP_KEY");
        UnsetEnv("DD_SITE");
        UnsetEnv("TEST_DDLOGS_API_KEY");
        UnsetEnv("TEST_DDLOGS_APP_KEY");
    }
};

AppConfig ValidConfig() {
    AppConfig config;
    config.datadog.api_key = "api";
    config.datadog.app_key = "app";
    return config;
}
} // namespace

// ===========================================================================
// Helper: path to test data files
// ===========================================================================

// Tests are run from the build directory; testdata lives in the source tree.
// Use __FILE__ to get the absolute path of this test file and derive testdata path.
namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);   // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.datadog.site == "datadoghq.eu");
    CHECK(config.site_set);
    CHECK(config.datadog.api_key_env == "TEST_DDLOGS_API_KEY");
    CHECK(config.datadog.app_key_env == "TEST_DDLOGS_APP_KEY");
    CHECK(config.datadog.api_key.empty());
    CHECK(config.timeout_seconds == 45);
    CHECK(config.timeout_set);
    REQUIRE(config.log_file.has_value());
    CHECK(*config.log_file == "/tmp/ddlogs-mcp.log");
    CHECK(config.log_format == LogFormat::Json);
    CHECK(config.log_level == LogLevel::Debug);
}

TEST_CASE("LoadFromYaml: minimal config keeps defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.datadog.site == "us5.datadoghq.com");
    CHECK(config.datadog.api_key_env == "DD_API_KEY");
    CHECK(config.timeout_seconds == kDefaultTimeoutSeconds);
    CHECK_FALSE(config.timeout_set);
    CHECK_FALSE(config.log_file.has_value());
    CHECK(config.log_format == LogFormat::Text);
    CHECK(config.log_level == LogLevel::Warn);
}

TEST_CASE("LoadFromYaml: nonexistent file", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("does_not_exist.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("LoadFromYaml: malformed YAML", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("malformed.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("Failed to parse YAML") != std::string::npos);
}

TEST_CASE("LoadFromYaml: keys in the file are rejected", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("keys_in_file.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("api_key_env") != std::string::npos);
}

TEST_CASE("LoadFromYaml: invalid log_format", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("bad_log_format.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("xml") != std::string::npos);
}

TEST_CASE("LoadFromYaml: non-numeric timeout", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("bad_timeout.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: no arguments gives defaults", "[config][cli]") {
    const char* argv[] = {"ddlogs-mcp"};
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsOk());
    const auto& options = result.Value();
    CHECK_FALSE(options.config_path.has_value());
    CHECK_FALSE(options.config.site_set);
    CHECK_FALSE(options.config.log_level_set);
    CHECK(options.config.log_level == LogLevel::Warn);
}

TEST_CASE("LoadFromCli: all value flags", "[config][cli]") {
    const char* argv[] = {
        "ddlogs-mcp",
        "-c", "/etc/ddlogs.yaml",
        "--site", "datadoghq.eu",
        "--api-url", "http://localhost:8080",
        "--timeout", "12",
        "--log-file", "/tmp/x.log",
        "--log-level", "debug",
    };
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsOk());
    const auto& options = result.Value();
    REQUIRE(options.config_path.has_value());
    CHECK(*options.config_path == "/etc/ddlogs.yaml");
    CHECK(options.config.datadog.site == "datadoghq.eu");
    CHECK(options.config.site_set);
    REQUIRE(options.config.datadog.api_url.has_value());
    CHECK(*options.config.datadog.api_url == "http://localhost:8080");
    CHECK(options.config.timeout_seconds == 12);
    CHECK(options.config.timeout_set);
    CHECK(*options.config.log_file == "/tmp/x.log");
    CHECK(options.config.log_level == LogLevel::Debug);
}

TEST_CASE("LoadFromCli: verbose and json flags", "[config][cli]") {
    const char* argv[] = {"ddlogs-mcp", "-v", "--log-json"};
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsOk());
    CHECK(result.Value().config.log_level == LogLevel::Info);
    CHECK(result.Value().config.log_format == LogFormat::Json);
}

TEST_CASE("LoadFromCli: invalid log level", "[config][cli]") {
    const char* argv[] = {"ddlogs-mcp", "--log-level", "loud"};
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("--log-level") != std::string::npos);
}

TEST_CASE("LoadFromCli: unknown flag", "[config][cli]") {
    const char* argv[] = {"ddlogs-mcp", "--bogus"};
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("LoadFromCli: non-numeric timeout", "[config][cli]") {
    const char* argv[] = {"ddlogs-mcp", "--timeout", "soon"};
    int argc = sizeof(argv) / sizeof(argv[0]);

    CHECK(LoadFromCli(argc, argv).IsErr());
}

// ===========================================================================
// MergeConfigs
// ===========================================================================

TEST_CASE("MergeConfigs: explicit overrides win", "[config][merge]") {
    AppConfig base;
    base.datadog.site = "datadoghq.eu";
    base.site_set = true;
    base.timeout_seconds = 45;
    base.timeout_set = true;
    base.log_file = "/tmp/base.log";
    base.datadog.api_key = "base-key";

    AppConfig overrides;
    overrides.datadog.site = "us3.datadoghq.com";
    overrides.site_set = true;
    overrides.log_level = LogLevel::Debug;
    overrides.log_level_set = true;

    auto merged = MergeConfigs(base, overrides);
    CHECK(merged.datadog.site == "us3.datadoghq.com");
    CHECK(merged.timeout_seconds == 45);
    CHECK(*merged.log_file == "/tmp/base.log");
    CHECK(merged.datadog.api_key == "base-key");
    CHECK(merged.log_level == LogLevel::Debug);
}

TEST_CASE("MergeConfigs: unset override fields keep base", "[config][merge]") {
    AppConfig base;
    base.log_format = LogFormat::Json;
    base.log_format_set = true;

    auto merged = MergeConfigs(base, AppConfig{});
    CHECK(merged.log_format == LogFormat::Json);
    CHECK(merged.datadog.site == kDefaultSite);
}

// ===========================================================================
// ResolveEnvironment
// ===========================================================================

TEST_CASE("ResolveEnvironment: reads default key variables", "[config][env]") {
    EnvGuard guard;
    SetEnv("DD_API_KEY", "api-from-env");
    SetEnv("DD_APP_KEY", "app-from-env");

    auto result = ResolveEnvironment(AppConfig{});
    REQUIRE(result.IsOk());
    CHECK(result.Value().datadog.api_key == "api-from-env");
    CHECK(result.Value().datadog.app_key == "app-from-env");
    CHECK(result.Value().datadog.site == kDefaultSite);
}

TEST_CASE("ResolveEnvironment: honours custom variable names", "[config][env]") {
    EnvGuard guard;
    SetEnv("DD_API_KEY", "wrong");
    SetEnv("TEST_DDLOGS_API_KEY", "right-api");
    SetEnv("TEST_DDLOGS_APP_KEY", "right-app");

    AppConfig config;
    config.datadog.api_key_env = "TEST_DDLOGS_API_KEY";
    config.datadog.app_key_env = "TEST_DDLOGS_APP_KEY";

    auto result = ResolveEnvironment(config);
    REQUIRE(result.IsOk());
    CHECK(result.Value().datadog.api_key == "right-api");
    CHECK(result.Value().datadog.app_key == "right-app");
}

TEST_CASE("ResolveEnvironment: DD_SITE overrides file site", "[config][env]") {
    EnvGuard guard;
    SetEnv("DD_SITE", "ap1.datadoghq.com");

    AppConfig config;
    config.datadog.site = "datadoghq.eu";
    config.site_set = true;

    auto result = ResolveEnvironment(config);
    REQUIRE(result.IsOk());
    CHECK(result.Value().datadog.site == "ap1.datadoghq.com");
}

TEST_CASE("ResolveEnvironment: CLI site still wins after merge", "[config][env]") {
    EnvGuard guard;
    SetEnv("DD_SITE", "ap1.datadoghq.com");

    AppConfig cli;
    cli.datadog.site = "datadoghq.eu";
    cli.site_set = true;

    auto env = ResolveEnvironment(AppConfig{});
    REQUIRE(env.IsOk());
    auto merged = MergeConfigs(env.Value(), cli);
    CHECK(merged.datadog.site == "datadoghq.eu");
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: valid config passes", "[config][validate]") {
    CHECK(ValidateConfig(ValidConfig()).IsOk());
}

TEST_CASE("ValidateConfig: missing keys name both variables", "[config][validate]") {
    AppConfig config = ValidConfig();
    config.datadog.app_key.clear();

    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message ==
          "DD_API_KEY and DD_APP_KEY environment variables must be set");
}

TEST_CASE("ValidateConfig: unknown site without api_url", "[config][validate]") {
    AppConfig config = ValidConfig();
    config.datadog.site = "example.com";

    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("example.com") != std::string::npos);
}

TEST_CASE("ValidateConfig: api_url bypasses the site check", "[config][validate]") {
    AppConfig config = ValidConfig();
    config.datadog.site = "example.com";
    config.datadog.api_url = "http://127.0.0.1:8126";
    CHECK(ValidateConfig(config).IsOk());
}

TEST_CASE("ValidateConfig: api_url needs an http scheme", "[config][validate]") {
    AppConfig config = ValidConfig();
    config.datadog.api_url = "ftp://example.com";
    CHECK(ValidateConfig(config).IsErr());
}

TEST_CASE("ValidateConfig: api_url with a path prefix is rejected", "[config][validate]") {
    AppConfig config = ValidConfig();
    config.datadog.api_url = "https://proxy.internal/dd";

    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("must not contain a path") != std::string::npos);

    config.datadog.api_url = "https://proxy.internal:8443/";
    CHECK(ValidateConfig(config).IsOk());
}

TEST_CASE("ValidateConfig: timeout must be positive", "[config][validate]") {
    AppConfig config = ValidConfig();
    config.timeout_seconds = 0;
    CHECK(ValidateConfig(config).IsErr());
}

TEST_CASE("ValidateConfig: every known site is accepted", "[config][validate]") {
    for (const auto& site : KnownSites()) {
        AppConfig config = ValidConfig();
        config.datadog.site = site;
        CHECK(ValidateConfig(config).IsOk());
    }
}

// ===========================================================================
// ApiBaseUrl
// ===========================================================================

TEST_CASE("ApiBaseUrl: derived from site", "[config]") {
    DatadogConfig dd;
    dd.site = "datadoghq.eu";
    CHECK(ApiBaseUrl(dd) == "https://api.datadoghq.eu");
}

TEST_CASE("ApiBaseUrl: api_url wins and loses trailing slash", "[config]") {
    auto result = LoadFromYaml(TestDataPath("custom_url_config.yaml"));
    REQUIRE(result.IsOk());
    CHECK(ApiBaseUrl(result.Value().datadog) == "http://127.0.0.1:8126");
}
