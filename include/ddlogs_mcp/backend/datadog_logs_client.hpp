#pragma once

#include <ddlogs_mcp/backend/i_http_session.hpp>
#include <ddlogs_mcp/backend/i_log_search_backend.hpp>

#include <string>
#include <string_view>

namespace ddlogs_mcp {

// ---------------------------------------------------------------------------
// DatadogLogsClient - Datadog Logs API v2 search.
//
// Endpoint: POST /api/v2/logs/events/search
// Body:     {"filter":{"query","from","to"},"page":{"limit"},"sort":"-timestamp"}
//
// Authentication headers are expected to be configured on the session (see
// MakeDatadogHeaders). One page is fetched per Search call; no retries.
// ---------------------------------------------------------------------------
class DatadogLogsClient : public ILogSearchBackend {
public:
    explicit DatadogLogsClient(IHttpSession& session);

    [[nodiscard]] Result<std::vector<LogRecord>, Error> Search(
        const LogSearchRequest& request) override;

private:
    IHttpSession& session_;
};

// Headers every Datadog API request carries.
HttpHeaders MakeDatadogHeaders(const std::string& api_key,
                               const std::string& app_key);

// Exposed for tests.
[[nodiscard]] std::string BuildLogSearchBody(const LogSearchRequest& request);
[[nodiscard]] Result<std::vector<LogRecord>, Error> ParseLogSearchResponse(
    std::string_view body);

} // namespace ddlogs_mcp
