#pragma once

#include <ddlogs_mcp/backend/i_log_search_backend.hpp>
#include <ddlogs_mcp/core/result.hpp>
#include <ddlogs_mcp/core/time_util.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ddlogs_mcp {

constexpr int kDefaultLogLimit = 50;
constexpr int kMaxLogLimit = 1000;
constexpr std::chrono::hours kDefaultLookback{1};

// ---------------------------------------------------------------------------
// QueryParams - validated arguments of the query_logs tool.
// ---------------------------------------------------------------------------
struct QueryParams {
    std::string query;
    TimePoint from;
    TimePoint to;
    int limit = kDefaultLogLimit;
};

// ---------------------------------------------------------------------------
// LogEntry / QueryResult - what query_logs returns to the client.
// ---------------------------------------------------------------------------
struct LogEntry {
    std::string id;
    std::optional<std::string> timestamp;
    std::string message;
    std::string status;
    std::string service;
    std::vector<std::string> tags;
    std::optional<nlohmann::json> attributes;
};

struct QueryResult {
    std::vector<LogEntry> logs;  // newest first
    std::string query;
    std::string from;            // RFC3339, as searched
    std::string to;

    [[nodiscard]] size_t Count() const noexcept { return logs.size(); }
};

// Resolve a from/to argument. Empty -> fallback; RFC3339 -> as given;
// Go duration -> now minus the duration; anything else is InvalidParams.
[[nodiscard]] Result<TimePoint, Error> ResolveTimeArgument(std::string_view value,
                                                           TimePoint fallback,
                                                           TimePoint now);

// Validate and normalize raw query_logs arguments. `now` is sampled once by
// the caller; from defaults to now - 1h and to defaults to now. `to` earlier
// than `from` is passed through.
[[nodiscard]] Result<QueryParams, Error> NormalizeLogQuery(
    const nlohmann::json& arguments, TimePoint now);

// Run the search against the backend. Backend failures come back as one
// Error whose message starts with "failed to query logs: ".
[[nodiscard]] Result<QueryResult, Error> SearchLogs(ILogSearchBackend& backend,
                                                    const QueryParams& params);

[[nodiscard]] nlohmann::json ToJson(const LogEntry& entry);
[[nodiscard]] nlohmann::json ToJson(const QueryResult& result);

} // namespace ddlogs_mcp
