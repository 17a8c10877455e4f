#pragma once

#include <ddlogs_mcp/core/result.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace ddlogs_mcp {

enum class LogSortOrder {
    NewestFirst,
    OldestFirst,
};

// ---------------------------------------------------------------------------
// LogSearchRequest - one page of a log search, with absolute RFC3339 bounds.
// ---------------------------------------------------------------------------
struct LogSearchRequest {
    std::string query;
    std::string from;
    std::string to;
    int limit = 50;
    LogSortOrder sort = LogSortOrder::NewestFirst;
};

// ---------------------------------------------------------------------------
// LogRecord - a log event as returned by the backend.
// ---------------------------------------------------------------------------
struct LogRecord {
    std::string id;
    std::optional<std::string> timestamp;
    std::string message;
    std::string status;
    std::string service;
    std::vector<std::string> tags;
    std::optional<nlohmann::json> attributes;  // free-form object, if sent
};

// ---------------------------------------------------------------------------
// ILogSearchBackend - the external log-search service.
//
// Authentication, endpoint selection and retries (if any) belong to the
// implementation. Failures are returned as Err, never thrown.
// ---------------------------------------------------------------------------
class ILogSearchBackend {
public:
    virtual ~ILogSearchBackend() = default;

    [[nodiscard]] virtual Result<std::vector<LogRecord>, Error> Search(
        const LogSearchRequest& request) = 0;
};

} // namespace ddlogs_mcp
