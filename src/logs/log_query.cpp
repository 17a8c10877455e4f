#include <ddlogs_mcp/logs/log_query.hpp>

#include <ddlogs_mcp/core/log.hpp>

#include <algorithm>
#include <limits>

namespace ddlogs_mcp {

namespace {

const char* kOperation = "query_logs";

std::string OptionalString(const nlohmann::json& args, const char* key) {
    auto it = args.find(key);
    if (it == args.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

int ResolveLimit(const nlohmann::json& args) {
    auto it = args.find("limit");
    if (it == args.end() || !it->is_number()) return kDefaultLogLimit;

    const auto requested = it->get<double>();
    if (requested > kMaxLogLimit) return kMaxLogLimit;
    if (requested < 1) return kDefaultLogLimit;
    return static_cast<int>(requested);
}

std::string SingleLine(std::string text) {
    std::replace(text.begin(), text.end(), '\n', ' ');
    std::replace(text.begin(), text.end(), '\r', ' ');
    return text;
}

// now - offset without leaving the clock's range.
bool CanSubtract(TimePoint now, TimePoint::duration offset) {
    using Rep = TimePoint::duration::rep;
    const Rep since = now.time_since_epoch().count();
    const Rep delta = offset.count();
    if (delta > 0) {
        return since >= std::numeric_limits<Rep>::min() + delta;
    }
    return since <= std::numeric_limits<Rep>::max() + delta;
}

LogEntry ToLogEntry(LogRecord record) {
    return LogEntry{
        std::move(record.id),
        std::move(record.timestamp),
        std::move(record.message),
        std::move(record.status),
        std::move(record.service),
        std::move(record.tags),
        std::move(record.attributes),
    };
}

} // anonymous namespace

Result<TimePoint, Error> ResolveTimeArgument(std::string_view value,
                                             TimePoint fallback,
                                             TimePoint now) {
    if (value.empty()) {
        return Result<TimePoint, Error>::Ok(fallback);
    }

    auto absolute = ParseRfc3339(value);
    if (absolute.IsOk()) {
        return Result<TimePoint, Error>::Ok(absolute.Value());
    }

    auto relative = ParseDuration(value);
    if (relative.IsOk()) {
        const auto offset =
            std::chrono::duration_cast<TimePoint::duration>(relative.Value());
        if (CanSubtract(now, offset)) {
            return Result<TimePoint, Error>::Ok(now - offset);
        }
    }

    return Result<TimePoint, Error>::Err(Error::InvalidParams(
        kOperation, "invalid time format: " + std::string(value) +
                        " (use RFC3339 or duration like '1h')"));
}

Result<QueryParams, Error> NormalizeLogQuery(const nlohmann::json& arguments,
                                             TimePoint now) {
    using R = Result<QueryParams, Error>;

    if (!arguments.is_object()) {
        return R::Err(Error::InvalidParams(kOperation, "arguments must be an object"));
    }

    QueryParams params;
    params.query = OptionalString(arguments, "query");
    if (params.query.empty()) {
        return R::Err(Error::InvalidParams(kOperation, "query parameter is required"));
    }

    const auto default_from = now - kDefaultLookback;
    const auto default_to = now;

    auto from = ResolveTimeArgument(OptionalString(arguments, "from"), default_from, now);
    if (from.IsErr()) return R::Err(from.Error());
    auto to = ResolveTimeArgument(OptionalString(arguments, "to"), default_to, now);
    if (to.IsErr()) return R::Err(to.Error());

    params.from = from.Value();
    params.to = to.Value();
    params.limit = ResolveLimit(arguments);
    return R::Ok(std::move(params));
}

Result<QueryResult, Error> SearchLogs(ILogSearchBackend& backend,
                                      const QueryParams& params) {
    using R = Result<QueryResult, Error>;

    LogSearchRequest request;
    request.query = params.query;
    request.from = FormatRfc3339(params.from);
    request.to = FormatRfc3339(params.to);
    request.limit = params.limit;
    request.sort = LogSortOrder::NewestFirst;

    LogInfo("logs", "query '" + request.query + "' from " + request.from +
                        " to " + request.to + " limit " +
                        std::to_string(request.limit));

    auto records = backend.Search(request);
    if (records.IsErr()) {
        auto error = std::move(records).Error();
        LogWarn("logs", error.ToString());
        error.message = "failed to query logs: " + SingleLine(error.message);
        if (!error.IsBackendFailure()) {
            error.category = ErrorCategory::Upstream;
        }
        return R::Err(std::move(error));
    }

    QueryResult result;
    result.query = request.query;
    result.from = request.from;
    result.to = request.to;
    auto found = std::move(records).Value();
    result.logs.reserve(found.size());
    for (auto& record : found) {
        result.logs.push_back(ToLogEntry(std::move(record)));
    }
    return R::Ok(std::move(result));
}

nlohmann::json ToJson(const LogEntry& entry) {
    nlohmann::json j = {
        {"id", entry.id},
        {"timestamp", entry.timestamp.has_value() ? nlohmann::json(*entry.timestamp)
                                                  : nlohmann::json(nullptr)},
        {"message", entry.message},
        {"status", entry.status},
        {"service", entry.service},
        {"tags", entry.tags},
    };
    if (entry.attributes.has_value()) {
        j["attributes"] = *entry.attributes;
    }
    return j;
}

nlohmann::json ToJson(const QueryResult& result) {
    nlohmann::json logs = nlohmann::json::array();
    for (const auto& entry : result.logs) {
        logs.push_back(ToJson(entry));
    }
    return {
        {"logs", std::move(logs)},
        {"count", result.Count()},
        {"query", result.query},
        {"from", result.from},
        {"to", result.to},
    };
}

} // namespace ddlogs_mcp
