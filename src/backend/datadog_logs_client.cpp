#include <ddlogs_mcp/backend/datadog_logs_client.hpp>

#include <ddlogs_mcp/core/log.hpp>

#include <nlohmann/json.hpp>

namespace ddlogs_mcp {

namespace {

const char* kSearchPath = "/api/v2/logs/events/search";

Error MakeBadResponse(const std::string& message) {
    return Error{"SearchLogs", kSearchPath, std::nullopt, message,
                 ErrorCategory::BadResponse};
}

std::string StringField(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

Result<LogRecord, Error> ParseLogEvent(const nlohmann::json& event) {
    if (!event.is_object()) {
        return Result<LogRecord, Error>::Err(
            MakeBadResponse("log event is not a JSON object"));
    }

    LogRecord record;
    record.id = StringField(event, "id");

    auto attrs_it = event.find("attributes");
    if (attrs_it == event.end() || attrs_it->is_null()) {
        return Result<LogRecord, Error>::Ok(std::move(record));
    }
    if (!attrs_it->is_object()) {
        return Result<LogRecord, Error>::Err(
            MakeBadResponse("attributes of log " + record.id + " is not an object"));
    }
    const auto& attrs = *attrs_it;

    auto ts = attrs.find("timestamp");
    if (ts != attrs.end() && ts->is_string()) {
        record.timestamp = ts->get<std::string>();
    }
    record.message = StringField(attrs, "message");
    record.status = StringField(attrs, "status");
    record.service = StringField(attrs, "service");

    auto tags = attrs.find("tags");
    if (tags != attrs.end() && tags->is_array()) {
        for (const auto& tag : *tags) {
            if (tag.is_string()) {
                record.tags.push_back(tag.get<std::string>());
            }
        }
    }

    auto custom = attrs.find("attributes");
    if (custom != attrs.end() && custom->is_object()) {
        record.attributes = *custom;
    }

    return Result<LogRecord, Error>::Ok(std::move(record));
}

} // anonymous namespace

HttpHeaders MakeDatadogHeaders(const std::string& api_key,
                               const std::string& app_key) {
    return {
        {"DD-API-KEY", api_key},
        {"DD-APPLICATION-KEY", app_key},
        {"Accept", "application/json"},
    };
}

std::string BuildLogSearchBody(const LogSearchRequest& request) {
    nlohmann::json body = {
        {"filter", {
            {"query", request.query},
            {"from", request.from},
            {"to", request.to},
        }},
        {"page", {{"limit", request.limit}}},
        {"sort", request.sort == LogSortOrder::NewestFirst ? "-timestamp"
                                                           : "timestamp"},
    };
    return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Result<std::vector<LogRecord>, Error> ParseLogSearchResponse(std::string_view body) {
    using R = Result<std::vector<LogRecord>, Error>;

    auto doc = nlohmann::json::parse(body.begin(), body.end(), nullptr,
                                     /*allow_exceptions=*/false);
    if (doc.is_discarded()) {
        return R::Err(MakeBadResponse("response is not valid JSON"));
    }
    if (!doc.is_object()) {
        return R::Err(MakeBadResponse("response is not a JSON object"));
    }

    std::vector<LogRecord> records;
    auto data = doc.find("data");
    if (data == doc.end() || data->is_null()) {
        return R::Ok(std::move(records));
    }
    if (!data->is_array()) {
        return R::Err(MakeBadResponse("'data' is not an array"));
    }

    records.reserve(data->size());
    for (const auto& event : *data) {
        auto record = ParseLogEvent(event);
        if (record.IsErr()) {
            return R::Err(std::move(record).Error());
        }
        records.push_back(std::move(record).Value());
    }
    return R::Ok(std::move(records));
}

DatadogLogsClient::DatadogLogsClient(IHttpSession& session) : session_(session) {}

Result<std::vector<LogRecord>, Error> DatadogLogsClient::Search(
    const LogSearchRequest& request) {
    using R = Result<std::vector<LogRecord>, Error>;

    const auto body = BuildLogSearchBody(request);
    LogDebug("datadog", "search body: " + body);

    auto response = session_.Post(kSearchPath, body, "application/json");
    if (response.IsErr()) {
        return R::Err(std::move(response).Error());
    }

    const auto& http = response.Value();
    if (http.status_code < 200 || http.status_code >= 300) {
        return R::Err(Error::FromHttpStatus("SearchLogs", kSearchPath,
                                            http.status_code, http.body));
    }

    auto records = ParseLogSearchResponse(http.body);
    if (records.IsOk()) {
        LogInfo("datadog", "search returned " +
                               std::to_string(records.Value().size()) + " logs");
    }
    return records;
}

} // namespace ddlogs_mcp
