#include <ddlogs_mcp/mcp/log_tools.hpp>

#include <ddlogs_mcp/logs/log_query.hpp>
#include <ddlogs_mcp/mcp/schema_validator.hpp>

namespace ddlogs_mcp {

nlohmann::json QueryLogsSchema() {
    return MakeSchema(
        {{"query", StringProp("Search query using Datadog query syntax "
                              "(e.g., 'service:web status:error')")},
         {"from", StringProp("Start time in RFC3339 format or relative time "
                             "(e.g., '1h', '30m'). Defaults to 1 hour ago.")},
         {"to", StringProp("End time in RFC3339 format or relative time. "
                           "Defaults to now.")},
         {"limit", IntProp("Maximum number of logs to return (max 1000). "
                           "Defaults to 50.")}},
        nlohmann::json::array({"query"}));
}

void RegisterLogTools(ToolRegistry& registry, ILogSearchBackend& backend,
                      NowFn now) {
    registry.RegisterTool<QueryParams>(
        kQueryLogsTool,
        "Search and query Datadog logs with filters and time ranges",
        QueryLogsSchema(),
        [now = std::move(now)](const nlohmann::json& arguments) {
            return NormalizeLogQuery(arguments, now());
        },
        [&backend](const QueryParams& params) {
            return SearchLogs(backend, params).Map(
                [](const QueryResult& result) { return ToJson(result); });
        });
}

} // namespace ddlogs_mcp
