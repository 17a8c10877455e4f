#pragma once

#include <ddlogs_mcp/backend/i_log_search_backend.hpp>
#include <ddlogs_mcp/core/time_util.hpp>
#include <ddlogs_mcp/mcp/tool_registry.hpp>

#include <functional>

namespace ddlogs_mcp {

constexpr const char* kQueryLogsTool = "query_logs";

using NowFn = std::function<TimePoint()>;

// Input schema advertised for query_logs.
[[nodiscard]] nlohmann::json QueryLogsSchema();

// Register the log tools with the MCP tool registry. Handlers capture
// &backend by reference; `now` is sampled once per call.
void RegisterLogTools(ToolRegistry& registry, ILogSearchBackend& backend,
                      NowFn now = [] { return Clock::now(); });

} // namespace ddlogs_mcp
