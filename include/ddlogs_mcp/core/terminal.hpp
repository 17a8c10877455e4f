#pragma once

namespace ddlogs_mcp {

/// Returns true if stderr is a terminal (log output goes there).
bool IsStderrTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Colour only when stderr is a terminal and NO_COLOR is unset.
bool ShouldColorLogs();

} // namespace ddlogs_mcp
