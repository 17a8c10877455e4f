#pragma once

#include <ddlogs_mcp/core/result.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace ddlogs_mcp {

// ---------------------------------------------------------------------------
// Input-schema checks applied to tools/call arguments before a tool runs.
//
// Supports the subset of JSON Schema the tools declare: an object with
// "properties" (each with a "type") and "required". Types: string, integer,
// number, boolean, object, array (with optional typed "items"). Undeclared
// properties are ignored; null counts as absent.
// ---------------------------------------------------------------------------

// Errors carry ErrorCategory::InvalidParams and name the offending property:
//   "<name> parameter is required"
//   "<name> parameter must be of type <type>"
[[nodiscard]] Result<void, Error> ValidateArguments(const std::string& tool_name,
                                                    const nlohmann::json& schema,
                                                    const nlohmann::json& arguments);

// Schema builders used when registering tools.
nlohmann::json StringProp(const std::string& description);
nlohmann::json IntProp(const std::string& description);
nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const nlohmann::json& required);

} // namespace ddlogs_mcp
