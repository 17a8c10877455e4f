#pragma once

#include <ddlogs_mcp/core/result.hpp>

#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace ddlogs_mcp {

// ---------------------------------------------------------------------------
// ToolSchema - JSON Schema for a tool's input parameters.
// ---------------------------------------------------------------------------
struct ToolSchema {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object
};

// A tool handler takes the call arguments and returns the tool's result
// document. The server renders that document into MCP content.
using ToolHandler =
    std::function<Result<nlohmann::json, Error>(const nlohmann::json& arguments)>;

// ---------------------------------------------------------------------------
// ToolRegistry - registry of MCP tools, kept in registration order.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    // Registering an existing name replaces its schema and handler.
    void Register(const std::string& name,
                  const std::string& description,
                  const nlohmann::json& input_schema,
                  ToolHandler handler);

    // Register a tool as a validate/invoke pair. `validate` turns raw
    // arguments into typed params; `invoke` runs only when it succeeds.
    template <typename Params>
    void RegisterTool(
        const std::string& name,
        const std::string& description,
        const nlohmann::json& input_schema,
        std::function<Result<Params, Error>(const nlohmann::json&)> validate,
        std::function<Result<nlohmann::json, Error>(const Params&)> invoke) {
        Register(name, description, input_schema,
                 [validate = std::move(validate), invoke = std::move(invoke)](
                     const nlohmann::json& arguments) -> Result<nlohmann::json, Error> {
                     auto params = validate(arguments);
                     if (params.IsErr()) {
                         return Result<nlohmann::json, Error>::Err(
                             std::move(params).Error());
                     }
                     return invoke(params.Value());
                 });
    }

    [[nodiscard]] const std::vector<ToolSchema>& Tools() const noexcept {
        return schemas_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;

    // Check the arguments against the tool's input schema, then run it.
    // Unknown tools are MethodNotFound; a handler that throws becomes an
    // Internal error.
    [[nodiscard]] Result<nlohmann::json, Error> Execute(
        const std::string& name, const nlohmann::json& arguments) const;

private:
    std::vector<ToolSchema> schemas_;
    std::map<std::string, ToolHandler> handlers_;
};

} // namespace ddlogs_mcp
