#include <ddlogs_mcp/mcp/tool_registry.hpp>

#include <ddlogs_mcp/core/log.hpp>
#include <ddlogs_mcp/mcp/schema_validator.hpp>

#include <algorithm>

namespace ddlogs_mcp {

void ToolRegistry::Register(const std::string& name,
                            const std::string& description,
                            const nlohmann::json& input_schema,
                            ToolHandler handler) {
    auto existing = std::find_if(schemas_.begin(), schemas_.end(),
                                 [&](const ToolSchema& s) { return s.name == name; });
    if (existing != schemas_.end()) {
        *existing = ToolSchema{name, description, input_schema};
    } else {
        schemas_.push_back({name, description, input_schema});
    }
    handlers_[name] = std::move(handler);
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

Result<nlohmann::json, Error> ToolRegistry::Execute(
    const std::string& name, const nlohmann::json& arguments) const {
    using R = Result<nlohmann::json, Error>;

    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return R::Err(Error{name, "", std::nullopt, "unknown tool: " + name,
                            ErrorCategory::MethodNotFound});
    }

    auto schema = std::find_if(schemas_.begin(), schemas_.end(),
                               [&](const ToolSchema& s) { return s.name == name; });
    if (schema != schemas_.end()) {
        auto valid = ValidateArguments(name, schema->input_schema, arguments);
        if (valid.IsErr()) {
            return R::Err(std::move(valid).Error());
        }
    }

    try {
        return it->second(arguments);
    } catch (const std::exception& e) {
        LogError("mcp", "tool " + name + " threw: " + e.what());
        return R::Err(Error{name, "", std::nullopt,
                            std::string("tool error: ") + e.what(),
                            ErrorCategory::Internal});
    }
}

} // namespace ddlogs_mcp
