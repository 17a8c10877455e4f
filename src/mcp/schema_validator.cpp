#include <ddlogs_mcp/mcp/schema_validator.hpp>

#include <algorithm>
#include <cmath>

namespace ddlogs_mcp {

namespace {

bool MatchesType(const std::string& type, const nlohmann::json& value) {
    if (type == "string") return value.is_string();
    if (type == "boolean") return value.is_boolean();
    if (type == "object") return value.is_object();
    if (type == "array") return value.is_array();
    if (type == "number") return value.is_number();
    if (type == "integer") {
        if (value.is_number_integer()) return true;
        if (!value.is_number_float()) return false;
        const auto d = value.get<double>();
        return std::isfinite(d) && std::floor(d) == d;
    }
    // Unknown or missing type: no constraint.
    return true;
}

bool IsRequired(const nlohmann::json& required, const std::string& name) {
    if (!required.is_array()) return false;
    return std::any_of(required.begin(), required.end(),
                       [&](const nlohmann::json& r) {
                           return r.is_string() && r.get<std::string>() == name;
                       });
}

std::string TypeOf(const nlohmann::json& prop) {
    if (!prop.is_object()) return "";
    auto it = prop.find("type");
    if (it == prop.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

} // anonymous namespace

Result<void, Error> ValidateArguments(const std::string& tool_name,
                                      const nlohmann::json& schema,
                                      const nlohmann::json& arguments) {
    using R = Result<void, Error>;

    if (!arguments.is_object()) {
        return R::Err(Error::InvalidParams(tool_name, "arguments must be an object"));
    }
    if (!schema.is_object()) {
        return R::Ok();
    }

    const auto required = schema.value("required", nlohmann::json::array());
    if (required.is_array()) {
        for (const auto& r : required) {
            if (!r.is_string()) continue;
            const auto name = r.get<std::string>();
            auto it = arguments.find(name);
            if (it == arguments.end() || it->is_null()) {
                return R::Err(Error::InvalidParams(
                    tool_name, name + " parameter is required"));
            }
        }
    }

    const auto properties = schema.value("properties", nlohmann::json::object());
    if (!properties.is_object()) {
        return R::Ok();
    }

    for (const auto& [name, prop] : properties.items()) {
        auto it = arguments.find(name);
        if (it == arguments.end() || it->is_null()) continue;

        const auto type = TypeOf(prop);
        if (!MatchesType(type, *it)) {
            // A required string of the wrong type is reported as missing.
            if (type == "string" && IsRequired(required, name)) {
                return R::Err(Error::InvalidParams(
                    tool_name, name + " parameter is required and must be of type string"));
            }
            return R::Err(Error::InvalidParams(
                tool_name, name + " parameter must be of type " + type));
        }

        if (type == "array" && prop.contains("items")) {
            const auto item_type = TypeOf(prop["items"]);
            for (const auto& item : *it) {
                if (!MatchesType(item_type, item)) {
                    return R::Err(Error::InvalidParams(
                        tool_name, name + " parameter must be an array of " + item_type));
                }
            }
        }
    }

    return R::Ok();
}

nlohmann::json StringProp(const std::string& description) {
    return {{"type", "string"}, {"description", description}};
}

nlohmann::json IntProp(const std::string& description) {
    return {{"type", "integer"}, {"description", description}};
}

nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const nlohmann::json& required) {
    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

} // namespace ddlogs_mcp
