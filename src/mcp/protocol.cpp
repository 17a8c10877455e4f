#include <ddlogs_mcp/mcp/protocol.hpp>

namespace ddlogs_mcp {

namespace {

Error InvalidRequest(const std::string& message) {
    return Error{"DecodeRequest", "", std::nullopt, message,
                 ErrorCategory::InvalidRequest};
}

} // anonymous namespace

Result<Request, Error> DecodeRequest(const nlohmann::json& message) {
    using R = Result<Request, Error>;

    if (!message.is_object()) {
        return R::Err(InvalidRequest("invalid request: message must be a JSON object"));
    }

    auto version = message.find("jsonrpc");
    if (version == message.end() || !version->is_string() ||
        version->get<std::string>() != kJsonRpcVersion) {
        return R::Err(InvalidRequest("invalid request: jsonrpc must be \"2.0\""));
    }

    auto method = message.find("method");
    if (method == message.end() || !method->is_string()) {
        return R::Err(InvalidRequest("invalid request: method must be a string"));
    }

    Request request;
    request.method = method->get<std::string>();

    auto id = message.find("id");
    if (id != message.end()) {
        request.id = *id;
        request.has_id = true;
    }

    auto params = message.find("params");
    if (params != message.end()) {
        request.params = *params;
    }

    return R::Ok(std::move(request));
}

Result<ToolCallParams, Error> DecodeToolCallParams(const nlohmann::json& params) {
    using R = Result<ToolCallParams, Error>;

    if (params.is_null()) {
        return R::Err(Error::InvalidParams("tools/call", "tool name is required"));
    }
    if (!params.is_object()) {
        return R::Err(Error::InvalidParams("tools/call", "params must be an object"));
    }

    auto name = params.find("name");
    if (name == params.end() || !name->is_string() ||
        name->get<std::string>().empty()) {
        return R::Err(Error::InvalidParams("tools/call", "tool name is required"));
    }

    ToolCallParams call;
    call.name = name->get<std::string>();
    call.arguments = nlohmann::json::object();

    auto arguments = params.find("arguments");
    if (arguments != params.end() && !arguments->is_null()) {
        if (!arguments->is_object()) {
            return R::Err(Error::InvalidParams("tools/call", "arguments must be an object"));
        }
        call.arguments = *arguments;
    }

    return R::Ok(std::move(call));
}

nlohmann::json MakeResult(const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"result", result}
    };
}

nlohmann::json MakeError(const nlohmann::json& id, int code,
                         const std::string& message) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

nlohmann::json MakeError(const nlohmann::json& id, const Error& error) {
    return MakeError(id, error.RpcCode(), error.message);
}

} // namespace ddlogs_mcp
