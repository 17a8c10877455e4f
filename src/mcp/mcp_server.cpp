#include <ddlogs_mcp/mcp/mcp_server.hpp>

#include <ddlogs_mcp/core/log.hpp>
#include <ddlogs_mcp/core/version.hpp>
#include <ddlogs_mcp/mcp/message_reader.hpp>
#include <ddlogs_mcp/mcp/protocol.hpp>

namespace ddlogs_mcp {

McpServer::McpServer(ToolRegistry registry,
                     std::istream& in,
                     std::ostream& out)
    : registry_(std::move(registry)), in_(in), out_(out) {}

void McpServer::Run() {
    LogInfo("mcp", "serving " + std::to_string(registry_.Tools().size()) +
                       " tool(s) on stdio");

    JsonMessageReader reader(in_);
    while (auto next = reader.Next()) {
        if (next->IsErr()) {
            LogWarn("mcp", "skipping undecodable input: " + next->Error());
            continue;
        }

        auto response = HandleMessage(next->Value());
        if (response) {
            WriteResponse(*response);
        }
    }

    LogInfo("mcp", "end of input after " + std::to_string(reader.LineNumber()) +
                       " line(s), shutting down");
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) {
    if (!message.is_object()) {
        LogWarn("mcp", std::string("ignoring non-object message of type ") +
                           message.type_name());
        return std::nullopt;
    }

    auto decoded = DecodeRequest(message);
    if (decoded.IsErr()) {
        auto id_it = message.find("id");
        const nlohmann::json id = id_it != message.end() ? *id_it : nlohmann::json();
        LogWarn("mcp", decoded.Error().message);
        return MakeError(id, decoded.Error());
    }

    const auto& request = decoded.Value();
    if (request.IsNotification()) {
        LogDebug("mcp", "notification " + request.method);
        return std::nullopt;
    }

    LogDebug("mcp", "request " + request.method);

    if (request.method == "initialize") {
        return HandleInitialize(request.id);
    } else if (request.method == "tools/list") {
        return HandleToolsList(request.id);
    } else if (request.method == "tools/call") {
        return HandleToolsCall(request.params, request.id);
    }
    return MakeError(request.id, rpc_code::kMethodNotFound,
                     "unknown method: " + request.method);
}

nlohmann::json McpServer::HandleInitialize(const nlohmann::json& id) {
    nlohmann::json result;
    result["protocolVersion"] = kMcpProtocolVersion;
    result["capabilities"] = {
        {"tools", nlohmann::json::object()}
    };
    result["serverInfo"] = {
        {"name", kServerName},
        {"version", kVersion}
    };

    return MakeResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) {
    nlohmann::json tools = nlohmann::json::array();

    for (const auto& schema : registry_.Tools()) {
        tools.push_back({
            {"name", schema.name},
            {"description", schema.description},
            {"inputSchema", schema.input_schema}
        });
    }

    return MakeResult(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(
    const nlohmann::json& params, const nlohmann::json& id) {
    auto call = DecodeToolCallParams(params);
    if (call.IsErr()) {
        return MakeError(id, call.Error());
    }

    const auto& tool_name = call.Value().name;
    if (!registry_.HasTool(tool_name)) {
        return MakeError(id, rpc_code::kMethodNotFound,
                         "unknown tool: " + tool_name);
    }

    auto result = registry_.Execute(tool_name, call.Value().arguments);
    if (result.IsErr()) {
        LogWarn("mcp", tool_name + " failed: " + result.Error().ToString());
        return MakeError(id, result.Error());
    }

    std::string text;
    try {
        text = result.Value().dump(2);
    } catch (const nlohmann::json::type_error& e) {
        LogError("mcp", std::string("cannot serialize tool result: ") + e.what());
        return MakeError(id, rpc_code::kInternalError,
                         std::string("failed to serialize result: ") + e.what());
    }

    nlohmann::json content = nlohmann::json::array({
        {{"type", "text"}, {"text", std::move(text)}}
    });
    return MakeResult(id, {{"content", std::move(content)}});
}

void McpServer::WriteResponse(const nlohmann::json& response) {
    out_ << response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
         << "\n";
    out_.flush();
    if (!out_) {
        LogError("mcp", "failed to write response to output stream");
    }
}

} // namespace ddlogs_mcp
