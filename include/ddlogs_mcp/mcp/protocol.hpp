#pragma once

#include <ddlogs_mcp/core/result.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace ddlogs_mcp {

constexpr const char* kJsonRpcVersion = "2.0";
constexpr const char* kMcpProtocolVersion = "2024-11-05";

// ---------------------------------------------------------------------------
// Request - one decoded JSON-RPC call. `id` is echoed verbatim and never
// interpreted; `params` stays raw until a method decodes it.
// ---------------------------------------------------------------------------
struct Request {
    nlohmann::json id;        // null when absent
    bool has_id = false;
    std::string method;
    nlohmann::json params;    // null when absent

    // MCP notifications carry no id and expect no response.
    [[nodiscard]] bool IsNotification() const {
        return !has_id && method.rfind("notifications/", 0) == 0;
    }
};

// Check the envelope: jsonrpc must be "2.0" and method a string.
// Errors carry ErrorCategory::InvalidRequest.
[[nodiscard]] Result<Request, Error> DecodeRequest(const nlohmann::json& message);

// ---------------------------------------------------------------------------
// ToolCallParams - typed params of tools/call. Absent or null arguments
// decode as an empty object. Errors carry ErrorCategory::InvalidParams.
// ---------------------------------------------------------------------------
struct ToolCallParams {
    std::string name;
    nlohmann::json arguments;
};

[[nodiscard]] Result<ToolCallParams, Error> DecodeToolCallParams(
    const nlohmann::json& params);

// Response envelopes.
nlohmann::json MakeResult(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json MakeError(const nlohmann::json& id, int code,
                         const std::string& message);
nlohmann::json MakeError(const nlohmann::json& id, const Error& error);

} // namespace ddlogs_mcp
