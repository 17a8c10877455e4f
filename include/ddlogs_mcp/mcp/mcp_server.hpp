#pragma once

#include <ddlogs_mcp/mcp/tool_registry.hpp>

#include <iostream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace ddlogs_mcp {

// ---------------------------------------------------------------------------
// McpServer - MCP 2024-11-05 server over stdin/stdout.
//
// Implements JSON-RPC 2.0 with the MCP methods:
//   - initialize
//   - tools/list
//   - tools/call
//   - notifications/* (no response)
// Stdout carries only protocol responses, one JSON object per line.
// ---------------------------------------------------------------------------
class McpServer {
public:
    explicit McpServer(ToolRegistry registry,
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout);

    // Run the server loop (blocks until EOF on the input stream).
    void Run();

    // Process a single JSON-RPC message and return the response (if any).
    // Returns nullopt for notifications and non-object messages.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

private:
    nlohmann::json HandleInitialize(const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id);
    void WriteResponse(const nlohmann::json& response);

    ToolRegistry registry_;
    std::istream& in_;
    std::ostream& out_;
};

} // namespace ddlogs_mcp
