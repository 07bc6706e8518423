#pragma once

namespace ldmcp::core {

// Identity reported to clients during the initialize handshake.
constexpr const char* kServerName = "leptos-mcp-server";
constexpr const char* kBuildVersion = "0.1.0";

// MCP protocol revision this server speaks.
constexpr const char* kProtocolVersion = "2024-11-05";

}  // namespace ldmcp::core
