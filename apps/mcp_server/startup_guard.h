#pragma once

#include "config.h"
#include <string>

namespace ldmcp::mcp {

// validate_mcp_server_config checks startup preconditions for the MCP server.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - the command line produced no argument errors
// - log_level names a known level (it may come from the environment)
[[nodiscard]] std::string validate_mcp_server_config(const McpServerConfig& config);

}  // namespace ldmcp::mcp
