#pragma once

#include <optional>
#include <string>
#include <vector>

namespace ldmcp::mcp {

// Environment variable consulted for the log level when --log-level is absent.
constexpr const char* kLogLevelEnvVar = "LEPTOS_MCP_LOG";

// McpServerConfig holds all parsed startup flags for the MCP server.
// Every field has an explicit default. Values are stored as given; the
// startup guard decides whether they are acceptable.
struct McpServerConfig {
  std::string log_level{"info"};              // NOLINT(readability-identifier-naming)
  bool show_help{false};                      // NOLINT(readability-identifier-naming)
  std::vector<std::string> argument_errors;  // NOLINT(readability-identifier-naming)
};

// parse_args reads flags from argv, taking the log level default from
// env_log_level when it is set and non-empty.
McpServerConfig parse_args(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                           const std::optional<std::string>& env_log_level);

// parse_args overload that reads kLogLevelEnvVar from the process environment.
McpServerConfig parse_args(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

std::string usage_text();

}  // namespace ldmcp::mcp
