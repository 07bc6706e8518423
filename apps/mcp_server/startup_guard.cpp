#include "startup_guard.h"

#include "ldmcp/core/logger.h"

namespace ldmcp::mcp {

std::string validate_mcp_server_config(const McpServerConfig& config) {
  if (!config.argument_errors.empty()) {
    return "Error: " + config.argument_errors.front() +
           "\n       Run with --help to list accepted options.";
  }

  if (!core::parse_log_level(config.log_level).has_value()) {
    return "Error: log level '" + config.log_level +
           "' is not valid.\n"
           "       Accepted levels: error, warn, info, debug (via --log-level or " +
           kLogLevelEnvVar + ").";
  }

  return "";
}

}  // namespace ldmcp::mcp
