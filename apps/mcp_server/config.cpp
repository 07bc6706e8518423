#include "config.h"

#include "ldmcp/core/logger.h"

#include "../shared/arg_parser.h"
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

namespace ldmcp::mcp {

namespace {

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

bool handle_log_level(McpServerConfig& config, const std::string& value) {
  if (!core::parse_log_level(value).has_value()) {
    return false;
  }
  config.log_level = value;
  return true;
}

bool handle_help(McpServerConfig& config, const std::string& /*value*/) {
  config.show_help = true;
  return true;
}

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<apps::Option<McpServerConfig>> build_option_registry() {
  return {
      {"--log-level", true, "Diagnostic verbosity on stderr (error|warn|info|debug)",
       handle_log_level},
      {"--help", false, "Print this help and exit", handle_help},
  };
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Parser
// ────────────────────────────────────────────────────────────────

McpServerConfig parse_args(int argc, char* argv[], const std::optional<std::string>& env_log_level) {
  McpServerConfig defaults;
  if (env_log_level.has_value() && !env_log_level->empty()) {
    defaults.log_level = env_log_level.value();
  }

  auto parsed = apps::parse_options(argc, argv, build_option_registry(), 1, std::move(defaults));
  parsed.config.argument_errors = std::move(parsed.errors);
  return std::move(parsed.config);
}

McpServerConfig parse_args(int argc, char* argv[]) {
  const char* env_value = std::getenv(kLogLevelEnvVar);  // NOLINT(concurrency-mt-unsafe)
  if (env_value == nullptr) {
    return parse_args(argc, argv, std::nullopt);
  }
  return parse_args(argc, argv, std::string(env_value));
}

std::string usage_text() {
  return apps::format_usage("leptos_mcp_server", build_option_registry()) +
         "\nEnvironment:\n  " + kLogLevelEnvVar + "\n      Log level used when --log-level is absent\n";
}

}  // namespace ldmcp::mcp
