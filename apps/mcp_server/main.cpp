#include "ldmcp/analysis/autofixer.h"
#include "ldmcp/core/logger.h"
#include "ldmcp/core/version.h"
#include "ldmcp/docs/doc_catalog.h"

#include "capability_table.h"
#include "config.h"
#include "handlers/tool_registry.h"
#include "server_context.h"
#include "server_loop.h"
#include "startup_guard.h"
#include <exception>
#include <iostream>
#include <string>

using namespace ldmcp;

// ────────────────────────────────────────────────────────────────
// Main
// ────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
  auto config = mcp::parse_args(argc, argv);

  if (config.show_help) {
    std::cerr << mcp::usage_text();
    return 0;
  }

  // Validate config before emitting any startup output so no partial messages appear on error.
  const std::string config_error = mcp::validate_mcp_server_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  // stdout carries the protocol; every diagnostic goes to stderr.
  const core::Logger logger(std::cerr, core::parse_log_level(config.log_level).value());

  logger.info(std::string("Starting ") + core::kServerName + " v" + core::kBuildVersion);

  // Process-lifetime, read-only state shared by every handler.
  const auto catalog = docs::make_leptos_catalog();
  const analysis::Autofixer autofixer;
  const auto tools = mcp::handlers::build_tool_registry();

  try {
    const mcp::CapabilityTable capabilities(mcp::handlers::describe_tools());
    for (const auto& descriptor : capabilities.capabilities()) {
      if (tools.find(descriptor.name) == tools.end()) {
        logger.error("Advertised tool has no handler: " + descriptor.name);
        return 1;
      }
    }
    for (const auto& [name, handler] : tools) {
      if (capabilities.find(name) == nullptr) {
        logger.error("Registered tool is not advertised: " + name);
        return 1;
      }
    }

    logger.info("Documentation sections: " + std::to_string(catalog.size()) +
                ", tools: " + std::to_string(capabilities.capabilities().size()));
    logger.info("Listening on stdio for JSON-RPC requests...");

    const mcp::ServerContext ctx{capabilities, tools, catalog, autofixer, logger};
    const auto end = mcp::run_server_loop(std::cin, std::cout, ctx);
    return end == mcp::SessionEnd::kEndOfInput ? 0 : 1;
  } catch (const std::exception& e) {
    logger.error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
