#pragma once

#include "ldmcp/analysis/autofixer.h"
#include "ldmcp/core/logger.h"
#include "ldmcp/docs/doc_catalog.h"

#include "capability_table.h"
#include "handlers/tool_registry.h"

namespace ldmcp::mcp {

// ServerContext holds the process-lifetime, read-only state every method and
// tool handler may consult. All referents are built once in main() and must
// outlive run_server_loop().
struct ServerContext {
  const CapabilityTable& capabilities;     // NOLINT(readability-identifier-naming)
  const handlers::ToolRegistry& tools;     // NOLINT(readability-identifier-naming)
  const docs::DocCatalog& catalog;         // NOLINT(readability-identifier-naming)
  const analysis::Autofixer& autofixer;    // NOLINT(readability-identifier-naming)
  const core::Logger& logger;              // NOLINT(readability-identifier-naming)
};

}  // namespace ldmcp::mcp
