#include "list_sections.h"

#include "../server_context.h"

namespace ldmcp::mcp::handlers {

std::string handle_list_sections(const ToolArguments& /*args*/, const ServerContext& ctx) {
  std::string result;

  for (const auto& section : ctx.catalog.sections()) {
    if (!result.empty()) {
      result += '\n';
    }
    result += "* title: " + section.title + ", use_cases: " + section.use_cases +
              ", path: " + section.path;
  }

  return result;
}

}  // namespace ldmcp::mcp::handlers
