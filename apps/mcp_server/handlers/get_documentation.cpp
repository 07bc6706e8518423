#include "get_documentation.h"

#include "../server_context.h"

namespace ldmcp::mcp::handlers {

std::string handle_get_documentation(const ToolArguments& args, const ServerContext& ctx) {
  const std::string& query = argument_or_empty(args, "section");

  auto section = ctx.catalog.find_section(query);
  if (!section.has_value()) {
    return "Section '" + query + "' not found. Use list-sections to see available sections.";
  }

  std::string result = "# " + section->title + "\n\n";
  result.append(section->content);
  return result;
}

}  // namespace ldmcp::mcp::handlers
