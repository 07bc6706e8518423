#pragma once

#include "tool_registry.h"

#include <string>

namespace ldmcp::mcp::handlers {

// Returns "# <title>\n\n<content>" for the first matching section, or a
// not-found message naming the query.
std::string handle_get_documentation(const ToolArguments& args, const ServerContext& ctx);

}  // namespace ldmcp::mcp::handlers
