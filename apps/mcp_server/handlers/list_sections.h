#pragma once

#include "tool_registry.h"

#include <string>

namespace ldmcp::mcp::handlers {

std::string handle_list_sections(const ToolArguments& args, const ServerContext& ctx);

}  // namespace ldmcp::mcp::handlers
