#pragma once

#include "tool_registry.h"

#include <string>

namespace ldmcp::mcp::handlers {

std::string handle_leptos_autofixer(const ToolArguments& args, const ServerContext& ctx);

}  // namespace ldmcp::mcp::handlers
