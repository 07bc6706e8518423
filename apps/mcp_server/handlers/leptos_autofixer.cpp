#include "leptos_autofixer.h"

#include "../server_context.h"

namespace ldmcp::mcp::handlers {

std::string handle_leptos_autofixer(const ToolArguments& args, const ServerContext& ctx) {
  const auto findings = ctx.autofixer.analyze(argument_or_empty(args, "code"));
  return analysis::format_findings(findings);
}

}  // namespace ldmcp::mcp::handlers
