#include "tool_registry.h"

#include "get_documentation.h"
#include "leptos_autofixer.h"
#include "list_sections.h"

#include <utility>

namespace ldmcp::mcp::handlers {

using json = nlohmann::json;

namespace {

json object_schema(json properties, json required) {
  return json{
      {"type", "object"},
      {"properties", std::move(properties)},
      {"required", std::move(required)},
  };
}

}  // namespace

ToolRegistry build_tool_registry() {
  return {
      {"list-sections", handle_list_sections},
      {"get-documentation", handle_get_documentation},
      {"leptos-autofixer", handle_leptos_autofixer},
  };
}

std::vector<OperationDescriptor> describe_tools() {
  std::vector<OperationDescriptor> tools;

  tools.push_back({
      "list-sections",
      "List all available Leptos documentation sections with their use cases",
      object_schema(json::object(), json::array()),
  });

  tools.push_back({
      "get-documentation",
      "Get Leptos documentation for a specific section. Pass section name like 'signals', "
      "'components', 'routing'",
      object_schema(
          {{"section",
            {{"type", "string"}, {"description", "Section name or path to retrieve"}}}},
          json::array({"section"})),
  });

  tools.push_back({
      "leptos-autofixer",
      "Analyze Leptos code and suggest fixes for common issues",
      object_schema({{"code", {{"type", "string"}, {"description", "Leptos code to analyze"}}}},
                    json::array({"code"})),
  });

  return tools;
}

const std::string& argument_or_empty(const ToolArguments& args, const std::string& name) {
  static const std::string kEmpty;
  auto it = args.find(name);
  return it == args.end() ? kEmpty : it->second;
}

}  // namespace ldmcp::mcp::handlers
