#pragma once

#include "../capability_table.h"

#include <functional>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace ldmcp::mcp {
struct ServerContext;
}  // namespace ldmcp::mcp

namespace ldmcp::mcp::handlers {

// Arguments arrive as name -> string. A missing argument reads as "".
using ToolArguments = std::map<std::string, std::string>;

// A tool returns human-readable text for both success and domain failure.
// Throwing is reserved for unexpected faults; the dispatcher reports those
// as an error content block.
using ToolHandler = std::function<std::string(const ToolArguments& args, const ServerContext& ctx)>;

using ToolRegistry = std::unordered_map<std::string, ToolHandler>;

ToolRegistry build_tool_registry();

// describe_tools returns the descriptors for every tool in build_tool_registry(),
// in the order clients see them.
std::vector<OperationDescriptor> describe_tools();

// argument_or_empty looks up name in args, returning "" when absent.
const std::string& argument_or_empty(const ToolArguments& args, const std::string& name);

}  // namespace ldmcp::mcp::handlers
