#pragma once

#include "ldmcp/core/result.h"

#include <nlohmann/json.hpp>

#include "handlers/tool_registry.h"
#include "mcp_protocol.h"
#include "server_context.h"
#include <functional>
#include <string>
#include <unordered_map>

namespace ldmcp::mcp {

// A method either produces a result payload or a protocol-level error.
using MethodResult = core::Result<nlohmann::json, JsonRpcError>;

using MethodHandler =
    std::function<MethodResult(const JsonRpcRequest& req, const ServerContext& ctx)>;

using MethodRegistry = std::unordered_map<std::string, MethodHandler>;

MethodResult handle_initialize(const JsonRpcRequest& req, const ServerContext& ctx);
MethodResult handle_tools_list(const JsonRpcRequest& req, const ServerContext& ctx);
MethodResult handle_ping(const JsonRpcRequest& req, const ServerContext& ctx);

// handle_tools_call expects params {name, arguments?}.
// Protocol errors (kInvalidRequest): params absent, name absent or not a
// string, name not in the tool registry. A tool that throws yields a
// successful result whose content block is flagged isError.
MethodResult handle_tools_call(const JsonRpcRequest& req, const ServerContext& ctx);

MethodRegistry build_method_registry();

// dispatch_request routes a request (one carrying an id) to its handler.
// Unrecognised methods are logged and answered with an empty object so
// clients probing optional methods are not left waiting.
MethodResult dispatch_request(const MethodRegistry& methods, const JsonRpcRequest& req,
                              const ServerContext& ctx);

// handle_notification records a notification. Notifications never produce
// a response, whatever their method.
void handle_notification(const JsonRpcRequest& req, const ServerContext& ctx);

// to_tool_arguments keeps the string-valued members of an arguments object.
// Anything else (non-object, non-string members) contributes nothing.
handlers::ToolArguments to_tool_arguments(const nlohmann::json& arguments);

}  // namespace ldmcp::mcp
