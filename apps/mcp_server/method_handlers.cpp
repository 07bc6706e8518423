#include "method_handlers.h"

#include "ldmcp/core/version.h"

#include <exception>
#include <utility>

namespace ldmcp::mcp {

using json = nlohmann::json;

namespace {

MethodResult invalid_request(std::string message) {
  return MethodResult::err(JsonRpcError{kInvalidRequest, std::move(message)});
}

json text_content(std::string text) {
  return json{
      {"content", json::array({{{"type", "text"}, {"text", std::move(text)}}})},
  };
}

}  // namespace

MethodResult handle_initialize(const JsonRpcRequest& /*req*/, const ServerContext& /*ctx*/) {
  return MethodResult::ok(json{
      {"protocolVersion", core::kProtocolVersion},
      {"capabilities", {{"tools", json::object()}}},
      {"serverInfo", {{"name", core::kServerName}, {"version", core::kBuildVersion}}},
  });
}

MethodResult handle_tools_list(const JsonRpcRequest& /*req*/, const ServerContext& ctx) {
  return MethodResult::ok(ctx.capabilities.to_json());
}

MethodResult handle_ping(const JsonRpcRequest& /*req*/, const ServerContext& /*ctx*/) {
  return MethodResult::ok(json::object());
}

MethodResult handle_tools_call(const JsonRpcRequest& req, const ServerContext& ctx) {
  if (!req.params.has_value()) {
    return invalid_request("Missing params");
  }

  const json& params = req.params.value();
  if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
    return invalid_request("Missing tool name");
  }
  const std::string tool_name = params["name"].get<std::string>();

  auto it = ctx.tools.find(tool_name);
  if (it == ctx.tools.end()) {
    return invalid_request("Unknown tool: " + tool_name);
  }

  const auto arguments =
      to_tool_arguments(params.contains("arguments") ? params["arguments"] : json::object());

  try {
    return MethodResult::ok(text_content(it->second(arguments, ctx)));
  } catch (const std::exception& e) {
    // Tool faults are application output, not protocol errors.
    ctx.logger.error("Tool '" + tool_name + "' failed: " + e.what());
    json result = text_content(e.what());
    result["isError"] = true;
    return MethodResult::ok(std::move(result));
  } catch (...) {
    ctx.logger.error("Tool '" + tool_name + "' failed with a non-standard exception");
    json result = text_content("Tool '" + tool_name + "' failed");
    result["isError"] = true;
    return MethodResult::ok(std::move(result));
  }
}

MethodRegistry build_method_registry() {
  return {
      {"initialize", handle_initialize},
      {"tools/list", handle_tools_list},
      {"tools/call", handle_tools_call},
      {"ping", handle_ping},
  };
}

MethodResult dispatch_request(const MethodRegistry& methods, const JsonRpcRequest& req,
                              const ServerContext& ctx) {
  ctx.logger.debug("Handling request: " + req.method);

  auto it = methods.find(req.method);
  if (it == methods.end()) {
    ctx.logger.warn("Unknown method: " + req.method);
    return MethodResult::ok(json::object());
  }

  return it->second(req, ctx);
}

void handle_notification(const JsonRpcRequest& req, const ServerContext& ctx) {
  ctx.logger.info("Received notification: " + req.method);
}

handlers::ToolArguments to_tool_arguments(const json& arguments) {
  handlers::ToolArguments result;
  if (!arguments.is_object()) {
    return result;
  }

  for (const auto& [name, value] : arguments.items()) {
    if (value.is_string()) {
      result.emplace(name, value.get<std::string>());
    }
  }

  return result;
}

}  // namespace ldmcp::mcp
