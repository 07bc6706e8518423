#include "server_loop.h"

#include "ldmcp/core/normalization.h"

#include <nlohmann/json.hpp>

#include "mcp_protocol.h"
#include <exception>
#include <optional>
#include <string>
#include <string_view>

namespace ldmcp::mcp {

using json = nlohmann::json;

namespace {

JsonRpcResponse to_response(const json& id, const MethodResult& result) {
  if (result.has_value()) {
    return make_response(id, result.value());
  }
  return make_error_response(id, result.error().code, result.error().message);
}

std::optional<JsonRpcRequest> decode_line(std::string_view framed, const std::string& line,
                                          const ServerContext& ctx) {
  std::string reason;
  try {
    auto decoded = parse_request(framed);
    if (decoded.has_value()) {
      return decoded.value();
    }
    reason = decoded.error().message;
  } catch (const std::exception& e) {
    reason = e.what();
  }
  ctx.logger.warn("Failed to parse request: " + reason + " - line: " + line);
  return std::nullopt;
}

std::string internal_error_reply(const json& id, const std::string& method, const std::string& what,
                                 const ServerContext& ctx) {
  ctx.logger.error("Request " + method + " failed: " + what);
  return serialize_response(make_error_response(id, kInternalError, "Internal error: " + what));
}

}  // namespace

LineOutcome process_line(const std::string& line, const MethodRegistry& methods,
                         const ServerContext& ctx) {
  if (core::is_blank(line)) {
    return {LineDisposition::kSkipped, {}};
  }

  // Accept CRLF framing from peers that write Windows line endings.
  std::string_view framed = line;
  if (!framed.empty() && framed.back() == '\r') {
    framed.remove_suffix(1);
  }

  const auto request = decode_line(framed, line, ctx);
  if (!request) {
    return {LineDisposition::kMalformed, {}};
  }

  if (request->jsonrpc != kJsonRpcVersion) {
    ctx.logger.debug("Unexpected jsonrpc version: " + request->jsonrpc);
  }

  if (request->is_notification()) {
    try {
      handle_notification(*request, ctx);
    } catch (const std::exception& e) {
      ctx.logger.error("Notification " + request->method + " failed: " + e.what());
    } catch (...) {
      ctx.logger.error("Notification " + request->method + " failed with a non-standard exception");
    }
    return {LineDisposition::kNotification, {}};
  }

  const json& id = request->id.value();
  try {
    return {LineDisposition::kReply,
            serialize_response(to_response(id, dispatch_request(methods, *request, ctx)))};
  } catch (const std::exception& e) {
    return {LineDisposition::kReply, internal_error_reply(id, request->method, e.what(), ctx)};
  } catch (...) {
    return {LineDisposition::kReply,
            internal_error_reply(id, request->method, "non-standard exception", ctx)};
  }
}

SessionEnd run_server_loop(std::istream& in, std::ostream& out, const ServerContext& ctx) {
  const auto method_registry = build_method_registry();

  // Main loop: read JSON-RPC messages from in, write responses to out
  std::string line;
  while (std::getline(in, line)) {
    auto outcome = process_line(line, method_registry, ctx);
    if (outcome.disposition != LineDisposition::kReply) {
      continue;
    }

    out << outcome.reply << '\n' << std::flush;
    if (!out) {
      ctx.logger.error("Failed to write response; closing session");
      return SessionEnd::kOutputFailed;
    }
  }

  if (in.bad()) {
    ctx.logger.warn("Input stream read failure; closing session");
  }
  ctx.logger.info("MCP Server shutting down");
  return SessionEnd::kEndOfInput;
}

}  // namespace ldmcp::mcp
