#include "mcp_protocol.h"

#include <utility>

namespace ldmcp::mcp {

using json = nlohmann::json;

namespace {

core::Result<json, DecodeError> parse_object(const std::string_view line) {
  try {
    auto message = json::parse(line);
    if (!message.is_object()) {
      return core::Result<json, DecodeError>::err(DecodeError{"Message is not a JSON object"});
    }
    return core::Result<json, DecodeError>::ok(std::move(message));
  } catch (const json::exception& e) {
    // Syntax errors and out-of-range numbers (e.g. 1e400) both land here.
    return core::Result<json, DecodeError>::err(DecodeError{std::string("Invalid JSON: ") + e.what()});
  }
}

bool is_valid_id(const json& id) {
  return id.is_string() || id.is_number();
}

std::optional<DecodeError> check_version(const json& message) {
  if (!message.contains("jsonrpc")) {
    return DecodeError{"Missing jsonrpc field"};
  }
  if (!message["jsonrpc"].is_string()) {
    return DecodeError{"jsonrpc field must be a string"};
  }
  return std::nullopt;
}

}  // namespace

RequestDecodeResult parse_request(const std::string_view line) {
  auto parsed = parse_object(line);
  if (!parsed.has_value()) {
    return RequestDecodeResult::err(parsed.error());
  }
  const json& message = parsed.value();

  if (auto version_error = check_version(message)) {
    return RequestDecodeResult::err(std::move(*version_error));
  }

  JsonRpcRequest request;
  request.jsonrpc = message["jsonrpc"].get<std::string>();

  if (!message.contains("method")) {
    return RequestDecodeResult::err(DecodeError{"Missing method field"});
  }
  if (!message["method"].is_string()) {
    return RequestDecodeResult::err(DecodeError{"method field must be a string"});
  }
  request.method = message["method"].get<std::string>();

  // A null id is treated the same as an absent one: the message is a notification.
  if (message.contains("id") && !message["id"].is_null()) {
    if (!is_valid_id(message["id"])) {
      return RequestDecodeResult::err(DecodeError{"id field must be a string or number"});
    }
    request.id = message["id"];
  }

  if (message.contains("params") && !message["params"].is_null()) {
    request.params = message["params"];
  }

  return RequestDecodeResult::ok(std::move(request));
}

ResponseDecodeResult parse_response(const std::string_view line) {
  auto parsed = parse_object(line);
  if (!parsed.has_value()) {
    return ResponseDecodeResult::err(parsed.error());
  }
  const json& message = parsed.value();

  if (auto version_error = check_version(message)) {
    return ResponseDecodeResult::err(std::move(*version_error));
  }
  if (!message.contains("id")) {
    return ResponseDecodeResult::err(DecodeError{"Missing id field"});
  }

  const bool has_result = message.contains("result");
  const bool has_error = message.contains("error");
  if (has_result == has_error) {
    return ResponseDecodeResult::err(DecodeError{"Response must carry exactly one of result or error"});
  }

  if (has_result) {
    auto response = make_response(message["id"], message["result"]);
    response.jsonrpc = message["jsonrpc"].get<std::string>();
    return ResponseDecodeResult::ok(std::move(response));
  }

  const json& error = message["error"];
  if (!error.is_object() || !error.contains("code") || !error["code"].is_number_integer() ||
      !error.contains("message") || !error["message"].is_string()) {
    return ResponseDecodeResult::err(DecodeError{"Malformed error object"});
  }

  auto response = make_error_response(message["id"], error["code"].get<int>(),
                                      error["message"].get<std::string>());
  response.jsonrpc = message["jsonrpc"].get<std::string>();
  return ResponseDecodeResult::ok(std::move(response));
}

std::string serialize_response(const JsonRpcResponse& response) {
  json message;
  message["jsonrpc"] = response.jsonrpc;
  message["id"] = response.id;

  if (const auto* error = response.error()) {
    message["error"] = {
        {"code", error->code},
        {"message", error->message},
    };
  } else {
    message["result"] = *response.result();
  }

  // Invalid UTF-8 in tool output is replaced rather than thrown on.
  return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

JsonRpcResponse make_response(const json& id, json result) {
  return JsonRpcResponse{kJsonRpcVersion, id,
                         std::variant<json, JsonRpcError>(std::in_place_type<json>, std::move(result))};
}

JsonRpcResponse make_error_response(const json& id, int code, std::string message) {
  return JsonRpcResponse{
      kJsonRpcVersion, id,
      std::variant<json, JsonRpcError>(std::in_place_type<JsonRpcError>,
                                       JsonRpcError{code, std::move(message)})};
}

}  // namespace ldmcp::mcp
