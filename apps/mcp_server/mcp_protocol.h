#pragma once

#include "ldmcp/core/result.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace ldmcp::mcp {

constexpr const char* kJsonRpcVersion = "2.0";

// JSON-RPC 2.0 message types
struct JsonRpcRequest {
  std::string jsonrpc{kJsonRpcVersion};  // NOLINT(readability-identifier-naming)
  // Absent for notifications. Otherwise a string or number, echoed verbatim.
  std::optional<nlohmann::json> id;      // NOLINT(readability-identifier-naming)
  std::string method;                    // NOLINT(readability-identifier-naming)
  std::optional<nlohmann::json> params;  // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool is_notification() const { return !id.has_value(); }
};

struct JsonRpcError {
  int code;             // NOLINT(readability-identifier-naming)
  std::string message;  // NOLINT(readability-identifier-naming)
};

// Exactly one of result or error; the variant makes both/neither unrepresentable.
struct JsonRpcResponse {
  std::string jsonrpc{kJsonRpcVersion};                 // NOLINT(readability-identifier-naming)
  nlohmann::json id;                                    // NOLINT(readability-identifier-naming)
  std::variant<nlohmann::json, JsonRpcError> outcome;  // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool is_error() const { return std::holds_alternative<JsonRpcError>(outcome); }
  [[nodiscard]] const nlohmann::json* result() const { return std::get_if<nlohmann::json>(&outcome); }
  [[nodiscard]] const JsonRpcError* error() const { return std::get_if<JsonRpcError>(&outcome); }
};

// Why a line could not be turned into a message. Never sent to the peer.
struct DecodeError {
  std::string message;  // NOLINT(readability-identifier-naming)
};

using RequestDecodeResult = core::Result<JsonRpcRequest, DecodeError>;
using ResponseDecodeResult = core::Result<JsonRpcResponse, DecodeError>;

// Error codes (JSON-RPC 2.0 spec)
constexpr int kInvalidRequest = -32600;
constexpr int kInternalError = -32603;

// Parse one framed line into a request.
// Fails on invalid JSON, a non-object message, a missing or non-string
// "jsonrpc" or "method", or an "id" that is neither string, number nor null.
// Absent or oddly shaped params are accepted; handlers judge them.
[[nodiscard]] RequestDecodeResult parse_request(std::string_view line);

// Parse one framed line into a response (client side and tests).
[[nodiscard]] ResponseDecodeResult parse_response(std::string_view line);

// Serialize a response as a single line without the trailing newline.
// Newlines inside string values are escaped, never emitted raw.
[[nodiscard]] std::string serialize_response(const JsonRpcResponse& response);

[[nodiscard]] JsonRpcResponse make_response(const nlohmann::json& id, nlohmann::json result);

[[nodiscard]] JsonRpcResponse make_error_response(const nlohmann::json& id, int code,
                                                  std::string message);

}  // namespace ldmcp::mcp
