#pragma once

#include "method_handlers.h"
#include "server_context.h"
#include <istream>
#include <ostream>
#include <string>

namespace ldmcp::mcp {

// LineDisposition records what the loop did with one input line.
// kSkipped     : blank line, no output
// kMalformed   : decode failed; logged, no output
// kNotification: no id; logged, no output
// kReply       : exactly one response line
enum class LineDisposition {
  kSkipped,       // NOLINT(readability-identifier-naming)
  kMalformed,     // NOLINT(readability-identifier-naming)
  kNotification,  // NOLINT(readability-identifier-naming)
  kReply,         // NOLINT(readability-identifier-naming)
};

struct LineOutcome {
  LineDisposition disposition{LineDisposition::kSkipped};  // NOLINT(readability-identifier-naming)
  // Serialized response; set for kReply only.
  std::string reply;  // NOLINT(readability-identifier-naming)
};

// SessionEnd says why the loop returned.
// kEndOfInput  : peer closed the stream or a read failed; clean exit
// kOutputFailed: a response could not be written; fatal
enum class SessionEnd {
  kEndOfInput,    // NOLINT(readability-identifier-naming)
  kOutputFailed,  // NOLINT(readability-identifier-naming)
};

// process_line runs one framed line through decode, dispatch and encode.
// Exceptions from decoding yield kMalformed; exceptions from dispatch or
// encoding yield a -32603 reply for requests and a log line for notifications.
LineOutcome process_line(const std::string& line, const MethodRegistry& methods,
                         const ServerContext& ctx);

// run_server_loop reads newline-delimited JSON-RPC messages from in and
// writes one response line per request to out, flushing after each.
// Messages are handled strictly in arrival order.
SessionEnd run_server_loop(std::istream& in, std::ostream& out, const ServerContext& ctx);

}  // namespace ldmcp::mcp
