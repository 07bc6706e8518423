#include <catch2/catch.hpp>

#include "server_loop.h"
#include "test_support.h"

#include <sstream>
#include <stdexcept>

using namespace ldmcp::mcp;
using ldmcp::testing::split_lines;
using ldmcp::testing::TestServer;
using json = nlohmann::json;

namespace {

struct SessionRun {
  SessionEnd end;
  std::vector<std::string> lines;
};

SessionRun run_session(TestServer& server, const std::string& input) {
  std::istringstream in(input);
  std::ostringstream out;
  const auto end = run_server_loop(in, out, server.ctx());
  return {end, split_lines(out.str())};
}

}  // namespace

// ── Scenarios ───────────────────────────────────────────────────────────────

TEST_CASE("session: initialize is answered with the handshake", "[mcp][session]") {
  TestServer server;
  const auto run = run_session(server, R"({"jsonrpc":"2.0","id":1,"method":"initialize"})"
                                       "\n");

  CHECK(run.end == SessionEnd::kEndOfInput);
  REQUIRE(run.lines.size() == 1);

  const auto reply = json::parse(run.lines[0]);
  CHECK(reply["jsonrpc"] == "2.0");
  CHECK(reply["id"] == 1);
  CHECK(reply["result"]["protocolVersion"] == "2024-11-05");
  CHECK(reply["result"]["capabilities"] == json{{"tools", json::object()}});
  CHECK(reply["result"]["serverInfo"]["name"] == "leptos-mcp-server");
}

TEST_CASE("session: unknown tool yields a protocol error", "[mcp][session]") {
  TestServer server;
  const auto run = run_session(
      server,
      R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"nope","arguments":{}}})"
      "\n");

  REQUIRE(run.lines.size() == 1);
  const auto reply = json::parse(run.lines[0]);
  CHECK(reply["id"] == 2);
  CHECK_FALSE(reply.contains("result"));
  CHECK(reply["error"] == json{{"code", -32600}, {"message", "Unknown tool: nope"}});
}

TEST_CASE("session: notifications never produce output", "[mcp][session]") {
  TestServer server;
  const auto run = run_session(server,
                               R"({"jsonrpc":"2.0","method":"notifications/initialized"})"
                               "\n"
                               R"({"jsonrpc":"2.0","method":"initialize"})"
                               "\n"
                               R"({"jsonrpc":"2.0","method":"no/such/method"})"
                               "\n"
                               R"({"jsonrpc":"2.0","id":null,"method":"tools/list"})"
                               "\n");

  CHECK(run.end == SessionEnd::kEndOfInput);
  CHECK(run.lines.empty());
  CHECK(server.log().find("Received notification: notifications/initialized") !=
        std::string::npos);
}

TEST_CASE("session: back-to-back requests are answered in arrival order", "[mcp][session]") {
  TestServer server;
  const auto run = run_session(server,
                               R"({"jsonrpc":"2.0","id":1,"method":"initialize"})"
                               "\n"
                               R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})"
                               "\n");

  REQUIRE(run.lines.size() == 2);
  CHECK(json::parse(run.lines[0])["id"] == 1);
  CHECK(json::parse(run.lines[1])["id"] == 2);
  CHECK(json::parse(run.lines[1])["result"]["tools"].size() == 3);
}

// ── Malformed input ─────────────────────────────────────────────────────────

TEST_CASE("session: malformed lines are discarded and the session continues",
          "[mcp][session]") {
  TestServer server;
  const auto run = run_session(server,
                               "this is not json\n"
                               R"({"jsonrpc":"2.0","id":5})"
                               "\n"
                               R"({"jsonrpc":"2.0","id":6,"method":"ping"})"
                               "\n");

  CHECK(run.end == SessionEnd::kEndOfInput);
  REQUIRE(run.lines.size() == 1);
  CHECK(json::parse(run.lines[0])["id"] == 6);
  CHECK(server.log().find("Failed to parse request") != std::string::npos);
}

TEST_CASE("session: an overflowing number does not end the session", "[mcp][session]") {
  TestServer server;
  const auto run = run_session(server,
                               R"({"jsonrpc":"2.0","id":1e400,"method":"ping"})"
                               "\n"
                               R"({"jsonrpc":"2.0","id":2,"method":"ping"})"
                               "\n");

  CHECK(run.end == SessionEnd::kEndOfInput);
  REQUIRE(run.lines.size() == 1);
  const auto reply = json::parse(run.lines[0]);
  CHECK(reply["id"] == 2);
  CHECK(reply["result"] == json::object());
  CHECK(server.log().find("Failed to parse request") != std::string::npos);
}

TEST_CASE("session: blank and whitespace-only lines are skipped", "[mcp][session]") {
  TestServer server;
  const auto run = run_session(server,
                               "\n   \n\t\n"
                               R"({"jsonrpc":"2.0","id":"x","method":"ping"})"
                               "\n\n");

  REQUIRE(run.lines.size() == 1);
  CHECK(json::parse(run.lines[0])["id"] == "x");
  CHECK(server.log().find("Failed to parse") == std::string::npos);
}

TEST_CASE("session: CRLF-terminated lines are accepted", "[mcp][session]") {
  TestServer server;
  const auto run = run_session(server, R"({"jsonrpc":"2.0","id":3,"method":"ping"})"
                                       "\r\n");

  REQUIRE(run.lines.size() == 1);
  CHECK(json::parse(run.lines[0])["id"] == 3);
}

TEST_CASE("session: last line without a newline is still processed", "[mcp][session]") {
  TestServer server;
  const auto run = run_session(server, R"({"jsonrpc":"2.0","id":4,"method":"ping"})");

  REQUIRE(run.lines.size() == 1);
  CHECK(json::parse(run.lines[0])["id"] == 4);
}

TEST_CASE("session: empty input ends cleanly", "[mcp][session]") {
  TestServer server;
  const auto run = run_session(server, "");

  CHECK(run.end == SessionEnd::kEndOfInput);
  CHECK(run.lines.empty());
  CHECK(server.log().find("MCP Server shutting down") != std::string::npos);
}

// ── Output ──────────────────────────────────────────────────────────────────

TEST_CASE("session: multi-line documents are written as one line", "[mcp][session]") {
  TestServer server;
  const auto run = run_session(
      server,
      R"({"jsonrpc":"2.0","id":8,"method":"tools/call","params":{"name":"get-documentation","arguments":{"section":"routing"}}})"
      "\n");

  REQUIRE(run.lines.size() == 1);
  const auto reply = json::parse(run.lines[0]);
  const auto text = reply["result"]["content"][0]["text"].get<std::string>();
  CHECK(text.rfind("# Routing\n\n", 0) == 0);
  CHECK(text.find('\n') != std::string::npos);
}

TEST_CASE("session: a failed write ends the session as fatal", "[mcp][session]") {
  TestServer server;
  std::istringstream in(R"({"jsonrpc":"2.0","id":1,"method":"ping"})"
                        "\n");
  std::ostringstream out;
  out.setstate(std::ios::badbit);

  CHECK(run_server_loop(in, out, server.ctx()) == SessionEnd::kOutputFailed);
  CHECK(server.log().find("Failed to write response") != std::string::npos);
}

// ── process_line ────────────────────────────────────────────────────────────

TEST_CASE("process_line: classifies each kind of line", "[mcp][session]") {
  TestServer server;
  const auto methods = build_method_registry();
  const auto ctx = server.ctx();

  CHECK(process_line("  ", methods, ctx).disposition == LineDisposition::kSkipped);
  CHECK(process_line("{", methods, ctx).disposition == LineDisposition::kMalformed);
  CHECK(process_line(R"({"jsonrpc":"2.0","method":"ping"})", methods, ctx).disposition ==
        LineDisposition::kNotification);

  const auto reply = process_line(R"({"jsonrpc":"2.0","id":1,"method":"ping"})", methods, ctx);
  CHECK(reply.disposition == LineDisposition::kReply);
  CHECK(json::parse(reply.reply) == json{{"jsonrpc", "2.0"}, {"id", 1}, {"result", json::object()}});
}

TEST_CASE("process_line: unknown request methods get an empty result", "[mcp][session]") {
  TestServer server;
  const auto methods = build_method_registry();

  const auto outcome =
      process_line(R"({"jsonrpc":"2.0","id":11,"method":"prompts/list"})", methods, server.ctx());
  REQUIRE(outcome.disposition == LineDisposition::kReply);

  const auto reply = json::parse(outcome.reply);
  CHECK(reply["result"] == json::object());
  CHECK_FALSE(reply.contains("error"));
}

TEST_CASE("process_line: a throwing method becomes an internal error", "[mcp][session]") {
  TestServer server;
  MethodRegistry methods{
      {"explode",
       [](const JsonRpcRequest&, const ServerContext&) -> MethodResult {
         throw std::runtime_error("kaboom");
       }},
  };

  const auto outcome =
      process_line(R"({"jsonrpc":"2.0","id":12,"method":"explode"})", methods, server.ctx());
  REQUIRE(outcome.disposition == LineDisposition::kReply);

  const auto reply = json::parse(outcome.reply);
  CHECK(reply["id"] == 12);
  CHECK(reply["error"]["code"] == kInternalError);
  CHECK(reply["error"]["message"] == "Internal error: kaboom");
}

TEST_CASE("process_line: a non-standard exception becomes an internal error", "[mcp][session]") {
  TestServer server;
  MethodRegistry methods{
      {"explode",
       [](const JsonRpcRequest&, const ServerContext&) -> MethodResult { throw 42; }},
  };

  const auto outcome =
      process_line(R"({"jsonrpc":"2.0","id":13,"method":"explode"})", methods, server.ctx());
  REQUIRE(outcome.disposition == LineDisposition::kReply);

  const auto reply = json::parse(outcome.reply);
  CHECK(reply["id"] == 13);
  CHECK(reply["error"]["code"] == kInternalError);
  CHECK(reply["error"]["message"] == "Internal error: non-standard exception");
  CHECK(server.log().find("[error] Request explode failed") != std::string::npos);
}

TEST_CASE("process_line: an overflowing number in a notification is malformed", "[mcp][session]") {
  TestServer server;
  const auto methods = build_method_registry();

  const auto outcome =
      process_line(R"({"jsonrpc":"2.0","method":"notifications/x","params":1e400})", methods,
                   server.ctx());
  CHECK(outcome.disposition == LineDisposition::kMalformed);
  CHECK(outcome.reply.empty());
}
