#include <catch2/catch.hpp>

#include "argv_builder.h"
#include "config.h"

using namespace ldmcp::mcp;
using ldmcp::testing::ArgvBuilder;

TEST_CASE("parse_args: defaults", "[startup][config]") {
  ArgvBuilder args({"leptos_mcp_server"});
  const auto config = parse_args(args.argc(), args.argv(), std::nullopt);

  CHECK(config.log_level == "info");
  CHECK_FALSE(config.show_help);
  CHECK(config.argument_errors.empty());
}

TEST_CASE("parse_args: --log-level sets the level", "[startup][config]") {
  ArgvBuilder args({"leptos_mcp_server", "--log-level", "debug"});
  const auto config = parse_args(args.argc(), args.argv(), std::nullopt);

  CHECK(config.log_level == "debug");
  CHECK(config.argument_errors.empty());
}

TEST_CASE("parse_args: environment supplies the default level", "[startup][config]") {
  ArgvBuilder args({"leptos_mcp_server"});
  CHECK(parse_args(args.argc(), args.argv(), std::string("warn")).log_level == "warn");
  CHECK(parse_args(args.argc(), args.argv(), std::string("")).log_level == "info");
}

TEST_CASE("parse_args: flag overrides environment", "[startup][config]") {
  ArgvBuilder args({"leptos_mcp_server", "--log-level", "error"});
  const auto config = parse_args(args.argc(), args.argv(), std::string("debug"));
  CHECK(config.log_level == "error");
}

TEST_CASE("parse_args: invalid --log-level is recorded", "[startup][config]") {
  ArgvBuilder args({"leptos_mcp_server", "--log-level", "loud"});
  const auto config = parse_args(args.argc(), args.argv(), std::nullopt);

  REQUIRE(config.argument_errors.size() == 1);
  CHECK(config.argument_errors[0] == "Invalid value for --log-level: loud");
  CHECK(config.log_level == "info");
}

TEST_CASE("parse_args: --help and unknown options", "[startup][config]") {
  ArgvBuilder args({"leptos_mcp_server", "--help", "--port", "8080"});
  const auto config = parse_args(args.argc(), args.argv(), std::nullopt);

  CHECK(config.show_help);
  REQUIRE(config.argument_errors.size() == 1);
  CHECK(config.argument_errors[0] == "Unknown option: --port");
}

TEST_CASE("usage_text documents flags and environment", "[startup][config]") {
  const auto usage = usage_text();
  CHECK(usage.find("--log-level") != std::string::npos);
  CHECK(usage.find("--help") != std::string::npos);
  CHECK(usage.find("LEPTOS_MCP_LOG") != std::string::npos);
}
