#include <catch2/catch.hpp>

#include "handlers/get_documentation.h"
#include "handlers/leptos_autofixer.h"
#include "handlers/list_sections.h"
#include "test_support.h"

using namespace ldmcp::mcp::handlers;
using ldmcp::testing::split_lines;
using ldmcp::testing::TestServer;

TEST_CASE("list-sections renders one line per section", "[tools][list_sections]") {
  TestServer server;
  const auto text = handle_list_sections({}, server.ctx());
  const auto lines = split_lines(text);

  REQUIRE(lines.size() == 11);
  CHECK(lines[0] ==
        "* title: Getting Started, use_cases: new project, setup, installation, basics, hello "
        "world, path: getting-started");
  CHECK(lines[10] ==
        "* title: Suspense, use_cases: loading, async, Suspense, Transition, streaming, fallback, "
        "path: suspense");
  CHECK(text.back() != '\n');
}

TEST_CASE("list-sections ignores arguments", "[tools][list_sections]") {
  TestServer server;
  CHECK(handle_list_sections({{"section", "signals"}}, server.ctx()) ==
        handle_list_sections({}, server.ctx()));
}

TEST_CASE("get-documentation returns heading and body", "[tools][get_documentation]") {
  TestServer server;
  const auto text = handle_get_documentation({{"section", "components"}}, server.ctx());

  CHECK(text.rfind("# Components\n\n", 0) == 0);
  CHECK(text.find("#[component]") != std::string::npos);
}

TEST_CASE("get-documentation reports unknown sections as text", "[tools][get_documentation]") {
  TestServer server;
  CHECK(handle_get_documentation({{"section", "websockets"}}, server.ctx()) ==
        "Section 'websockets' not found. Use list-sections to see available sections.");
}

TEST_CASE("get-documentation without a section returns the first section",
          "[tools][get_documentation]") {
  TestServer server;
  const auto text = handle_get_documentation({}, server.ctx());
  CHECK(text.rfind("# Getting Started\n\n", 0) == 0);
}

TEST_CASE("leptos-autofixer analyzes the code argument", "[tools][autofixer]") {
  TestServer server;
  CHECK(handle_leptos_autofixer({{"code", "println!(\"x\");"}}, server.ctx()) ==
        "WARNING: Use tracing macros (tracing::info!, tracing::debug!) instead of println!");
  CHECK(handle_leptos_autofixer({}, server.ctx()) == "✓ No issues found. Code looks good!");
}

TEST_CASE("argument_or_empty defaults missing arguments", "[tools][registry]") {
  const ToolArguments args{{"section", "views"}};
  CHECK(argument_or_empty(args, "section") == "views");
  CHECK(argument_or_empty(args, "code").empty());
}
