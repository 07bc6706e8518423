#pragma once

#include <string>
#include <string_view>

namespace ldmcp::docs {

// DocSection is one page of the bundled Leptos documentation.
// content points at markdown compiled into the binary (static storage).
struct DocSection {
  std::string title;           // NOLINT(readability-identifier-naming)
  std::string path;            // NOLINT(readability-identifier-naming)
  std::string use_cases;       // NOLINT(readability-identifier-naming)
  std::string_view content;    // NOLINT(readability-identifier-naming)
};

}  // namespace ldmcp::docs
