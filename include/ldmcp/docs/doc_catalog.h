#pragma once

#include "ldmcp/docs/doc_section.h"

#include <optional>
#include <string_view>
#include <vector>

namespace ldmcp::docs {

// DocCatalog is the immutable, ordered set of documentation sections.
// Built once at startup; safe to share by const reference.
class DocCatalog {
 public:
  explicit DocCatalog(std::vector<DocSection> sections);

  [[nodiscard]] const std::vector<DocSection>& sections() const { return sections_; }
  [[nodiscard]] std::size_t size() const { return sections_.size(); }

  // find_section returns the first section, in catalog order, whose path or
  // title contains query (ASCII case-insensitive substring match).
  // An empty query matches the first section.
  [[nodiscard]] std::optional<DocSection> find_section(std::string_view query) const;

 private:
  std::vector<DocSection> sections_;
};

// make_leptos_catalog returns the eleven bundled Leptos sections in their
// canonical order (getting-started first, suspense last).
[[nodiscard]] DocCatalog make_leptos_catalog();

}  // namespace ldmcp::docs
