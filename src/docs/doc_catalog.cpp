#include "ldmcp/docs/doc_catalog.h"

#include "ldmcp/core/normalization.h"

#include "doc_content.h"

#include <utility>

namespace ldmcp::docs {

DocCatalog::DocCatalog(std::vector<DocSection> sections) : sections_(std::move(sections)) {}

std::optional<DocSection> DocCatalog::find_section(const std::string_view query) const {
  const std::string needle = core::normalize_ascii_lower(query);

  for (const auto& section : sections_) {
    if (core::contains(core::normalize_ascii_lower(section.path), needle) ||
        core::contains(core::normalize_ascii_lower(section.title), needle)) {
      return section;
    }
  }

  return std::nullopt;
}

DocCatalog make_leptos_catalog() {
  return DocCatalog({
      {"Getting Started", "getting-started",
       "new project, setup, installation, basics, hello world", content::kGettingStarted},
      {"Components", "components",
       "UI, view, component, props, children, #[component], always", content::kComponents},
      {"Signals", "signals",
       "state, reactivity, signals, derived, effects, get, set, read, write, update, always",
       content::kSignals},
      {"Views", "views",
       "view macro, dynamic classes, dynamic styles, attributes, class:, style:, events, always",
       content::kViews},
      {"Resources", "resources",
       "async, data loading, Resource, LocalResource, OnceResource, fetch, API",
       content::kResources},
      {"Actions", "actions",
       "mutations, POST, forms, ActionForm, ServerAction, submit, create, update, delete",
       content::kActions},
      {"Server Functions", "server-functions",
       "backend, API, database, server, SSR, #[server], extractors, Axum",
       content::kServerFunctions},
      {"Routing", "routing", "navigation, pages, routes, params, nested routes, Router",
       content::kRouting},
      {"Forms", "forms", "form, input, validation, submit, controlled input, prop:value",
       content::kForms},
      {"Error Handling", "error-handling", "errors, ErrorBoundary, Result, ServerFnError, try",
       content::kErrorHandling},
      {"Suspense", "suspense", "loading, async, Suspense, Transition, streaming, fallback",
       content::kSuspense},
  });
}

}  // namespace ldmcp::docs
