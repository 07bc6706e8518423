#pragma once

#include <string_view>

// Markdown bodies of the bundled documentation sections.
namespace ldmcp::docs::content {

extern const std::string_view kGettingStarted;
extern const std::string_view kComponents;
extern const std::string_view kSignals;
extern const std::string_view kViews;
extern const std::string_view kResources;
extern const std::string_view kActions;
extern const std::string_view kServerFunctions;
extern const std::string_view kRouting;
extern const std::string_view kForms;
extern const std::string_view kErrorHandling;
extern const std::string_view kSuspense;

}  // namespace ldmcp::docs::content
