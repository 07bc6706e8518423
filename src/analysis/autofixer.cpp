#include "ldmcp/analysis/autofixer.h"

#include "ldmcp/core/normalization.h"

#include <utility>

namespace ldmcp::analysis {

using core::contains;

std::vector<CodeRule> make_leptos_rules() {
  return {
      {"LEP-001", FindingSeverity::kError,
       "Found .get() in view without `move ||`. "
       "Reactive values should use `{move || value.get()}`",
       [](std::string_view code) {
         return contains(code, ".get()") && !contains(code, "move ||") && contains(code, "view!");
       }},
      {"LEP-002", FindingSeverity::kWarning,
       "Consider using `let (getter, setter) = signal(value)` pattern for clarity",
       [](std::string_view code) {
         return contains(code, "let signal =") || contains(code, "create_signal");
       }},
      {"LEP-003", FindingSeverity::kWarning,
       "Use tracing macros (tracing::info!, tracing::debug!) instead of println!",
       [](std::string_view code) { return contains(code, "println!"); }},
      {"LEP-004", FindingSeverity::kError,
       "Functions returning `impl IntoView` should have #[component] attribute",
       [](std::string_view code) {
         return contains(code, "-> impl IntoView") && !contains(code, "#[component]");
       }},
      {"LEP-005", FindingSeverity::kInfo,
       "Server functions should return Result<T, ServerFnError>",
       [](std::string_view code) {
         return contains(code, "#[server") && !contains(code, "ServerFnError");
       }},
      {"LEP-006", FindingSeverity::kInfo,
       "In Leptos 0.8+, use `signal()` instead of `create_signal()`",
       [](std::string_view code) { return contains(code, "create_signal"); }},
      {"LEP-007", FindingSeverity::kWarning,
       "For controlled inputs, use `prop:value=` instead of `value=`",
       [](std::string_view code) {
         return contains(code, "value=") && !contains(code, "prop:value=") &&
                contains(code, "<input");
       }},
  };
}

Autofixer::Autofixer() : Autofixer(make_leptos_rules()) {}

Autofixer::Autofixer(std::vector<CodeRule> rules) : rules_(std::move(rules)) {}

std::vector<Finding> Autofixer::analyze(const std::string_view code) const {
  std::vector<Finding> findings;

  for (const auto& rule : rules_) {
    if (rule.matches && rule.matches(code)) {
      findings.push_back(Finding{rule.rule_id, rule.severity, rule.message});
    }
  }

  return findings;
}

std::string_view severity_label(const FindingSeverity severity) {
  switch (severity) {
    case FindingSeverity::kError:
      return "ERROR";
    case FindingSeverity::kWarning:
      return "WARNING";
    case FindingSeverity::kInfo:
      return "INFO";
  }
  return "INFO";
}

std::string format_findings(const std::vector<Finding>& findings) {
  if (findings.empty()) {
    return std::string(kNoIssuesMessage);
  }

  std::string result;
  for (const auto& finding : findings) {
    if (!result.empty()) {
      result += '\n';
    }
    result += severity_label(finding.severity);
    result += ": ";
    result += finding.message;
  }

  return result;
}

}  // namespace ldmcp::analysis
