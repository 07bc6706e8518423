#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace ldmcp::analysis {

enum class FindingSeverity {
  kInfo,     // NOLINT(readability-identifier-naming)
  kWarning,  // NOLINT(readability-identifier-naming)
  kError,    // NOLINT(readability-identifier-naming)
};

struct Finding {
  std::string rule_id;                              // NOLINT(readability-identifier-naming)
  FindingSeverity severity{FindingSeverity::kInfo};  // NOLINT(readability-identifier-naming)
  std::string message;                              // NOLINT(readability-identifier-naming)
};

// CodeRule is a single textual heuristic over a Leptos source snippet.
// matches() must be a pure function of the snippet.
struct CodeRule {
  std::string rule_id;                              // NOLINT(readability-identifier-naming)
  FindingSeverity severity{FindingSeverity::kInfo};  // NOLINT(readability-identifier-naming)
  std::string message;                              // NOLINT(readability-identifier-naming)
  std::function<bool(std::string_view code)> matches;  // NOLINT(readability-identifier-naming)
};

// make_leptos_rules returns the built-in rule set, LEP-001 through LEP-007,
// in evaluation order.
[[nodiscard]] std::vector<CodeRule> make_leptos_rules();

// Autofixer evaluates every rule against a snippet and reports the rules that
// fired, in rule order. Rules are fixed at construction.
class Autofixer {
 public:
  Autofixer();
  explicit Autofixer(std::vector<CodeRule> rules);

  [[nodiscard]] std::vector<Finding> analyze(std::string_view code) const;
  [[nodiscard]] const std::vector<CodeRule>& rules() const { return rules_; }

 private:
  std::vector<CodeRule> rules_;
};

[[nodiscard]] std::string_view severity_label(FindingSeverity severity);

// format_findings renders findings one per line as "<LABEL>: <message>".
// An empty list renders as the "no issues" message.
[[nodiscard]] std::string format_findings(const std::vector<Finding>& findings);

inline constexpr std::string_view kNoIssuesMessage = "✓ No issues found. Code looks good!";

}  // namespace ldmcp::analysis
