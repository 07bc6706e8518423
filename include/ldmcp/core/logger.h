#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace ldmcp::core {

// LogLevel orders diagnostics from most to least severe.
// A logger emits a message when its level is <= the configured threshold.
enum class LogLevel {
  kError,  // NOLINT(readability-identifier-naming)
  kWarn,   // NOLINT(readability-identifier-naming)
  kInfo,   // NOLINT(readability-identifier-naming)
  kDebug,  // NOLINT(readability-identifier-naming)
};

// parse_log_level accepts "error", "warn", "info", "debug" (case-insensitive).
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text);

[[nodiscard]] std::string_view log_level_name(LogLevel level);

// Logger writes one line per event to a diagnostic stream, never to the
// protocol stream. The sink must outlive the logger.
//
// Line format: "[level] message"
class Logger {
 public:
  explicit Logger(std::ostream& sink, LogLevel threshold = LogLevel::kInfo);

  [[nodiscard]] LogLevel threshold() const { return threshold_; }
  [[nodiscard]] bool enabled(LogLevel level) const { return level <= threshold_; }

  void log(LogLevel level, std::string_view message) const;

  void error(std::string_view message) const { log(LogLevel::kError, message); }
  void warn(std::string_view message) const { log(LogLevel::kWarn, message); }
  void info(std::string_view message) const { log(LogLevel::kInfo, message); }
  void debug(std::string_view message) const { log(LogLevel::kDebug, message); }

 private:
  std::ostream& sink_;
  LogLevel threshold_;
};

}  // namespace ldmcp::core
