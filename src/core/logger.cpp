#include "ldmcp/core/logger.h"

#include "ldmcp/core/normalization.h"

namespace ldmcp::core {

std::optional<LogLevel> parse_log_level(const std::string_view text) {
  const std::string normalized = normalize_ascii_lower(trim(text));
  if (normalized == "error") {
    return LogLevel::kError;
  }
  if (normalized == "warn" || normalized == "warning") {
    return LogLevel::kWarn;
  }
  if (normalized == "info") {
    return LogLevel::kInfo;
  }
  if (normalized == "debug") {
    return LogLevel::kDebug;
  }
  return std::nullopt;
}

std::string_view log_level_name(const LogLevel level) {
  switch (level) {
    case LogLevel::kError:
      return "error";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kDebug:
      return "debug";
  }
  return "info";
}

Logger::Logger(std::ostream& sink, const LogLevel threshold) : sink_(sink), threshold_(threshold) {}

void Logger::log(const LogLevel level, const std::string_view message) const {
  if (!enabled(level)) {
    return;
  }
  // Flushed per line.
  sink_ << "[" << log_level_name(level) << "] " << message << std::endl;
}

}  // namespace ldmcp::core
