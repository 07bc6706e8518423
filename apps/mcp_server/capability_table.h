#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace ldmcp::mcp {

// OperationDescriptor advertises one invocable tool to clients.
struct OperationDescriptor {
  std::string name;              // NOLINT(readability-identifier-naming)
  std::string description;       // NOLINT(readability-identifier-naming)
  nlohmann::json input_schema;   // NOLINT(readability-identifier-naming)
};

// CapabilityTable is the immutable list of advertised tools.
// Enumeration order is declaration order. Names are unique; the constructor
// throws std::invalid_argument on a duplicate.
class CapabilityTable {
 public:
  explicit CapabilityTable(std::vector<OperationDescriptor> descriptors);

  [[nodiscard]] const std::vector<OperationDescriptor>& capabilities() const {
    return descriptors_;
  }

  [[nodiscard]] const OperationDescriptor* find(std::string_view name) const;

  // to_json renders the tools/list result: {"tools": [{name, description, inputSchema}, ...]}
  [[nodiscard]] nlohmann::json to_json() const;

 private:
  std::vector<OperationDescriptor> descriptors_;
};

}  // namespace ldmcp::mcp
