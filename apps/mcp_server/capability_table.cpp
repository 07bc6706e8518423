#include "capability_table.h"

#include <set>
#include <stdexcept>
#include <utility>

namespace ldmcp::mcp {

using json = nlohmann::json;

CapabilityTable::CapabilityTable(std::vector<OperationDescriptor> descriptors)
    : descriptors_(std::move(descriptors)) {
  std::set<std::string_view> seen;
  for (const auto& descriptor : descriptors_) {
    if (!seen.insert(descriptor.name).second) {
      throw std::invalid_argument("Duplicate tool name: " + descriptor.name);
    }
  }
}

const OperationDescriptor* CapabilityTable::find(const std::string_view name) const {
  for (const auto& descriptor : descriptors_) {
    if (descriptor.name == name) {
      return &descriptor;
    }
  }
  return nullptr;
}

json CapabilityTable::to_json() const {
  json tools = json::array();

  for (const auto& descriptor : descriptors_) {
    tools.push_back({
        {"name", descriptor.name},
        {"description", descriptor.description},
        {"inputSchema", descriptor.input_schema},
    });
  }

  return json{{"tools", tools}};
}

}  // namespace ldmcp::mcp
