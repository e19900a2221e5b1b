#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace postbox::tools {

using ToolArgs = std::unordered_map<std::string, std::string>;

struct ToolResult {
  std::string output;
  bool success = true;
  std::unordered_map<std::string, std::string> metadata;
};

struct ToolSpec {
  std::string name;
  std::string description;
  std::string parameters_json;
};

/// JSON array of `{"name","description","parameters"}` objects.
[[nodiscard]] std::string specs_to_json(const std::vector<ToolSpec> &specs);

} // namespace postbox::tools
