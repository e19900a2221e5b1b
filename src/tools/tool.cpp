#include "postbox/tools/tool.hpp"

#include "postbox/common/json_util.hpp"

#include <sstream>

namespace postbox::tools {

std::string specs_to_json(const std::vector<ToolSpec> &specs) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < specs.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << "{\"name\":" << common::json_string(specs[i].name)
        << ",\"description\":" << common::json_string(specs[i].description)
        << ",\"parameters\":" << (specs[i].parameters_json.empty() ? "{}" : specs[i].parameters_json)
        << "}";
  }
  out << "]";
  return out.str();
}

} // namespace postbox::tools
