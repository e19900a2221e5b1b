#pragma once

#include <string>

namespace postbox::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Quote and escape a string as a JSON string value.
[[nodiscard]] std::string json_string(const std::string &value);

} // namespace postbox::common
