#pragma once

#include "postbox/common/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace postbox::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] bool iequals(std::string_view lhs, std::string_view rhs);
[[nodiscard]] bool icontains(std::string_view haystack, std::string_view needle);
[[nodiscard]] std::vector<std::string> split(const std::string &value, char delimiter);
[[nodiscard]] bool is_ascii(std::string_view value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

} // namespace postbox::common
