#pragma once

#include "inferguard/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace inferguard::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] bool contains_ci(const std::string &haystack, const std::string &needle);
[[nodiscard]] std::vector<std::string> split(const std::string &value, char separator);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

} // namespace inferguard::common
