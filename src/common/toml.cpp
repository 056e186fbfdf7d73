#include "inferguard/common/toml.hpp"

#include "inferguard/common/fs.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>

namespace inferguard::common {

namespace {

std::string strip_comment(const std::string &line) {
  bool in_quotes = false;
  std::string output;
  output.reserve(line.size());

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (ch == '"' && (i == 0 || line[i - 1] != '\\')) {
      in_quotes = !in_quotes;
    }
    if (!in_quotes && ch == '#') {
      break;
    }
    output.push_back(ch);
  }

  return output;
}

std::vector<std::string> split_array_elements(const std::string &array_value) {
  std::vector<std::string> result;
  std::string current;
  bool in_quotes = false;

  for (std::size_t i = 0; i < array_value.size(); ++i) {
    const char ch = array_value[i];
    if (ch == '"' && (i == 0 || array_value[i - 1] != '\\')) {
      in_quotes = !in_quotes;
      current.push_back(ch);
      continue;
    }

    if (!in_quotes && ch == ',') {
      result.push_back(trim(current));
      current.clear();
      continue;
    }

    current.push_back(ch);
  }

  if (!trim(current).empty()) {
    result.push_back(trim(current));
  }

  return result;
}

std::string unquote(std::string value) {
  value = trim(value);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    value = value.substr(1, value.size() - 2);
  }
  return value;
}

// Rewrites `providers.models` into `providers.<last index>.models` for every
// prefix that names an array of tables.
std::string resolve_table_path(const std::string &header,
                               const std::unordered_map<std::string, std::size_t> &arrays) {
  std::string resolved;
  std::string logical;
  for (const auto &part : split(header, '.')) {
    if (!logical.empty()) {
      logical.push_back('.');
      resolved.push_back('.');
    }
    logical += part;
    resolved += part;
    const auto it = arrays.find(resolved);
    if (it != arrays.end() && it->second > 0 && logical != header) {
      resolved += "." + std::to_string(it->second - 1);
    }
  }
  return resolved;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return unquote(it->second);
}

bool TomlDocument::get_bool(const std::string &key, bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = to_lower(trim(it->second));
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, std::uint64_t fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  std::string normalized = trim(it->second);
  normalized.erase(std::remove(normalized.begin(), normalized.end(), '_'), normalized.end());
  std::uint64_t parsed = 0;
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return fallback;
  }

  return parsed;
}

double TomlDocument::get_double(const std::string &key, double fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const std::string normalized = trim(it->second);
  std::istringstream stream(normalized);
  double parsed = 0.0;
  stream >> parsed;
  if (stream.fail() || !stream.eof()) {
    return fallback;
  }
  return parsed;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const std::string raw = trim(it->second);
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    return fallback;
  }

  const std::string body = raw.substr(1, raw.size() - 2);
  std::vector<std::string> values_out;
  for (const auto &element : split_array_elements(body)) {
    if (!element.empty()) {
      values_out.push_back(unquote(element));
    }
  }

  return values_out;
}

std::size_t TomlDocument::table_array_size(const std::string &path) const {
  const auto it = table_arrays.find(path);
  return it == table_arrays.end() ? 0 : it->second;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string current_section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean_line = trim(strip_comment(line));
    if (clean_line.empty()) {
      continue;
    }

    if (starts_with(clean_line, "[[")) {
      if (clean_line.size() < 4 || clean_line.substr(clean_line.size() - 2) != "]]") {
        return Result<TomlDocument>::failure("Unterminated table array header at line " +
                                             std::to_string(line_number));
      }
      const std::string header = trim(clean_line.substr(2, clean_line.size() - 4));
      if (header.empty()) {
        return Result<TomlDocument>::failure("Invalid empty table array at line " +
                                             std::to_string(line_number));
      }
      const std::string array_path = resolve_table_path(header, document.table_arrays);
      const std::size_t index = document.table_arrays[array_path]++;
      current_section = array_path + "." + std::to_string(index);
      continue;
    }

    if (clean_line.front() == '[' && clean_line.back() == ']') {
      const std::string header = trim(clean_line.substr(1, clean_line.size() - 2));
      if (header.empty()) {
        return Result<TomlDocument>::failure("Invalid empty section at line " +
                                             std::to_string(line_number));
      }
      current_section = resolve_table_path(header, document.table_arrays);
      continue;
    }

    const std::size_t equals_index = clean_line.find('=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure("Invalid key/value at line " +
                                           std::to_string(line_number));
    }

    const std::string key = unquote(trim(clean_line.substr(0, equals_index)));
    const std::string value = trim(clean_line.substr(equals_index + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure("Missing key at line " +
                                           std::to_string(line_number));
    }

    const std::string full_key = current_section.empty() ? key : current_section + "." + key;
    document.values[full_key] = value;
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped.push_back('"');
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(ch);
  }
  escaped.push_back('"');
  return escaped;
}

} // namespace inferguard::common
