#pragma once

#include <cstddef>
#include <string>

namespace inferguard::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape a JSON-encoded string (handles \n, \r, \t, \uXXXX as '?' and pass-through).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Find the position of a JSON key in a JSON string.
[[nodiscard]] std::size_t json_find_key(const std::string &json, const std::string &key,
                                        std::size_t from = 0);

[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Extract a string field value from a JSON document.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

/// Extract a nested JSON object field (including braces) from a JSON document.
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);

/// Extract a nested JSON array field (including brackets) from a JSON document.
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);

/// Render an optional-like string as a JSON value: quoted when present, `null` otherwise.
[[nodiscard]] std::string json_string_or_null(const std::string *value);

} // namespace inferguard::common
