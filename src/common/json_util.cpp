#include "inferguard/common/json_util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace inferguard::common {

namespace {

std::size_t json_value_start(const std::string &json, const std::string &field) {
  const auto key_pos = json_find_key(json, field);
  if (key_pos == std::string::npos) {
    return std::string::npos;
  }
  const auto colon = json.find(':', key_pos + field.size() + 2);
  if (colon == std::string::npos) {
    return std::string::npos;
  }
  return json_skip_ws(json, colon + 1);
}

std::string json_get_nested(const std::string &json, const std::string &field, const char open_ch,
                            const char close_ch) {
  const std::size_t pos = json_value_start(json, field);
  if (pos == std::string::npos || pos >= json.size() || json[pos] != open_ch) {
    return "";
  }
  const auto end = json_find_matching_token(json, pos, open_ch, close_ch);
  if (end == std::string::npos || end < pos) {
    return "";
  }
  return json.substr(pos, end - pos + 1);
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  bool escaped = false;
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (!escaped) {
      if (ch == '\\') {
        escaped = true;
      } else {
        out.push_back(ch);
      }
      continue;
    }
    switch (ch) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'u':
      // Non-ASCII escapes are not decoded.
      out.push_back('?');
      i = std::min(raw.size() - 1, i + 4);
      break;
    default:
      out.push_back(ch);
      break;
    }
    escaped = false;
  }
  return out;
}

std::size_t json_find_key(const std::string &json, const std::string &key, std::size_t from) {
  const std::string quoted = "\"" + key + "\"";
  return json.find(quoted, from);
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

std::string json_get_string(const std::string &json, const std::string &field) {
  const std::size_t pos = json_value_start(json, field);
  if (pos == std::string::npos || pos >= json.size() || json[pos] != '"') {
    return "";
  }
  const auto end = json_find_string_end(json, pos);
  if (end == std::string::npos || end <= pos) {
    return "";
  }
  return json_unescape(json.substr(pos + 1, end - pos - 1));
}

std::string json_get_object(const std::string &json, const std::string &field) {
  return json_get_nested(json, field, '{', '}');
}

std::string json_get_array(const std::string &json, const std::string &field) {
  return json_get_nested(json, field, '[', ']');
}

std::string json_string_or_null(const std::string *value) {
  if (value == nullptr) {
    return "null";
  }
  return "\"" + json_escape(*value) + "\"";
}

} // namespace inferguard::common
