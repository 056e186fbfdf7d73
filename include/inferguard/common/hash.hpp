#pragma once

#include <string>

namespace inferguard::common {

[[nodiscard]] std::string sha256_hex(const std::string &text);
[[nodiscard]] std::string base64_encode(const std::string &bytes);

} // namespace inferguard::common
