#include "inferguard/common/hash.hpp"

#include <iomanip>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <sstream>

namespace inferguard::common {

std::string sha256_hex(const std::string &text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (unsigned char c : digest) {
    stream << std::setw(2) << static_cast<int>(c);
  }
  return stream.str();
}

std::string base64_encode(const std::string &bytes) {
  if (bytes.empty()) {
    return "";
  }
  std::string out(4 * ((bytes.size() + 2) / 3), '\0');
  const int written =
      EVP_EncodeBlock(reinterpret_cast<unsigned char *>(out.data()),
                      reinterpret_cast<const unsigned char *>(bytes.data()),
                      static_cast<int>(bytes.size()));
  out.resize(static_cast<std::size_t>(written));
  return out;
}

} // namespace inferguard::common
