#include "hash.hpp"

#include <openssl/evp.h>

#include <array>
#include <stdexcept>

namespace research::util {

std::string Sha256Hex(std::string_view data) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int                               len = 0;
  if (EVP_Digest(data.data(), data.size(), digest.data(), &len, EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("sha256 digest failed");
  }

  static const char* kHex = "0123456789abcdef";
  std::string        output;
  output.reserve(len * 2);
  for (unsigned int i = 0; i < len; ++i) {
    output.push_back(kHex[(digest[i] >> 4) & 0x0F]);
    output.push_back(kHex[digest[i] & 0x0F]);
  }
  return output;
}

} // namespace research::util
