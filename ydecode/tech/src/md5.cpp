#include "ydecode/md5.hpp"

#include <openssl/evp.h>

#include <stdexcept>
#include <string>
#include <string_view>

#include "ydecode/hex.hpp"

namespace ydecode {

Md5Digest ComputeMd5(std::string_view data) {
  Md5Digest digest{};
  unsigned int digestLen = 0;
  if (::EVP_Digest(data.data(), data.size(), digest.data(), &digestLen, ::EVP_md5(), nullptr) != 1 ||
      digestLen != digest.size()) {
    throw std::runtime_error("EVP_Digest failed to compute MD5");
  }
  return digest;
}

std::string Md5ToHex(const Md5Digest& digest) {
  std::string ret(2 * digest.size(), '0');
  char *out = ret.data();
  for (unsigned char byte : digest) {
    out = to_lower_hex(byte, out);
  }
  return ret;
}

}  // namespace ydecode
