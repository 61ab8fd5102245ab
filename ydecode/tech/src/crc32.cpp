#include "ydecode/crc32.hpp"

#include <zconf.h>
#include <zlib.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "ydecode/ascii.hpp"
#include "ydecode/hex.hpp"

namespace ydecode {

namespace {
constexpr std::size_t kCrc32HexLen = 8;
}  // namespace

void Crc32::update(std::string_view data) noexcept {
  if (data.empty()) {
    return;
  }
  _crc = static_cast<std::uint32_t>(
      ::crc32_z(_crc, reinterpret_cast<const Bytef *>(data.data()), static_cast<z_size_t>(data.size())));
}

std::uint32_t ComputeCrc32(std::string_view data) noexcept {
  Crc32 crc;
  crc.update(data);
  return crc.value();
}

std::string Crc32ToHex(std::uint32_t crc) {
  std::string ret(kCrc32HexLen, '0');
  char *out = ret.data();
  for (int shift = 24; shift >= 0; shift -= 8) {
    out = to_upper_hex(static_cast<unsigned char>(crc >> shift), out);
  }
  return ret;
}

std::optional<std::string> NormalizeCrc32String(std::string_view declared) {
  if (declared.empty() || declared.size() > kCrc32HexLen) {
    return std::nullopt;
  }
  std::string ret(kCrc32HexLen - declared.size(), '0');
  for (char ch : declared) {
    if (from_hex_digit(ch) < 0) {
      return std::nullopt;
    }
    ret.push_back(toupper(ch));
  }
  return ret;
}

}  // namespace ydecode
