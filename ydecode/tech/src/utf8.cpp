#include "ydecode/utf8.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace ydecode {

bool IsValidUtf8(std::string_view str) noexcept {
  const auto *ptr = reinterpret_cast<const unsigned char *>(str.data());
  const auto *end = ptr + str.size();
  while (ptr != end) {
    const unsigned char lead = *ptr;
    if (lead < 0x80) {
      ++ptr;
      continue;
    }
    std::size_t nbCont;
    unsigned char minSecond = 0x80;
    unsigned char maxSecond = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
      nbCont = 1;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
      nbCont = 2;
      if (lead == 0xE0) {
        minSecond = 0xA0;
      } else if (lead == 0xED) {
        maxSecond = 0x9F;
      }
    } else if (lead >= 0xF0 && lead <= 0xF4) {
      nbCont = 3;
      if (lead == 0xF0) {
        minSecond = 0x90;
      } else if (lead == 0xF4) {
        maxSecond = 0x8F;
      }
    } else {
      return false;
    }
    if (static_cast<std::size_t>(end - ptr) <= nbCont) {
      return false;
    }
    if (ptr[1] < minSecond || ptr[1] > maxSecond) {
      return false;
    }
    for (std::size_t pos = 2; pos <= nbCont; ++pos) {
      if ((ptr[pos] & 0xC0) != 0x80) {
        return false;
      }
    }
    ptr += nbCont + 1;
  }
  return true;
}

std::string Latin1ToUtf8(std::string_view str) {
  std::string ret;
  ret.reserve(str.size() * 2);
  for (char ch : str) {
    const auto byte = static_cast<unsigned char>(ch);
    if (byte < 0x80) {
      ret.push_back(ch);
    } else {
      ret.push_back(static_cast<char>(0xC0 | (byte >> 6)));
      ret.push_back(static_cast<char>(0x80 | (byte & 0x3F)));
    }
  }
  return ret;
}

}  // namespace ydecode
