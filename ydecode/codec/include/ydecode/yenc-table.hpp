#pragma once

#include <array>
#include <cstddef>

#include "ydecode/yenc-constants.hpp"

namespace ydecode {

// Decoded value of every possible input byte (input - 42 mod 256). The escape byte is not special cased here.
inline constexpr std::array<unsigned char, 256> kYencDecodeTable = [] {
  std::array<unsigned char, 256> table{};
  for (std::size_t idx = 0; idx < table.size(); ++idx) {
    table[idx] = static_cast<unsigned char>(idx - kYencOffset);
  }
  return table;
}();

constexpr char YencDecodeByte(char ch) noexcept {
  return static_cast<char>(kYencDecodeTable[static_cast<unsigned char>(ch)]);
}

// Decodes the byte following an escape marker.
constexpr char YencDecodeEscapedByte(char ch) noexcept {
  return static_cast<char>(kYencDecodeTable[static_cast<unsigned char>(static_cast<unsigned char>(ch) -
                                                                        kYencEscapeOffset)]);
}

}  // namespace ydecode
