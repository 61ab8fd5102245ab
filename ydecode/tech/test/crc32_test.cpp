#include "ydecode/crc32.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>

namespace ydecode {

TEST(Crc32, CheckValue) { EXPECT_EQ(ComputeCrc32("123456789"), 0xCBF43926U); }

TEST(Crc32, Empty) {
  EXPECT_EQ(ComputeCrc32(""), 0U);
  EXPECT_EQ(Crc32ToHex(ComputeCrc32("")), "00000000");
}

TEST(Crc32, IncrementalMatchesOneShot) {
  static constexpr std::string_view kData = "The quick brown fox jumps over the lazy dog";
  Crc32 crc;
  crc.update(kData.substr(0, 10));
  crc.update("");
  crc.update(kData.substr(10));
  EXPECT_EQ(crc.value(), ComputeCrc32(kData));
  EXPECT_EQ(crc.value(), 0x414FA339U);
}

TEST(Crc32, HexIsUpperCaseAndPadded) {
  EXPECT_EQ(Crc32ToHex(0xCBF43926U), "CBF43926");
  EXPECT_EQ(Crc32ToHex(0x0000ABCDU), "0000ABCD");
  EXPECT_EQ(Crc32ToHex(0xFFFFFFFFU), "FFFFFFFF");
}

TEST(Crc32, SingleBitFlipChangesChecksum) {
  std::string data(1000, 'x');
  const auto reference = ComputeCrc32(data);
  for (std::size_t pos = 0; pos < data.size(); pos += 97) {
    for (int bit = 0; bit < 8; ++bit) {
      std::string flipped = data;
      flipped[pos] = static_cast<char>(flipped[pos] ^ (1 << bit));
      EXPECT_NE(ComputeCrc32(flipped), reference);
    }
  }
}

TEST(Crc32, NormalizeDeclaredValue) {
  EXPECT_EQ(NormalizeCrc32String("cbf43926"), "CBF43926");
  EXPECT_EQ(NormalizeCrc32String("abcd"), "0000ABCD");
  EXPECT_EQ(NormalizeCrc32String("0"), "00000000");
  EXPECT_EQ(NormalizeCrc32String("DeadBeef"), "DEADBEEF");
}

TEST(Crc32, NormalizeRejectsGarbage) {
  EXPECT_FALSE(NormalizeCrc32String("").has_value());
  EXPECT_FALSE(NormalizeCrc32String("123456789").has_value());
  EXPECT_FALSE(NormalizeCrc32String("12z4").has_value());
  EXPECT_FALSE(NormalizeCrc32String("12 4").has_value());
}

}  // namespace ydecode
