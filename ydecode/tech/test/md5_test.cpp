#include "ydecode/md5.hpp"

#include <gtest/gtest.h>

#include <string>

namespace ydecode {

TEST(Md5, KnownDigests) {
  EXPECT_EQ(Md5ToHex(ComputeMd5("")), "d41d8cd98f00b204e9800998ecf8427e");
  EXPECT_EQ(Md5ToHex(ComputeMd5("abc")), "900150983cd24fb0d6963f7d28e17f72");
  EXPECT_EQ(Md5ToHex(ComputeMd5("The quick brown fox jumps over the lazy dog")), "9e107d9d372bb6826bd81d3542a419d6");
}

TEST(Md5, BinaryInput) {
  std::string data(256, '\0');
  for (std::size_t idx = 0; idx < data.size(); ++idx) {
    data[idx] = static_cast<char>(idx);
  }
  const auto digest = ComputeMd5(data);
  EXPECT_EQ(digest, ComputeMd5(data));
  data[128] = 'x';
  EXPECT_NE(digest, ComputeMd5(data));
}

}  // namespace ydecode
