#include "ydecode/ascii.hpp"

#include <gtest/gtest.h>

#include "ydecode/log.hpp"

namespace ydecode {

TEST(Ascii, ToLowerUpper) {
  static_assert(tolower('A') == 'a');
  static_assert(toupper('f') == 'F');
  EXPECT_EQ(tolower('-'), '-');
  EXPECT_EQ(toupper('9'), '9');
}

TEST(Ascii, CaseInsensitiveEqual) {
  EXPECT_TRUE(CaseInsensitiveEqual("Message-ID:", "message-id:"));
  EXPECT_FALSE(CaseInsensitiveEqual("Message-ID", "message-id:"));
  EXPECT_TRUE(StartsWithCaseInsensitive("X-Received: yes", "x-"));
  EXPECT_FALSE(StartsWithCaseInsensitive("X", "x-"));
}

TEST(Ascii, ContainsLowerCase) {
  EXPECT_TRUE(ContainsLowerCase("Removed due to a DMCA notice", "dmca"));
  EXPECT_TRUE(ContainsLowerCase("<Message-ID: abc>", "message-id:"));
  EXPECT_TRUE(ContainsLowerCase("anything", ""));
  EXPECT_FALSE(ContainsLowerCase("cancelled", "blocked"));
  EXPECT_FALSE(ContainsLowerCase("dmc", "dmca"));
  EXPECT_TRUE(ContainsLowerCase("ddmca", "dmca"));
}

TEST(LogLevel, FromName) {
  EXPECT_EQ(LogLevelFromName("info"), log::level::info);
  EXPECT_EQ(LogLevelFromName("WARNING"), log::level::warn);
  EXPECT_EQ(LogLevelFromName("error"), log::level::err);
  EXPECT_EQ(LogLevelFromName("off"), log::level::off);
  EXPECT_FALSE(LogLevelFromName("verbose").has_value());
}

}  // namespace ydecode
