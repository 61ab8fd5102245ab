#include "ydecode/yenc-backend.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ydecode/article-builder.hpp"
#include "ydecode/crc32.hpp"
#include "ydecode/decoder-config.hpp"
#include "ydecode/encoded-block.hpp"
#include "ydecode/reference-yenc-backend.hpp"
#include "ydecode/yenc-encoder.hpp"

namespace ydecode {

namespace {

DecodedBlock Decode(const YencBackend& backend, const std::vector<std::string>& lines) {
  const std::vector<std::string_view> views(lines.begin(), lines.end());
  return backend.decode(views);
}

std::vector<std::string> Filler(std::size_t count) { return std::vector<std::string>(count, "filler line"); }

}  // namespace

class YencBackendTest : public ::testing::TestWithParam<DecodeBackend> {
 protected:
  DecodedBlock decode(const std::vector<std::string>& lines) const { return Decode(*backend, lines); }

  DecoderConfig config = DecoderConfig{}.withBackend(GetParam());
  std::unique_ptr<YencBackend> backend = MakeYencBackend(config);
};

TEST_P(YencBackendTest, Kind) { EXPECT_EQ(backend->kind(), GetParam()); }

TEST_P(YencBackendTest, RoundTripAllByteValues) {
  const std::string data = test::MakePatternedPayload(4096);
  const auto block = decode(BuildYencArticle("all.bin", data));
  ASSERT_EQ(block.status, BlockStatus::Located);
  EXPECT_EQ(block.data, data);
  EXPECT_EQ(block.crc, ComputeCrc32(data));
  EXPECT_EQ(block.header.name, "all.bin");
  EXPECT_EQ(block.trailer.size, data.size());
}

TEST_P(YencBackendTest, RoundTripVariousLineLengths) {
  const std::string data = test::MakeRandomPayload(5000);
  for (std::size_t lineLength : {1U, 2U, 3U, 64U, 128U, 997U, 8192U}) {
    const auto block = decode(BuildYencArticle("random.bin", data, std::nullopt, lineLength));
    ASSERT_EQ(block.status, BlockStatus::Located) << "line length " << lineLength;
    EXPECT_EQ(block.data, data) << "line length " << lineLength;
    EXPECT_EQ(block.crc, ComputeCrc32(data)) << "line length " << lineLength;
  }
}

TEST_P(YencBackendTest, RoundTripEmptyPayload) {
  const auto block = decode(BuildYencArticle("empty.bin", ""));
  ASSERT_EQ(block.status, BlockStatus::Located);
  EXPECT_TRUE(block.data.empty());
  EXPECT_EQ(block.crc, 0U);
}

TEST_P(YencBackendTest, EscapeAtEndOfLineAppliesToNextLine) {
  const auto block = decode({"=ybegin line=128 size=3 name=x", "a=", "}b", "=yend size=3"});
  ASSERT_EQ(block.status, BlockStatus::Located);
  EXPECT_EQ(block.data, std::string("\x37\x13\x38"));
}

TEST_P(YencBackendTest, DanglingEscapeIsDropped) {
  const auto block = decode({"=ybegin line=128 size=1 name=x", "a=", "=yend size=1"});
  ASSERT_EQ(block.status, BlockStatus::Located);
  EXPECT_EQ(block.data, std::string("\x37"));
}

TEST_P(YencBackendTest, MissingHeader) {
  const auto block = decode({"no header here", "abc", "=yend size=3 crc32=00000000"});
  EXPECT_EQ(block.status, BlockStatus::MissingHeader);
  EXPECT_TRUE(block.data.empty());
}

TEST_P(YencBackendTest, HeaderScanWindow) {
  auto lines = Filler(config.headerScanLines - 1);
  const auto article = BuildYencArticle("x", "abc");
  lines.insert(lines.end(), article.begin(), article.end());
  EXPECT_EQ(decode(lines).status, BlockStatus::Located);

  lines.insert(lines.begin(), "one more filler line");
  EXPECT_EQ(decode(lines).status, BlockStatus::MissingHeader);
}

TEST_P(YencBackendTest, TrailerScanWindow) {
  auto lines = BuildYencArticle("x.bin", test::MakeRandomPayload(4000), std::nullopt, 100);
  const auto trailing = Filler(config.trailerScanLines - 1);
  lines.insert(lines.end(), trailing.begin(), trailing.end());
  EXPECT_EQ(decode(lines).status, BlockStatus::Located);

  lines.emplace_back("one more filler line");
  const auto block = decode(lines);
  EXPECT_EQ(block.status, BlockStatus::MissingTrailer);
  EXPECT_EQ(block.header.name, "x.bin");
}

TEST_P(YencBackendTest, PartLineIsNotPayload) {
  const std::string data = test::MakeRandomPayload(300);
  const auto block = decode(BuildYencArticle("x.bin", data, YencPartSpec{1, 2, 1, 600}));
  ASSERT_EQ(block.status, BlockStatus::Located);
  EXPECT_EQ(block.data, data);
  EXPECT_TRUE(block.header.hasPartLine);
  EXPECT_EQ(block.header.partBegin, 1U);
  EXPECT_EQ(block.header.partEnd, 300U);
}

INSTANTIATE_TEST_SUITE_P(Backends, YencBackendTest,
                         ::testing::Values(DecodeBackend::Reference, DecodeBackend::Streaming),
                         [](const ::testing::TestParamInfo<DecodeBackend>& info) {
                           return std::string(DecodeBackendName(info.param));
                         });

TEST(YencBackend, BackendsProduceIdenticalResults) {
  const auto reference = MakeYencBackend(DecoderConfig{}.withBackend(DecodeBackend::Reference));
  const auto streaming = MakeYencBackend(DecoderConfig{}.withBackend(DecodeBackend::Streaming));
  for (std::uint64_t seed = 1; seed <= 16; ++seed) {
    const auto lines = BuildYencArticle("x", test::MakeRandomPayload(seed * 777, seed), std::nullopt, 10 + seed * 9);
    const auto lhs = Decode(*reference, lines);
    const auto rhs = Decode(*streaming, lines);
    EXPECT_EQ(lhs.data, rhs.data);
    EXPECT_EQ(lhs.crc, rhs.crc);
  }
}

TEST(YencBackend, ReferencePayloadDecoding) {
  EXPECT_EQ(ReferenceYencBackend::DecodePayload(""), "");
  EXPECT_EQ(ReferenceYencBackend::DecodePayload("*+"), std::string("\x00\x01", 2));
  EXPECT_EQ(ReferenceYencBackend::DecodePayload("=}"), std::string("\x13"));
  EXPECT_EQ(ReferenceYencBackend::DecodePayload("=@"), std::string("\xD6"));
}

}  // namespace ydecode
