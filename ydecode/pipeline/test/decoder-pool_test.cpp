#include "ydecode/decoder-pool.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "ydecode/article-builder.hpp"
#include "ydecode/article.hpp"
#include "ydecode/decode-job.hpp"
#include "ydecode/decoder-config.hpp"
#include "ydecode/fake-collaborators.hpp"
#include "ydecode/file-fragment-set.hpp"
#include "ydecode/source.hpp"
#include "ydecode/yenc-encoder.hpp"

namespace ydecode {

class DecoderPoolTest : public ::testing::Test {
 protected:
  static std::vector<Source> MakeSources() {
    std::vector<Source> sources;
    sources.emplace_back("primary", 0);
    return sources;
  }

  std::vector<Source> sources = MakeSources();
  test::FakeCollaborators fakes;
};

TEST_F(DecoderPoolTest, InvalidConfigThrows) {
  EXPECT_THROW(DecoderPool(DecoderConfig{}.withNbWorkers(0), sources, fakes.collaborators()), std::invalid_argument);
  EXPECT_THROW(DecoderPool(DecoderConfig{}.withQueueLimits(30, 20), sources, fakes.collaborators()),
               std::invalid_argument);
  EXPECT_THROW(DecoderPool(DecoderConfig{}.withLogLevel("verbose"), sources, fakes.collaborators()),
               std::invalid_argument);
}

TEST_F(DecoderPoolTest, StartTwiceThrows) {
  DecoderPool pool(DecoderConfig{}.withNbWorkers(1), sources, fakes.collaborators());
  pool.start();
  EXPECT_TRUE(pool.isRunning());
  EXPECT_THROW(pool.start(), std::logic_error);
  pool.stop();
  EXPECT_FALSE(pool.isRunning());
  EXPECT_NO_THROW(pool.rethrowIfError());
}

TEST_F(DecoderPoolTest, StopWithoutStartIsNoOp) {
  DecoderPool pool(DecoderConfig{}, sources, fakes.collaborators());
  pool.stop();
  EXPECT_FALSE(pool.isRunning());
  EXPECT_EQ(pool.queueSize(), 0U);
}

TEST_F(DecoderPoolTest, SelectedBackend) {
  DecoderPool reference(DecoderConfig{}.withBackend(DecodeBackend::Reference), sources, fakes.collaborators());
  DecoderPool streaming(DecoderConfig{}.withBackend(DecodeBackend::Streaming), sources, fakes.collaborators());
  EXPECT_EQ(reference.backend().kind(), DecodeBackend::Reference);
  EXPECT_EQ(streaming.backend().kind(), DecodeBackend::Streaming);
}

TEST_F(DecoderPoolTest, DecodesEveryJobBeforeStopping) {
  static constexpr std::size_t kNbFiles = 5;
  static constexpr std::size_t kNbParts = 40;
  static constexpr std::size_t kPartSize = 3000;

  DecoderPool pool(DecoderConfig{}.withNbWorkers(4).withQueueCapacity(8).withYieldInterval(std::chrono::microseconds{0}),
                   sources, fakes.collaborators());
  pool.start();
  EXPECT_EQ(pool.nbWorkers(), 4U);

  std::deque<FileFragmentSet> files;
  std::deque<Article> articles;
  std::size_t totalBytes = 0;
  for (std::size_t fileIdx = 0; fileIdx < kNbFiles; ++fileIdx) {
    const std::string name = "file" + std::to_string(fileIdx) + ".bin";
    FileFragmentSet& file = files.emplace_back("job", name);
    const std::string content = test::MakeRandomPayload(kNbParts * kPartSize, fileIdx + 1);
    for (std::size_t part = 0; part < kNbParts; ++part) {
      Article& article = articles.emplace_back("<" + std::to_string(articles.size()) + "@test>", kPartSize, file,
                                               part == 0);
      article.setFetcher(&sources[0]);
      const auto data = std::string_view(content).substr(part * kPartSize, kPartSize);
      const YencPartSpec spec{static_cast<uint32_t>(part + 1), static_cast<uint32_t>(kNbParts),
                              part * kPartSize + 1, content.size()};
      pool.enqueue(DecodeJob::FromRawChunks(article, test::ToNntpChunks(BuildYencArticle(name, data, spec), 512)));
      totalBytes += data.size();
    }
  }
  pool.stop();
  pool.rethrowIfError();

  EXPECT_FALSE(pool.isRunning());
  EXPECT_EQ(pool.queueSize(), 0U);

  const auto registrations = fakes.queue.registrations();
  EXPECT_EQ(registrations.size(), kNbFiles * kNbParts);
  for (const auto& registration : registrations) {
    EXPECT_TRUE(registration.found);
  }
  EXPECT_EQ(fakes.store.saved().size(), kNbFiles * kNbParts);

  for (const auto& file : files) {
    EXPECT_EQ(file.decodedFragments(), kNbParts);
    EXPECT_TRUE(file.isFilenameLocked());
  }

  const auto stats = pool.stats();
  EXPECT_EQ(stats.jobsProcessed, kNbFiles * kNbParts);
  EXPECT_EQ(stats.articlesDecoded, kNbFiles * kNbParts);
  EXPECT_EQ(stats.bytesDecoded, totalBytes);
  EXPECT_EQ(stats.crcErrors, 0U);
}

TEST_F(DecoderPoolTest, RestartAfterStop) {
  FileFragmentSet file("job", "file.bin");
  Article article("<1@test>", 3, file);
  DecoderPool pool(DecoderConfig{}.withNbWorkers(2), sources, fakes.collaborators());

  pool.start();
  pool.enqueue(DecodeJob::FromLines(article, BuildYencArticle("file.bin", "abc")));
  pool.stop();

  pool.start();
  pool.enqueue(DecodeJob::FromLines(article, BuildYencArticle("file.bin", "def")));
  pool.stop();

  EXPECT_EQ(fakes.store.saved().size(), 2U);
  EXPECT_EQ(pool.stats().articlesDecoded, 2U);
}

}  // namespace ydecode
