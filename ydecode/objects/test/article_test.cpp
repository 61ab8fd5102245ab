#include "ydecode/article.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "ydecode/decode-job.hpp"
#include "ydecode/file-fragment-set.hpp"
#include "ydecode/md5.hpp"
#include "ydecode/source.hpp"

namespace ydecode {

TEST(TryListTest, AddIsIdempotent) {
  Source primary("primary", 0);
  Source backup("backup", 1);
  TryList tryList;

  EXPECT_TRUE(tryList.add(&primary));
  EXPECT_FALSE(tryList.add(&primary));
  EXPECT_TRUE(tryList.add(&backup));
  EXPECT_EQ(tryList.size(), 2U);
  EXPECT_TRUE(tryList.contains(&backup));

  tryList.clear();
  EXPECT_EQ(tryList.size(), 0U);
  EXPECT_FALSE(tryList.contains(&primary));
}

TEST(SourceTest, MoveKeepsState) {
  Source source("news", 3, false);
  Source moved(std::move(source));
  EXPECT_EQ(moved.name(), "news");
  EXPECT_EQ(moved.priority(), 3);
  EXPECT_FALSE(moved.isActive());
  moved.setActive(true);
  EXPECT_TRUE(moved.isActive());
}

TEST(ArticleTest, RegistersInFile) {
  FileFragmentSet file("job", "file.bin");
  Article first("<1@test>", 100, file, true);
  Article second("<2@test>", 100, file);

  const auto articles = file.articles();
  ASSERT_EQ(articles.size(), 2U);
  EXPECT_EQ(articles[0], &first);
  EXPECT_EQ(articles[1], &second);
  EXPECT_TRUE(first.isLowestPartNumber());
  EXPECT_FALSE(second.isLowestPartNumber());
  EXPECT_EQ(&first.file(), &file);
}

TEST(ArticleTest, ResetTryState) {
  FileFragmentSet file("job", "file.bin");
  Article article("<1@test>", 100, file);
  Source source("news", 0);

  article.setFetcher(&source);
  article.tryList().add(&source);
  article.incrementTries();
  article.incrementTries();
  EXPECT_EQ(article.tries(), 2U);

  article.resetTryState();
  EXPECT_EQ(article.tries(), 0U);
  EXPECT_EQ(article.tryList().size(), 0U);
  EXPECT_EQ(article.fetcher(), &source);
}

TEST(FileFragmentSetTest, FilenameLockedOnce) {
  FileFragmentSet file("job", "obfuscated.bin");
  EXPECT_FALSE(file.isFilenameLocked());
  EXPECT_TRUE(file.lockFilename("real.part01.rar"));
  EXPECT_TRUE(file.isFilenameLocked());
  EXPECT_FALSE(file.lockFilename("other.rar"));
  EXPECT_EQ(file.filename(), "real.part01.rar");
}

TEST(FileFragmentSetTest, FingerprintSetOnce) {
  FileFragmentSet file("job", "file.bin");
  EXPECT_FALSE(file.fingerprint().has_value());
  const auto digest = ComputeMd5("first");
  EXPECT_TRUE(file.setFingerprint(digest));
  EXPECT_FALSE(file.setFingerprint(ComputeMd5("second")));
  EXPECT_EQ(file.fingerprint(), digest);
}

TEST(FileFragmentSetTest, PartialResetKeepsOneArticle) {
  FileFragmentSet file("job", "file.bin");
  Source source("news", 0);
  Article keep("<1@test>", 100, file);
  Article sibling("<2@test>", 100, file);
  keep.tryList().add(&source);
  sibling.tryList().add(&source);
  file.tryList().add(&source);

  file.resetTryLists(&keep);

  EXPECT_TRUE(keep.tryList().contains(&source));
  EXPECT_FALSE(sibling.tryList().contains(&source));
  EXPECT_FALSE(file.tryList().contains(&source));
}

TEST(FileFragmentSetTest, ConcurrentSiblingResets) {
  FileFragmentSet file("job", "file.bin");
  Source source("news", 0);
  std::vector<std::unique_ptr<Article>> articles;
  for (int idx = 0; idx < 8; ++idx) {
    articles.push_back(std::make_unique<Article>("<" + std::to_string(idx) + "@test>", 10, file));
  }

  {
    std::vector<std::jthread> threads;
    for (const auto& article : articles) {
      threads.emplace_back([&file, &source, ptr = article.get()] {
        for (int iter = 0; iter < 200; ++iter) {
          ptr->tryList().add(&source);
          ptr->incrementTries();
          file.resetTryLists(ptr);
        }
      });
    }
  }

  file.resetTryLists(nullptr);
  for (const auto& article : articles) {
    EXPECT_EQ(article->tryList().size(), 0U);
    EXPECT_EQ(article->tries(), 0U);
  }
}

TEST(DecodeJobTest, PayloadPresence) {
  FileFragmentSet file("job", "file.bin");
  Article article("<1@test>", 100, file);

  EXPECT_TRUE(DecodeJob::Stop().isStop());
  EXPECT_FALSE(DecodeJob::Stop().hasPayload());

  const auto empty = DecodeJob::Empty(article);
  EXPECT_FALSE(empty.isStop());
  EXPECT_FALSE(empty.hasPayload());

  const auto lines = DecodeJob::FromLines(article, {"", ""});
  EXPECT_TRUE(lines.hasPayload());
  EXPECT_EQ(lines.payloadSize(), 0U);

  const auto raw = DecodeJob::FromRawChunks(article, {"abc\r\n", "de"});
  EXPECT_TRUE(raw.hasPayload());
  EXPECT_EQ(raw.payloadSize(), 7U);
  EXPECT_EQ(raw.article(), &article);
}

}  // namespace ydecode
