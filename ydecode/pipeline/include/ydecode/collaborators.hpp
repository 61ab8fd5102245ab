#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace ydecode {

class Article;
class DecodeJob;
class FileFragmentSet;

enum class BadArticleKind : std::uint8_t {
  // Removed by the source (DMCA, cancel...).
  Killed,
  // Corrupt or undecodable.
  Bad,
  // Not available on any eligible source.
  Missing
};

[[nodiscard]] std::string_view BadArticleKindName(BadArticleKind kind) noexcept;

struct CacheInfo {
  std::size_t articleCount{};
  std::uint64_t cacheSize{};
  std::uint64_t cacheLimit{};
};

// The collaborators below are owned by the download application. All of them are called concurrently by every
// decoder thread and must be thread-safe.

// Storage of decoded article data.
class ArticleStore {
 public:
  virtual ~ArticleStore() = default;

  // Persists the decoded bytes of 'article'. Always called before the article is registered.
  virtual void save(Article& article, std::string data) = 0;

  // Releases the space reserved for the job about to be decoded.
  // Returns true if the store has enough room left for the fetch layer to continue.
  virtual bool freeReservedSpace(const DecodeJob& job) = 0;

  [[nodiscard]] virtual CacheInfo cacheInfo() const = 0;
};

// Download queue bookkeeping: final article states, try lists and bad article counters.
class QueueBookkeeper {
 public:
  virtual ~QueueBookkeeper() = default;

  // Final state of an article. 'found' is false when the article could not be obtained.
  virtual void registerArticle(Article& article, bool found) = 0;

  // Allows the sources already tried to be tried again. A full reset also clears the try state of 'article'
  // itself, a partial one only affects its file and its sibling articles.
  virtual void resetTryLists(Article& article, bool full) = 0;

  virtual void reportBadArticle(FileFragmentSet& file, BadArticleKind kind) = 0;

  // Pauses the download job owning 'file' unless it is already paused, as a single atomic step.
  // Returns true if this call paused it.
  virtual bool pauseFile(FileFragmentSet& file) = 0;

  // Proposes 'candidate' as the real name of 'file'. The bookkeeper decides whether to accept it.
  virtual void verifyFilename(FileFragmentSet& file, std::string_view candidate) = 0;
};

// Control of the fetch layer (the producer of decode jobs).
class FetchController {
 public:
  virtual ~FetchController() = default;

  virtual void pause() = 0;

  // Lifts a throttling delay.
  virtual void resume() = 0;

  // Whether the fetch layer is currently throttled, waiting for the decoders to catch up.
  [[nodiscard]] virtual bool isDelayed() const = 0;
};

struct Collaborators {
  ArticleStore& store;
  QueueBookkeeper& queue;
  FetchController& fetcher;
};

}  // namespace ydecode
