#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "ydecode/collaborators.hpp"

namespace ydecode::test {

// In-memory article store recording every call.
class FakeArticleStore : public ArticleStore {
 public:
  struct SavedArticle {
    const Article* article;
    std::string data;
  };

  void save(Article& article, std::string data) override;

  bool freeReservedSpace(const DecodeJob& job) override;

  [[nodiscard]] CacheInfo cacheInfo() const override;

  // Value returned by freeReservedSpace.
  void setRoomInStore(bool value);

  // Makes save throw std::runtime_error.
  void setFailSave(bool value);

  [[nodiscard]] std::vector<SavedArticle> saved() const;

  [[nodiscard]] std::size_t freeReservedSpaceCalls() const;

 private:
  mutable std::mutex _mutex;
  std::vector<SavedArticle> _saved;
  std::size_t _freeReservedSpaceCalls{};
  std::size_t _cacheSize{};
  bool _roomInStore{false};
  bool _failSave{false};
};

// Queue bookkeeper recording every call. Try list resets are applied to the article's file, and proposed filenames
// are accepted (the file name gets locked) unless told otherwise.
class FakeQueueBookkeeper : public QueueBookkeeper {
 public:
  struct Registration {
    const Article* article;
    bool found;
  };

  struct Reset {
    const Article* article;
    bool full;
  };

  void registerArticle(Article& article, bool found) override;

  void resetTryLists(Article& article, bool full) override;

  void reportBadArticle(FileFragmentSet& file, BadArticleKind kind) override;

  bool pauseFile(FileFragmentSet& file) override;

  void verifyFilename(FileFragmentSet& file, std::string_view candidate) override;

  void setAcceptFilenames(bool value);

  [[nodiscard]] std::vector<Registration> registrations() const;

  [[nodiscard]] std::vector<Reset> resets() const;

  [[nodiscard]] std::size_t badArticles(BadArticleKind kind) const;

  [[nodiscard]] std::size_t pauseFileCalls() const;

  [[nodiscard]] bool paused() const;

  // Makes verifyFilename throw std::runtime_error.
  void setFailVerifyFilename(bool value);

  [[nodiscard]] std::vector<std::string> proposedFilenames() const;

 private:
  mutable std::mutex _mutex;
  std::vector<Registration> _registrations;
  std::vector<Reset> _resets;
  std::vector<std::string> _proposedFilenames;
  std::size_t _killed{};
  std::size_t _bad{};
  std::size_t _missing{};
  std::size_t _pauseFileCalls{};
  bool _paused{false};
  bool _acceptFilenames{true};
  bool _failVerifyFilename{false};
};

class FakeFetchController : public FetchController {
 public:
  void pause() override;

  // Does not clear the delayed state: tests control it with setDelayed.
  void resume() override;

  [[nodiscard]] bool isDelayed() const override;

  void setDelayed(bool value);

  [[nodiscard]] std::size_t pauseCalls() const;

  [[nodiscard]] std::size_t resumeCalls() const;

 private:
  mutable std::mutex _mutex;
  std::size_t _pauseCalls{};
  std::size_t _resumeCalls{};
  bool _delayed{false};
};

// Fake collaborators bundled together.
struct FakeCollaborators {
  Collaborators collaborators() { return {store, queue, fetcher}; }

  FakeArticleStore store;
  FakeQueueBookkeeper queue;
  FakeFetchController fetcher;
};

}  // namespace ydecode::test
