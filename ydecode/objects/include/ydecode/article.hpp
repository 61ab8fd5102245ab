#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

#include "ydecode/try-list.hpp"

namespace ydecode {

class FileFragmentSet;
class Source;

// One network-addressable unit of work, owned by the download queue.
// Decoders only touch the fetcher, the try list and the try counter, all of which are thread-safe.
class Article {
 public:
  Article(std::string messageId, std::uint64_t bytes, FileFragmentSet& file, bool lowestPartNumber = false);

  Article(const Article&) = delete;
  Article& operator=(const Article&) = delete;

  [[nodiscard]] std::string_view messageId() const noexcept { return _messageId; }

  // Expected encoded size announced by the manifest.
  [[nodiscard]] std::uint64_t bytes() const noexcept { return _bytes; }

  [[nodiscard]] FileFragmentSet& file() const noexcept { return *_file; }

  // Whether this is the lowest numbered part of its file, the one used for fingerprinting.
  [[nodiscard]] bool isLowestPartNumber() const noexcept { return _lowestPartNumber; }

  [[nodiscard]] const Source* fetcher() const noexcept { return _fetcher.load(std::memory_order_acquire); }

  void setFetcher(const Source* source) noexcept { _fetcher.store(source, std::memory_order_release); }

  [[nodiscard]] TryList& tryList() noexcept { return _tryList; }
  [[nodiscard]] const TryList& tryList() const noexcept { return _tryList; }

  [[nodiscard]] std::uint32_t tries() const noexcept { return _tries.load(std::memory_order_relaxed); }

  void incrementTries() noexcept { _tries.fetch_add(1, std::memory_order_relaxed); }

  void resetTries() noexcept { _tries.store(0, std::memory_order_relaxed); }

  // Full reset of the retry state of this article.
  void resetTryState() noexcept {
    _tryList.clear();
    resetTries();
  }

 private:
  std::string _messageId;
  std::uint64_t _bytes;
  FileFragmentSet* _file;
  std::atomic<const Source*> _fetcher{nullptr};
  std::atomic<std::uint32_t> _tries{0};
  TryList _tryList;
  bool _lowestPartNumber;
};

}  // namespace ydecode
