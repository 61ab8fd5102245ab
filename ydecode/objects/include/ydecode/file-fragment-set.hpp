#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ydecode/md5.hpp"
#include "ydecode/try-list.hpp"

namespace ydecode {

class Article;

enum class EncodingType : std::uint8_t { Unknown, Yenc, Unsupported };

// The output file an article belongs to, owned by the download queue for its whole lifetime.
// Its articles register themselves at construction and must outlive it.
class FileFragmentSet {
 public:
  FileFragmentSet(std::string jobName, std::string filename, bool precheck = false);

  FileFragmentSet(const FileFragmentSet&) = delete;
  FileFragmentSet& operator=(const FileFragmentSet&) = delete;

  // Name of the download job owning this file, used in user facing messages.
  [[nodiscard]] std::string_view jobName() const noexcept { return _jobName; }

  [[nodiscard]] std::string filename() const;

  // Headers-only validation: article presence is checked, payload is not decoded.
  [[nodiscard]] bool precheck() const noexcept { return _precheck; }

  [[nodiscard]] EncodingType encoding() const noexcept { return _encoding.load(std::memory_order_relaxed); }

  void setEncoding(EncodingType type) noexcept { _encoding.store(type, std::memory_order_relaxed); }

  [[nodiscard]] std::uint32_t decodedFragments() const noexcept {
    return _decodedFragments.load(std::memory_order_relaxed);
  }

  void incrementDecodedFragments() noexcept { _decodedFragments.fetch_add(1, std::memory_order_relaxed); }

  [[nodiscard]] bool isFilenameLocked() const noexcept { return _filenameLocked.load(std::memory_order_acquire); }

  // Sets the verified filename. Only the first call succeeds, subsequent ones return false.
  bool lockFilename(std::string_view filename);

  [[nodiscard]] std::optional<Md5Digest> fingerprint() const;

  // Stores the content fingerprint. Only the first call succeeds, subsequent ones return false.
  bool setFingerprint(const Md5Digest& digest);

  [[nodiscard]] TryList& tryList() noexcept { return _tryList; }

  void addArticle(Article& article);

  [[nodiscard]] std::vector<Article*> articles() const;

  // Clears the file level try list and the try state of every article except 'keep'
  // (which may be nullptr to reset all of them).
  void resetTryLists(const Article* keep);

 private:
  std::string _jobName;
  mutable std::mutex _mutex;  // guards _filename, _fingerprint and _articles
  std::string _filename;
  std::optional<Md5Digest> _fingerprint;
  std::vector<Article*> _articles;
  TryList _tryList;
  std::atomic<EncodingType> _encoding{EncodingType::Unknown};
  std::atomic<std::uint32_t> _decodedFragments{0};
  std::atomic<bool> _filenameLocked{false};
  bool _precheck;
};

}  // namespace ydecode
