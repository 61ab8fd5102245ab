#include "ydecode/file-fragment-set.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ydecode/article.hpp"
#include "ydecode/md5.hpp"

namespace ydecode {

FileFragmentSet::FileFragmentSet(std::string jobName, std::string filename, bool precheck)
    : _jobName(std::move(jobName)), _filename(std::move(filename)), _precheck(precheck) {}

std::string FileFragmentSet::filename() const {
  std::scoped_lock lock(_mutex);
  return _filename;
}

bool FileFragmentSet::lockFilename(std::string_view filename) {
  std::scoped_lock lock(_mutex);
  if (_filenameLocked.load(std::memory_order_relaxed)) {
    return false;
  }
  _filename.assign(filename);
  _filenameLocked.store(true, std::memory_order_release);
  return true;
}

std::optional<Md5Digest> FileFragmentSet::fingerprint() const {
  std::scoped_lock lock(_mutex);
  return _fingerprint;
}

bool FileFragmentSet::setFingerprint(const Md5Digest& digest) {
  std::scoped_lock lock(_mutex);
  if (_fingerprint) {
    return false;
  }
  _fingerprint = digest;
  return true;
}

void FileFragmentSet::addArticle(Article& article) {
  std::scoped_lock lock(_mutex);
  _articles.push_back(&article);
}

std::vector<Article*> FileFragmentSet::articles() const {
  std::scoped_lock lock(_mutex);
  return _articles;
}

void FileFragmentSet::resetTryLists(const Article* keep) {
  _tryList.clear();
  for (Article* article : articles()) {
    if (article != keep) {
      article->resetTryState();
    }
  }
}

}  // namespace ydecode
