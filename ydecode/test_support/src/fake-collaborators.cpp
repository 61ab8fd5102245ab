#include "ydecode/fake-collaborators.hpp"

#include <cstddef>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ydecode/article.hpp"
#include "ydecode/collaborators.hpp"
#include "ydecode/decode-job.hpp"
#include "ydecode/file-fragment-set.hpp"

namespace ydecode::test {

void FakeArticleStore::save(Article& article, std::string data) {
  std::scoped_lock lock(_mutex);
  if (_failSave) {
    throw std::runtime_error("article store is full");
  }
  _cacheSize += data.size();
  _saved.push_back({&article, std::move(data)});
}

bool FakeArticleStore::freeReservedSpace([[maybe_unused]] const DecodeJob& job) {
  std::scoped_lock lock(_mutex);
  ++_freeReservedSpaceCalls;
  return _roomInStore;
}

CacheInfo FakeArticleStore::cacheInfo() const {
  std::scoped_lock lock(_mutex);
  return {_saved.size(), _cacheSize, 1UL << 30};
}

void FakeArticleStore::setRoomInStore(bool value) {
  std::scoped_lock lock(_mutex);
  _roomInStore = value;
}

void FakeArticleStore::setFailSave(bool value) {
  std::scoped_lock lock(_mutex);
  _failSave = value;
}

std::vector<FakeArticleStore::SavedArticle> FakeArticleStore::saved() const {
  std::scoped_lock lock(_mutex);
  return _saved;
}

std::size_t FakeArticleStore::freeReservedSpaceCalls() const {
  std::scoped_lock lock(_mutex);
  return _freeReservedSpaceCalls;
}

void FakeQueueBookkeeper::registerArticle(Article& article, bool found) {
  std::scoped_lock lock(_mutex);
  _registrations.push_back({&article, found});
}

void FakeQueueBookkeeper::resetTryLists(Article& article, bool full) {
  article.file().resetTryLists(full ? nullptr : &article);
  std::scoped_lock lock(_mutex);
  _resets.push_back({&article, full});
}

void FakeQueueBookkeeper::reportBadArticle([[maybe_unused]] FileFragmentSet& file, BadArticleKind kind) {
  std::scoped_lock lock(_mutex);
  switch (kind) {
    case BadArticleKind::Killed:
      ++_killed;
      break;
    case BadArticleKind::Bad:
      ++_bad;
      break;
    case BadArticleKind::Missing:
      ++_missing;
      break;
    default:
      break;
  }
}

bool FakeQueueBookkeeper::pauseFile([[maybe_unused]] FileFragmentSet& file) {
  std::scoped_lock lock(_mutex);
  ++_pauseFileCalls;
  return !std::exchange(_paused, true);
}

void FakeQueueBookkeeper::verifyFilename(FileFragmentSet& file, std::string_view candidate) {
  bool accept;
  {
    std::scoped_lock lock(_mutex);
    _proposedFilenames.emplace_back(candidate);
    if (_failVerifyFilename) {
      throw std::runtime_error("filename verification failed");
    }
    accept = _acceptFilenames;
  }
  if (accept) {
    file.lockFilename(candidate);
  }
}

void FakeQueueBookkeeper::setAcceptFilenames(bool value) {
  std::scoped_lock lock(_mutex);
  _acceptFilenames = value;
}

std::vector<FakeQueueBookkeeper::Registration> FakeQueueBookkeeper::registrations() const {
  std::scoped_lock lock(_mutex);
  return _registrations;
}

std::vector<FakeQueueBookkeeper::Reset> FakeQueueBookkeeper::resets() const {
  std::scoped_lock lock(_mutex);
  return _resets;
}

std::size_t FakeQueueBookkeeper::badArticles(BadArticleKind kind) const {
  std::scoped_lock lock(_mutex);
  switch (kind) {
    case BadArticleKind::Killed:
      return _killed;
    case BadArticleKind::Bad:
      return _bad;
    case BadArticleKind::Missing:
      return _missing;
    default:
      return 0;
  }
}

std::size_t FakeQueueBookkeeper::pauseFileCalls() const {
  std::scoped_lock lock(_mutex);
  return _pauseFileCalls;
}

bool FakeQueueBookkeeper::paused() const {
  std::scoped_lock lock(_mutex);
  return _paused;
}

void FakeQueueBookkeeper::setFailVerifyFilename(bool value) {
  std::scoped_lock lock(_mutex);
  _failVerifyFilename = value;
}

std::vector<std::string> FakeQueueBookkeeper::proposedFilenames() const {
  std::scoped_lock lock(_mutex);
  return _proposedFilenames;
}

void FakeFetchController::pause() {
  std::scoped_lock lock(_mutex);
  ++_pauseCalls;
}

void FakeFetchController::resume() {
  std::scoped_lock lock(_mutex);
  ++_resumeCalls;
}

bool FakeFetchController::isDelayed() const {
  std::scoped_lock lock(_mutex);
  return _delayed;
}

void FakeFetchController::setDelayed(bool value) {
  std::scoped_lock lock(_mutex);
  _delayed = value;
}

std::size_t FakeFetchController::pauseCalls() const {
  std::scoped_lock lock(_mutex);
  return _pauseCalls;
}

std::size_t FakeFetchController::resumeCalls() const {
  std::scoped_lock lock(_mutex);
  return _resumeCalls;
}

}  // namespace ydecode::test
