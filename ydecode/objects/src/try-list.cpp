#include "ydecode/try-list.hpp"

#include <algorithm>
#include <cstddef>
#include <mutex>

namespace ydecode {

bool TryList::add(const Source* source) {
  std::scoped_lock lock(_mutex);
  if (std::ranges::find(_sources, source) != _sources.end()) {
    return false;
  }
  _sources.push_back(source);
  return true;
}

bool TryList::contains(const Source* source) const {
  std::scoped_lock lock(_mutex);
  return std::ranges::find(_sources, source) != _sources.end();
}

void TryList::clear() noexcept {
  std::scoped_lock lock(_mutex);
  _sources.clear();
}

std::size_t TryList::size() const {
  std::scoped_lock lock(_mutex);
  return _sources.size();
}

}  // namespace ydecode
