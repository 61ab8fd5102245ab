#pragma once

#include <cstddef>
#include <mutex>
#include <vector>

namespace ydecode {

class Source;

// Sources already attempted in the current retry cycle.
// Safe for concurrent use: sibling resets may come from several decoder threads at once.
class TryList {
 public:
  TryList() = default;

  TryList(const TryList&) = delete;
  TryList& operator=(const TryList&) = delete;

  // Returns false if 'source' was already present.
  bool add(const Source* source);

  [[nodiscard]] bool contains(const Source* source) const;

  void clear() noexcept;

  [[nodiscard]] std::size_t size() const;

 private:
  mutable std::mutex _mutex;
  std::vector<const Source*> _sources;
};

}  // namespace ydecode
