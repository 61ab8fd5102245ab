#pragma once

#include <cstdint>
#include <span>

#include "ydecode/source.hpp"

namespace ydecode {

class Article;
class QueueBookkeeper;

// Decides whether a failed article should be fetched again from another source.
class RetryPolicy {
 public:
  enum class Decision : std::uint8_t { RetryRequested, Exhausted };

  // 'sources' are all the known sources, in configured priority order. They must outlive this object.
  RetryPolicy(std::span<const Source> sources, QueueBookkeeper& queue) noexcept : _sources(sources), _queue(&queue) {}

  // Adds the current source of 'article' to its try list, then looks for the first active source not tried yet
  // whose priority value is at least the one of the current source.
  // If one exists, resets the try counter of the article, asks for a partial try list reset (sibling articles may be
  // tried again on sources they already exhausted) and returns RetryRequested.
  // Otherwise, reports the article as missing and returns Exhausted.
  [[nodiscard]] Decision searchNewSource(Article& article) const;

 private:
  std::span<const Source> _sources;
  QueueBookkeeper* _queue;
};

}  // namespace ydecode
