#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace ydecode {

class Article;
class QueueBookkeeper;

// Forwards the filename announced by a decoded fragment to the queue bookkeeper, until the file name is locked.
// The lowest numbered fragment of a file also sets its content fingerprint: the MD5 of its first
// 'fingerprintBytes' decoded bytes.
class FilenameVerifier {
 public:
  FilenameVerifier(QueueBookkeeper& queue, std::size_t fingerprintBytes) noexcept
      : _queue(&queue), _fingerprintBytes(fingerprintBytes) {}

  void verify(Article& article, std::string_view data, const std::optional<std::string>& filename) const;

 private:
  QueueBookkeeper* _queue;
  std::size_t _fingerprintBytes;
};

}  // namespace ydecode
