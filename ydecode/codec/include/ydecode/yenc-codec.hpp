#pragma once

#include <cstddef>

#include "ydecode/article-text.hpp"
#include "ydecode/decode-outcome.hpp"
#include "ydecode/yenc-backend.hpp"

namespace ydecode {

class FileFragmentSet;

// Turns the text of one article into a DecodeOutcome using the configured backend.
// Records the detected encoding on 'file'. Never returns SystemFault or UnknownFault: these come from exceptions
// escaping decode(), mapped by the caller.
class YencCodec {
 public:
  YencCodec(const YencBackend& backend, std::size_t headerScanLines) noexcept
      : _backend(&backend), _headerScanLines(headerScanLines) {}

  [[nodiscard]] DecodeOutcome decode(const ArticleText& text, FileFragmentSet& file) const;

  [[nodiscard]] const YencBackend& backend() const noexcept { return *_backend; }

 private:
  const YencBackend* _backend;
  std::size_t _headerScanLines;
};

}  // namespace ydecode
