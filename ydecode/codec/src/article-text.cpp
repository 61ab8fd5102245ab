#include "ydecode/article-text.hpp"

#include <cstddef>
#include <string>
#include <string_view>

#include "ydecode/decode-job.hpp"

namespace ydecode {

namespace {
constexpr std::string_view StripCR(std::string_view line) {
  if (line.ends_with('\r')) {
    line.remove_suffix(1);
  }
  return line;
}
}  // namespace

ArticleText::ArticleText(const DecodeJob& job) {
  if (!job.lines().empty()) {
    _lines.reserve(job.lines().size());
    for (const std::string& line : job.lines()) {
      const std::string_view stripped = StripCR(line);
      if (!stripped.empty()) {
        _lines.push_back(stripped);
      }
    }
    return;
  }

  const auto& chunks = job.rawChunks();
  if (chunks.size() == 1) {
    splitRaw(chunks.front());
    return;
  }
  _joined.reserve(job.payloadSize());
  for (const std::string& chunk : chunks) {
    _joined.append(chunk);
  }
  splitRaw(_joined);
}

void ArticleText::splitRaw(std::string_view data) {
  _lines.reserve(data.size() / 64);
  while (!data.empty()) {
    const auto lfPos = data.find('\n');
    std::string_view line = data.substr(0, lfPos);
    data.remove_prefix(lfPos == std::string_view::npos ? data.size() : lfPos + 1);

    line = StripCR(line);
    if (line == ".") {
      break;
    }
    if (line.starts_with("..")) {
      line.remove_prefix(1);
    }
    if (!line.empty()) {
      _lines.push_back(line);
    }
  }
}

}  // namespace ydecode
