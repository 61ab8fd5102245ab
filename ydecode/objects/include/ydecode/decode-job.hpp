#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace ydecode {

class Article;

// One fetched article handed over by the fetch layer.
// At most one of the two payload carriers is populated: 'lines' for line oriented fetchers (already dot-unstuffed,
// no line terminators) or 'rawChunks' for raw NNTP socket data. A default constructed job is a stop sentinel.
class DecodeJob {
 public:
  DecodeJob() noexcept = default;

  DecodeJob(Article& article, std::vector<std::string> lines, std::vector<std::string> rawChunks = {})
      : _article(&article), _lines(std::move(lines)), _rawChunks(std::move(rawChunks)) {}

  static DecodeJob Stop() noexcept { return {}; }

  static DecodeJob FromLines(Article& article, std::vector<std::string> lines) {
    return {article, std::move(lines)};
  }

  static DecodeJob FromRawChunks(Article& article, std::vector<std::string> rawChunks) {
    return {article, {}, std::move(rawChunks)};
  }

  // A job without payload means that no data was received for this article.
  static DecodeJob Empty(Article& article) { return {article, {}}; }

  [[nodiscard]] bool isStop() const noexcept { return _article == nullptr; }

  [[nodiscard]] bool hasPayload() const noexcept { return !_lines.empty() || !_rawChunks.empty(); }

  [[nodiscard]] Article* article() const noexcept { return _article; }

  [[nodiscard]] const std::vector<std::string>& lines() const noexcept { return _lines; }

  [[nodiscard]] const std::vector<std::string>& rawChunks() const noexcept { return _rawChunks; }

  // Total number of payload bytes carried by this job.
  [[nodiscard]] std::size_t payloadSize() const noexcept {
    std::size_t total = 0;
    for (const auto& line : _lines) {
      total += line.size();
    }
    for (const auto& chunk : _rawChunks) {
      total += chunk.size();
    }
    return total;
  }

 private:
  Article* _article{nullptr};
  std::vector<std::string> _lines;
  std::vector<std::string> _rawChunks;
};

}  // namespace ydecode
