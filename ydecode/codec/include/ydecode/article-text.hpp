#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ydecode {

class DecodeJob;

// Non empty text lines of a decode job payload, without line terminators.
//
// Line jobs are used as is (a trailing CR is dropped). Raw NNTP chunks are joined and split on LF; CRLF endings are
// dropped, a lone "." line ends the article and a leading ".." is unstuffed to ".".
// Views point into the job (or into an internal buffer for multi-chunk data): the job must outlive this object.
class ArticleText {
 public:
  explicit ArticleText(const DecodeJob& job);

  ArticleText(const ArticleText&) = delete;
  ArticleText(ArticleText&&) = delete;
  ArticleText& operator=(const ArticleText&) = delete;
  ArticleText& operator=(ArticleText&&) = delete;

  ~ArticleText() = default;

  [[nodiscard]] std::span<const std::string_view> lines() const noexcept { return _lines; }

  [[nodiscard]] bool empty() const noexcept { return _lines.empty(); }

 private:
  void splitRaw(std::string_view data);

  std::string _joined;
  std::vector<std::string_view> _lines;
};

}  // namespace ydecode
