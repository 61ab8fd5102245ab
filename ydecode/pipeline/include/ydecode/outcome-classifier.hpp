#pragma once

#include <cstdint>
#include <span>
#include <string_view>

namespace ydecode {

enum class ArticleClass : std::uint8_t {
  // Precheck only: the source answered with a bare "223" status line.
  HeaderOnlyMatch,
  // A Message-ID header is present, the article exists on the source.
  Found,
  // The source removed the article.
  Removed,
  BadlyFormed
};

[[nodiscard]] std::string_view ArticleClassName(ArticleClass articleClass) noexcept;

// Classifies an article that could not be decoded (or was not meant to be, in precheck mode) from its raw lines.
// Removal keywords are searched in every line not starting with "X-" and take precedence over a Message-ID.
[[nodiscard]] ArticleClass ClassifyArticle(std::span<const std::string_view> lines, bool precheck) noexcept;

}  // namespace ydecode
