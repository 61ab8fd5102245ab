#include "ydecode/outcome-classifier.hpp"

#include <algorithm>
#include <array>
#include <span>
#include <string_view>

#include "ydecode/ascii.hpp"

namespace ydecode {

namespace {

constexpr std::string_view kHeaderOnlyStatus = "223 ";
constexpr std::string_view kMessageIdHeader = "message-id:";
constexpr std::string_view kExtensionHeaderPrefix = "X-";

constexpr std::array<std::string_view, 4> kRemovalKeywords{"dmca", "removed", "cancel", "blocked"};

constexpr bool HasRemovalKeyword(std::string_view line) {
  return std::ranges::any_of(kRemovalKeywords,
                             [line](std::string_view keyword) { return ContainsLowerCase(line, keyword); });
}

}  // namespace

std::string_view ArticleClassName(ArticleClass articleClass) noexcept {
  switch (articleClass) {
    case ArticleClass::HeaderOnlyMatch:
      return "header only match";
    case ArticleClass::Found:
      return "found";
    case ArticleClass::Removed:
      return "removed";
    case ArticleClass::BadlyFormed:
      return "badly formed";
    default:
      return "unknown";
  }
}

ArticleClass ClassifyArticle(std::span<const std::string_view> lines, bool precheck) noexcept {
  if (precheck && !lines.empty() && lines.front().starts_with(kHeaderOnlyStatus)) {
    return ArticleClass::HeaderOnlyMatch;
  }
  bool found = false;
  for (std::string_view line : lines) {
    if (!found && ContainsLowerCase(line, kMessageIdHeader)) {
      found = true;
    }
    if (!line.starts_with(kExtensionHeaderPrefix) && HasRemovalKeyword(line)) {
      return ArticleClass::Removed;
    }
  }
  return found ? ArticleClass::Found : ArticleClass::BadlyFormed;
}

}  // namespace ydecode
