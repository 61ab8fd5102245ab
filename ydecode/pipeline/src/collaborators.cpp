#include "ydecode/collaborators.hpp"

#include <string_view>

namespace ydecode {

std::string_view BadArticleKindName(BadArticleKind kind) noexcept {
  switch (kind) {
    case BadArticleKind::Killed:
      return "killed";
    case BadArticleKind::Bad:
      return "bad";
    case BadArticleKind::Missing:
      return "missing";
    default:
      return "unknown";
  }
}

}  // namespace ydecode
