#include "ydecode/retry-policy.hpp"

#include "ydecode/article.hpp"
#include "ydecode/collaborators.hpp"
#include "ydecode/file-fragment-set.hpp"
#include "ydecode/log.hpp"
#include "ydecode/source.hpp"

namespace ydecode {

RetryPolicy::Decision RetryPolicy::searchNewSource(Article& article) const {
  const Source* current = article.fetcher();
  if (current != nullptr) {
    article.tryList().add(current);
  }
  for (const Source& source : _sources) {
    if (!source.isActive() || article.tryList().contains(&source)) {
      continue;
    }
    if (current == nullptr || source.priority() >= current->priority()) {
      article.resetTries();
      _queue->resetTryLists(article, false);
      return Decision::RetryRequested;
    }
  }

  log::info("{} => missing from all servers, discarding", article.messageId());
  _queue->reportBadArticle(article.file(), BadArticleKind::Missing);
  return Decision::Exhausted;
}

}  // namespace ydecode
