#include "ydecode/article.hpp"

#include <cstdint>
#include <string>
#include <utility>

#include "ydecode/file-fragment-set.hpp"

namespace ydecode {

Article::Article(std::string messageId, std::uint64_t bytes, FileFragmentSet& file, bool lowestPartNumber)
    : _messageId(std::move(messageId)), _bytes(bytes), _file(&file), _lowestPartNumber(lowestPartNumber) {
  file.addArticle(*this);
}

}  // namespace ydecode
