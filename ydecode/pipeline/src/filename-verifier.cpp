#include "ydecode/filename-verifier.hpp"

#include <optional>
#include <string>
#include <string_view>

#include "ydecode/article.hpp"
#include "ydecode/collaborators.hpp"
#include "ydecode/file-fragment-set.hpp"
#include "ydecode/md5.hpp"

namespace ydecode {

void FilenameVerifier::verify(Article& article, std::string_view data, const std::optional<std::string>& filename) const {
  FileFragmentSet& file = article.file();
  if (file.isFilenameLocked() || !filename) {
    return;
  }
  if (article.isLowestPartNumber()) {
    file.setFingerprint(ComputeMd5(data.substr(0, _fingerprintBytes)));
  }
  _queue->verifyFilename(file, *filename);
}

}  // namespace ydecode
