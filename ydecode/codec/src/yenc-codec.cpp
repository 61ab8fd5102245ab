#include "ydecode/yenc-codec.hpp"

#include <optional>
#include <string>
#include <utility>

#include "ydecode/article-text.hpp"
#include "ydecode/crc32.hpp"
#include "ydecode/decode-outcome.hpp"
#include "ydecode/encoded-block.hpp"
#include "ydecode/file-fragment-set.hpp"
#include "ydecode/log.hpp"
#include "ydecode/yenc-backend.hpp"
#include "ydecode/yenc-fields.hpp"

namespace ydecode {

DecodeOutcome YencCodec::decode(const ArticleText& text, FileFragmentSet& file) const {
  if (text.empty()) {
    return Malformed{MalformedReason::NoData};
  }

  DecodedBlock block = _backend->decode(text.lines());
  switch (block.status) {
    case BlockStatus::MissingHeader:
      if (HasForeignBeginMarker(text.lines(), _headerScanLines)) {
        file.setEncoding(EncodingType::Unsupported);
        return UnsupportedEncoding{};
      }
      return Malformed{MalformedReason::MissingHeader};
    case BlockStatus::MissingTrailer:
      return Malformed{MalformedReason::MissingTrailer};
    default:
      break;
  }

  file.setEncoding(EncodingType::Yenc);

  std::optional<std::string> filename;
  if (block.header.name) {
    filename = FixYencFilename(*block.header.name);
  } else {
    log::debug("Possible corrupt header detected => no name in =ybegin line of {}", file.filename());
  }

  const bool multiPart = block.header.isMultiPart();
  std::string actual = Crc32ToHex(block.crc);
  const auto& declared = block.trailer.declaredCrc(multiPart);
  std::optional<std::string> expected;
  if (declared) {
    expected = NormalizeCrc32String(*declared);
  }
  if (!expected) {
    log::debug("Corrupt trailer detected => no valid {} in =yend line of {}", multiPart ? "pcrc32" : "crc32",
               file.filename());
    return ChecksumMismatch{std::move(block.data), std::nullopt, std::move(actual)};
  }
  if (*expected != actual) {
    return ChecksumMismatch{std::move(block.data), std::move(expected), std::move(actual)};
  }
  return Accepted{std::move(block.data), std::move(filename)};
}

}  // namespace ydecode
