#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ydecode/yenc-constants.hpp"

namespace ydecode {

struct YencEncoded {
  std::vector<std::string> lines;
  std::uint32_t crc{0};
};

// Encodes 'data' into yEnc payload lines of about 'lineLength' encoded characters with rapidyenc (an escape sequence
// may overflow by one). NUL, LF, CR and '=' are always escaped, TAB and space at line start or line end, '.' at line
// start. 'crc' is the CRC-32 of 'data'.
[[nodiscard]] YencEncoded YencEncode(std::string_view data, std::size_t lineLength = kYencDefaultLineLength);

// Position of an encoded part inside its multi-part file. 'begin' is 1-based.
struct YencPartSpec {
  std::uint32_t part{1};
  std::uint32_t total{1};
  std::uint64_t begin{1};
  std::uint64_t fileSize{0};
};

// Builds the text lines of a complete yEnc article: =ybegin, optional =ypart, payload and =yend.
// The =yend line declares pcrc32 for a part and crc32 otherwise, in lower case hexadecimal.
[[nodiscard]] std::vector<std::string> BuildYencArticle(std::string_view name, std::string_view data,
                                                        std::optional<YencPartSpec> part = std::nullopt,
                                                        std::size_t lineLength = kYencDefaultLineLength);

}  // namespace ydecode
