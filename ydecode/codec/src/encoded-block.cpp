#include "ydecode/encoded-block.hpp"

#include <algorithm>
#include <cstddef>
#include <span>
#include <string_view>

#include "ydecode/yenc-constants.hpp"
#include "ydecode/yenc-fields.hpp"

namespace ydecode {

BlockLocation LocateYencBlock(std::span<const std::string_view> lines, std::size_t headerScanLines,
                              std::size_t trailerScanLines) {
  BlockLocation location;

  const std::size_t headerEnd = std::min(headerScanLines, lines.size());
  std::size_t payloadStart = lines.size() + 1;
  for (std::size_t pos = 0; pos < headerEnd; ++pos) {
    if (!lines[pos].starts_with(kYencBeginMarker)) {
      continue;
    }
    const YencFields beginFields = ParseYencLine(lines[pos], kYencBeginMarker);
    if (pos + 1 < lines.size() && lines[pos + 1].starts_with(kYencPartMarker)) {
      const YencFields partFields = ParseYencLine(lines[pos + 1], kYencPartMarker);
      location.block.header = MakeYencHeader(beginFields, &partFields);
      payloadStart = pos + 2;
    } else {
      location.block.header = MakeYencHeader(beginFields, nullptr);
      payloadStart = pos + 1;
    }
    break;
  }
  if (payloadStart > lines.size()) {
    return location;
  }

  const auto remaining = lines.subspan(payloadStart);
  const std::size_t trailerCount = std::min(trailerScanLines, remaining.size());
  for (std::size_t back = 1; back <= trailerCount; ++back) {
    const std::size_t pos = remaining.size() - back;
    if (remaining[pos].starts_with(kYencEndMarker)) {
      location.block.trailer = MakeYencTrailer(ParseYencLine(remaining[pos], kYencEndMarker));
      location.block.payload = remaining.first(pos);
      location.status = BlockStatus::Located;
      return location;
    }
  }
  location.status = BlockStatus::MissingTrailer;
  return location;
}

bool HasForeignBeginMarker(std::span<const std::string_view> lines, std::size_t headerScanLines) {
  const auto scanned = lines.first(std::min(headerScanLines, lines.size()));
  return std::ranges::any_of(scanned, [](std::string_view line) { return line.starts_with(kUuBeginMarker); });
}

}  // namespace ydecode
