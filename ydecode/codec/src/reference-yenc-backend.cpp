#include "ydecode/reference-yenc-backend.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "ydecode/crc32.hpp"
#include "ydecode/encoded-block.hpp"
#include "ydecode/yenc-constants.hpp"
#include "ydecode/yenc-table.hpp"

namespace ydecode {

std::string ReferenceYencBackend::DecodePayload(std::string_view encoded) {
  std::string out;
  out.reserve(encoded.size());
  for (std::size_t pos = 0; pos < encoded.size(); ++pos) {
    const char ch = encoded[pos];
    if (ch != kYencEscape) {
      out.push_back(YencDecodeByte(ch));
    } else if (++pos < encoded.size()) {
      out.push_back(YencDecodeEscapedByte(encoded[pos]));
    }
  }
  return out;
}

DecodedBlock ReferenceYencBackend::decode(std::span<const std::string_view> lines) const {
  BlockLocation location = LocateYencBlock(lines, _headerScanLines, _trailerScanLines);

  DecodedBlock result;
  result.status = location.status;
  result.header = std::move(location.block.header);
  result.trailer = std::move(location.block.trailer);
  if (result.status != BlockStatus::Located) {
    return result;
  }

  std::size_t encodedSize = 0;
  for (std::string_view line : location.block.payload) {
    encodedSize += line.size();
  }
  std::string joined;
  joined.reserve(encodedSize);
  for (std::string_view line : location.block.payload) {
    joined.append(line);
  }

  result.data = DecodePayload(joined);
  result.crc = ComputeCrc32(result.data);
  return result;
}

}  // namespace ydecode
