#include "ydecode/streaming-yenc-backend.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <utility>

#include "ydecode/encoded-block.hpp"
#include "ydecode/rapidyenc-gateway.hpp"

namespace ydecode {

StreamingYencBackend::StreamingYencBackend(std::size_t headerScanLines, std::size_t trailerScanLines)
    : _headerScanLines(headerScanLines), _trailerScanLines(trailerScanLines) {
  InitRapidYenc();
}

DecodedBlock StreamingYencBackend::decode(std::span<const std::string_view> lines) const {
  BlockLocation location = LocateYencBlock(lines, _headerScanLines, _trailerScanLines);

  DecodedBlock result;
  result.status = location.status;
  result.header = std::move(location.block.header);
  result.trailer = std::move(location.block.trailer);
  if (result.status != BlockStatus::Located) {
    return result;
  }

  const auto payload = location.block.payload;
  std::size_t encodedSize = 0;
  for (std::string_view line : payload) {
    encodedSize += line.size();
  }

  // Decoded data is never larger than the encoded data.
  std::uint32_t crc = 0;
  result.data.resize_and_overwrite(encodedSize, [payload, &crc](char* out, std::size_t) {
    RapidYenc::YencDecoderState state = RapidYenc::YDEC_STATE_CRLF;
    std::size_t produced = 0;
    for (std::string_view line : payload) {
      const std::size_t lineSize = RapidYencDecode(line, out + produced, state);
      if (lineSize != 0) {
        crc = RapidYencCrc32(std::string_view(out + produced, lineSize), crc);
      }
      produced += lineSize;
    }
    return produced;
  });
  result.crc = crc;
  return result;
}

}  // namespace ydecode
