#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "ydecode/yenc-fields.hpp"

namespace ydecode {

enum class BlockStatus : std::uint8_t { Located, MissingHeader, MissingTrailer };

// Parsed control lines of one yEnc block and the encoded lines between them.
struct EncodedBlock {
  YencHeader header;
  YencTrailer trailer;
  std::span<const std::string_view> payload;
};

struct BlockLocation {
  BlockStatus status{BlockStatus::MissingHeader};
  EncodedBlock block;
};

// Looks for the =ybegin line among the first 'headerScanLines' lines (a =ypart line may immediately follow it),
// then for the =yend line among the last 'trailerScanLines' lines after the header, scanning from the end.
// On MissingTrailer, the header fields are still filled.
[[nodiscard]] BlockLocation LocateYencBlock(std::span<const std::string_view> lines, std::size_t headerScanLines,
                                            std::size_t trailerScanLines);

// Whether a foreign encoding begin line is present among the first 'headerScanLines' lines.
[[nodiscard]] bool HasForeignBeginMarker(std::span<const std::string_view> lines, std::size_t headerScanLines);

}  // namespace ydecode
