#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

#include "ydecode/yenc-backend.hpp"

namespace ydecode {

// Joins the payload lines then maps each byte through kYencDecodeTable, special casing escape bytes by lookahead.
// The CRC is computed once over the complete output.
class ReferenceYencBackend final : public YencBackend {
 public:
  ReferenceYencBackend(std::size_t headerScanLines, std::size_t trailerScanLines)
      : _headerScanLines(headerScanLines), _trailerScanLines(trailerScanLines) {}

  [[nodiscard]] DecodeBackend kind() const noexcept override { return DecodeBackend::Reference; }

  [[nodiscard]] DecodedBlock decode(std::span<const std::string_view> lines) const override;

  // Decodes a joined yEnc payload. A dangling escape at the very end is dropped.
  [[nodiscard]] static std::string DecodePayload(std::string_view encoded);

 private:
  std::size_t _headerScanLines;
  std::size_t _trailerScanLines;
};

}  // namespace ydecode
