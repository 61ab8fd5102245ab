#pragma once

#include <cstddef>
#include <span>
#include <string_view>

#include "ydecode/yenc-backend.hpp"

namespace ydecode {

// Decodes line by line with the rapidyenc SIMD kernels straight into a pre-sized output buffer, updating the CRC as
// each line is produced. An escape at the end of a line applies to the first byte of the next.
class StreamingYencBackend final : public YencBackend {
 public:
  StreamingYencBackend(std::size_t headerScanLines, std::size_t trailerScanLines);

  [[nodiscard]] DecodeBackend kind() const noexcept override { return DecodeBackend::Streaming; }

  [[nodiscard]] DecodedBlock decode(std::span<const std::string_view> lines) const override;

 private:
  std::size_t _headerScanLines;
  std::size_t _trailerScanLines;
};

}  // namespace ydecode
