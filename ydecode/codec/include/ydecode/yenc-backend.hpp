#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

#include "ydecode/decoder-config.hpp"
#include "ydecode/encoded-block.hpp"
#include "ydecode/yenc-fields.hpp"

namespace ydecode {

// Result of a backend run over the text lines of one article.
// 'data' and 'crc' are only meaningful when status is BlockStatus::Located.
struct DecodedBlock {
  BlockStatus status{BlockStatus::MissingHeader};
  YencHeader header;
  YencTrailer trailer;
  std::string data;
  std::uint32_t crc{0};
};

// Decode backend strategy. All implementations produce byte for byte identical data and CRC.
// Implementations are stateless once constructed: a single instance is shared by all decoder threads.
class YencBackend {
 public:
  virtual ~YencBackend() = default;

  [[nodiscard]] virtual DecodeBackend kind() const noexcept = 0;

  // Locates the yEnc block among 'lines' and decodes its payload.
  // Malformed input is reported through DecodedBlock::status, never by an exception.
  [[nodiscard]] virtual DecodedBlock decode(std::span<const std::string_view> lines) const = 0;
};

[[nodiscard]] std::unique_ptr<YencBackend> MakeYencBackend(const DecoderConfig& config);

}  // namespace ydecode
