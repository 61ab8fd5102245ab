#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include <yencode/common.h>
#include <yencode/crc.h>
#include <yencode/decoder.h>
#include <yencode/encoder.h>

namespace ydecode {

// Selects the rapidyenc kernels (SIMD level) for this CPU. Idempotent and thread safe, called by every entry point
// below before the first use of the library.
void InitRapidYenc();

// Decodes escaped yEnc text that carries no line terminators nor dot-stuffing into 'out', which must have room for
// 'encoded.size()' bytes. 'state' is carried over from one call to the next so that an escape character ending a line
// applies to the first character of the next one. Returns the number of bytes written.
inline std::size_t RapidYencDecode(std::string_view encoded, char* out, RapidYenc::YencDecoderState& state) {
  return RapidYenc::decode(0, encoded.data(), out, encoded.size(), &state);
}

inline std::uint32_t RapidYencCrc32(std::string_view data, std::uint32_t crc) {
  return RapidYenc::crc32(data.data(), data.size(), crc);
}

}  // namespace ydecode
