#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ydecode {

// Incremental CRC-32 (standard polynomial, as computed by zlib).
class Crc32 {
 public:
  void update(std::string_view data) noexcept;

  [[nodiscard]] std::uint32_t value() const noexcept { return _crc; }

 private:
  std::uint32_t _crc{0};
};

[[nodiscard]] std::uint32_t ComputeCrc32(std::string_view data) noexcept;

// Renders a CRC-32 value as 8 upper case hexadecimal digits.
[[nodiscard]] std::string Crc32ToHex(std::uint32_t crc);

// Normalizes a checksum string declared in a yEnc trailer: upper cased and left padded with '0' to 8 digits.
// Returns std::nullopt when the value is empty, longer than 8 digits or contains a non hexadecimal character.
[[nodiscard]] std::optional<std::string> NormalizeCrc32String(std::string_view declared);

}  // namespace ydecode
