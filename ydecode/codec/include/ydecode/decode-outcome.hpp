#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace ydecode {

// Data decoded and checksum verified. 'filename' is the name announced by the header, if any.
struct Accepted {
  std::string data;
  std::optional<std::string> filename;
};

// Data decoded but its CRC does not match the trailer. 'expected' is empty when the trailer declares no
// (or an unreadable) checksum. Both checksums are 8 upper case hexadecimal digits.
struct ChecksumMismatch {
  std::string data;
  std::optional<std::string> expected;
  std::string actual;
};

enum class MalformedReason : std::uint8_t {
  NoData,
  MissingHeader,
  MissingTrailer,
  // Not decoded: the file is in headers-only validation mode.
  Precheck
};

[[nodiscard]] std::string_view MalformedReasonName(MalformedReason reason) noexcept;

struct Malformed {
  MalformedReason reason;
};

// The article is encoded with a format we do not decode.
struct UnsupportedEncoding {};

enum class SystemFaultKind : std::uint8_t { OutOfMemory, Io };

[[nodiscard]] std::string_view SystemFaultKindName(SystemFaultKind kind) noexcept;

struct SystemFault {
  SystemFaultKind kind;
  std::string what;
};

struct UnknownFault {
  std::string what;
};

using DecodeOutcome = std::variant<Accepted, ChecksumMismatch, Malformed, UnsupportedEncoding, SystemFault, UnknownFault>;

}  // namespace ydecode
