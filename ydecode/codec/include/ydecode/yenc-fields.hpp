#pragma once

#include <charconv>
#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace ydecode {

// key=value fields of one yEnc control line (=ybegin, =ypart or =yend), in order of appearance.
class YencFields {
 public:
  [[nodiscard]] std::optional<std::string_view> get(std::string_view key) const noexcept;

  [[nodiscard]] bool contains(std::string_view key) const noexcept { return get(key).has_value(); }

  // Returns std::nullopt if the key is absent or its value is not entirely made of decimal digits.
  template <std::unsigned_integral T>
  [[nodiscard]] std::optional<T> getUnsigned(std::string_view key) const noexcept {
    const auto value = get(key);
    if (!value || value->empty()) {
      return std::nullopt;
    }
    T ret;
    const char* end = value->data() + value->size();
    const auto [ptr, errc] = std::from_chars(value->data(), end, ret);
    if (errc != std::errc() || ptr != end) {
      return std::nullopt;
    }
    return ret;
  }

  [[nodiscard]] bool empty() const noexcept { return _fields.empty(); }

  [[nodiscard]] std::size_t size() const noexcept { return _fields.size(); }

  // A key already present keeps its first value.
  void add(std::string_view key, std::string_view value);

 private:
  std::vector<std::pair<std::string, std::string>> _fields;
};

// Parses a yEnc control line. 'line' must start with 'marker' (for instance "=ybegin ").
//
// Fields are space separated key=value tokens. A first token without '=' is the positional line length and is
// stored under "line". The "name" value runs until the end of the line and may contain spaces and '='.
// Example: "=ybegin part=1 line=128 size=123 name=-=DUMMY=- abc.par"
[[nodiscard]] YencFields ParseYencLine(std::string_view line, std::string_view marker);

// Header fields of an encoded block (=ybegin line and optional =ypart line).
struct YencHeader {
  // A block is one part of a multi-part file if =ybegin has a part field (even unparseable) or a =ypart line follows.
  [[nodiscard]] bool isMultiPart() const noexcept { return hasPartField || hasPartLine; }

  std::optional<uint32_t> lineLength;
  std::optional<uint64_t> size;
  std::optional<uint32_t> part;
  std::optional<uint32_t> total;
  std::optional<std::string> name;
  std::optional<uint64_t> partBegin;
  std::optional<uint64_t> partEnd;
  bool hasPartField{false};
  bool hasPartLine{false};
};

// Trailer fields of an encoded block (=yend line).
struct YencTrailer {
  // Checksum string relevant for the block: pcrc32 for a part of a multi-part file, crc32 otherwise.
  [[nodiscard]] const std::optional<std::string>& declaredCrc(bool multiPart) const noexcept {
    return multiPart ? pcrc32 : crc32;
  }

  std::optional<uint64_t> size;
  std::optional<uint32_t> part;
  std::optional<std::string> crc32;
  std::optional<std::string> pcrc32;
};

// 'partLine' may be nullptr when there is no =ypart line.
[[nodiscard]] YencHeader MakeYencHeader(const YencFields& beginLine, const YencFields* partLine);

[[nodiscard]] YencTrailer MakeYencTrailer(const YencFields& endLine);

// Filename announced by the header: kept as is when valid UTF-8, transcoded from Latin-1 otherwise.
[[nodiscard]] std::string FixYencFilename(std::string_view rawName);

}  // namespace ydecode
