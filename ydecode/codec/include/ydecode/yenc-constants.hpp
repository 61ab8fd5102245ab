#pragma once

#include <cstddef>
#include <string_view>

namespace ydecode {

inline constexpr std::string_view kYencBeginMarker = "=ybegin ";
inline constexpr std::string_view kYencPartMarker = "=ypart ";
inline constexpr std::string_view kYencEndMarker = "=yend ";

// UUencode begin line ("begin 644 name"), the only foreign encoding we recognize.
inline constexpr std::string_view kUuBeginMarker = "begin ";

inline constexpr std::string_view kCRLF = "\r\n";

inline constexpr char kYencEscape = '=';
inline constexpr unsigned char kYencOffset = 42;
inline constexpr unsigned char kYencEscapeOffset = 64;

inline constexpr std::size_t kYencDefaultLineLength = 128;

}  // namespace ydecode
