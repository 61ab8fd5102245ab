#pragma once

#include <string>
#include <string_view>

namespace ydecode {

// Strict UTF-8 validation (rejects overlong forms, surrogates and code points above U+10FFFF).
[[nodiscard]] bool IsValidUtf8(std::string_view str) noexcept;

// Transcodes a Latin-1 (ISO-8859-1) string to UTF-8.
[[nodiscard]] std::string Latin1ToUtf8(std::string_view str);

}  // namespace ydecode
