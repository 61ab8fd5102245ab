#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace ydecode {

using Md5Digest = std::array<unsigned char, 16>;

// Computes the MD5 digest of 'data' with OpenSSL.
// Throws std::runtime_error if the digest cannot be computed.
[[nodiscard]] Md5Digest ComputeMd5(std::string_view data);

// Lower case hexadecimal rendering of a digest (32 chars).
[[nodiscard]] std::string Md5ToHex(const Md5Digest& digest);

}  // namespace ydecode
