#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace ydecode::test {

// Serializes text lines as an NNTP article body (CRLF line endings, dot-stuffing, ".\r\n" terminator),
// split into raw chunks of at most 'chunkSize' bytes as a socket reader would hand them over.
std::vector<std::string> ToNntpChunks(std::span<const std::string> lines, std::size_t chunkSize = 4096);

// Bytes 0, 1, ..., 255, 0, 1, ... of the requested size.
std::string MakePatternedPayload(std::size_t size);

// Deterministic pseudo random bytes.
std::string MakeRandomPayload(std::size_t size, std::uint64_t seed = 123456789ULL);

}  // namespace ydecode::test
