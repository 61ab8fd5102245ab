#include "ydecode/article-builder.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <random>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace ydecode::test {

std::vector<std::string> ToNntpChunks(std::span<const std::string> lines, std::size_t chunkSize) {
  if (chunkSize == 0) {
    throw std::invalid_argument("chunk size should be strictly positive");
  }
  std::string body;
  for (const std::string& line : lines) {
    if (line.starts_with('.')) {
      body.push_back('.');
    }
    body.append(line);
    body.append("\r\n");
  }
  body.append(".\r\n");

  std::vector<std::string> chunks;
  for (std::string_view rest(body); !rest.empty();) {
    const std::size_t len = std::min(chunkSize, rest.size());
    chunks.emplace_back(rest.substr(0, len));
    rest.remove_prefix(len);
  }
  return chunks;
}

std::string MakePatternedPayload(std::size_t size) {
  std::string payload;
  payload.resize_and_overwrite(size, [](char* data, std::size_t size) {
    std::iota(data, data + size, static_cast<unsigned char>(0));
    return size;
  });
  return payload;
}

std::string MakeRandomPayload(std::size_t size, std::uint64_t seed) {
  std::string payload(size, '\0');
  std::mt19937_64 rng{seed};
  std::uniform_int_distribution<int> dist(0, 255);
  for (char& ch : payload) {
    ch = static_cast<char>(dist(rng));
  }
  return payload;
}

}  // namespace ydecode::test
