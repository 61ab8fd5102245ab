#include "ydecode/yenc-encoder.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ydecode/hex.hpp"
#include "ydecode/rapidyenc-gateway.hpp"
#include "ydecode/yenc-constants.hpp"

namespace ydecode {

namespace {

std::string LowerHexCrc(std::uint32_t crc) {
  std::string ret(8, '0');
  char* out = ret.data();
  for (int shift = 24; shift >= 0; shift -= 8) {
    out = to_lower_hex(static_cast<unsigned char>(crc >> shift), out);
  }
  return ret;
}

}  // namespace

YencEncoded YencEncode(std::string_view data, std::size_t lineLength) {
  if (lineLength == 0) {
    throw std::invalid_argument("yEnc line length should be strictly positive");
  }
  InitRapidYenc();

  YencEncoded ret;
  ret.crc = RapidYencCrc32(data, 0);
  if (data.empty()) {
    return ret;
  }

  const int lineSize = static_cast<int>(lineLength);
  std::string encoded;
  encoded.resize_and_overwrite(YENC_MAX_SIZE(data.size(), lineLength), [data, lineSize](char* out, std::size_t) {
    int column = 0;
    return RapidYenc::encode(lineSize, &column, data.data(), out, data.size(), 1);
  });

  // rapidyenc separates lines with CRLF.
  std::string_view remaining(encoded);
  while (!remaining.empty()) {
    const auto eol = remaining.find(kCRLF);
    const std::string_view line = remaining.substr(0, eol);
    if (!line.empty()) {
      ret.lines.emplace_back(line);
    }
    if (eol == std::string_view::npos) {
      break;
    }
    remaining.remove_prefix(eol + kCRLF.size());
  }
  return ret;
}

std::vector<std::string> BuildYencArticle(std::string_view name, std::string_view data,
                                          std::optional<YencPartSpec> part, std::size_t lineLength) {
  YencEncoded encoded = YencEncode(data, lineLength);

  std::vector<std::string> lines;
  lines.reserve(encoded.lines.size() + 3U);

  std::string line(kYencBeginMarker);
  if (part) {
    line.append("part=").append(std::to_string(part->part));
    line.append(" total=").append(std::to_string(part->total));
    line.push_back(' ');
  }
  line.append("line=").append(std::to_string(lineLength));
  line.append(" size=").append(std::to_string(part ? part->fileSize : data.size()));
  line.append(" name=").append(name);
  lines.push_back(std::move(line));

  if (part) {
    line.assign(kYencPartMarker);
    line.append("begin=").append(std::to_string(part->begin));
    line.append(" end=").append(std::to_string(part->begin + data.size() - 1U));
    lines.push_back(std::move(line));
  }

  for (std::string& payloadLine : encoded.lines) {
    lines.push_back(std::move(payloadLine));
  }

  line.assign(kYencEndMarker);
  line.append("size=").append(std::to_string(data.size()));
  if (part) {
    line.append(" part=").append(std::to_string(part->part));
    line.append(" pcrc32=");
  } else {
    line.append(" crc32=");
  }
  line.append(LowerHexCrc(encoded.crc));
  lines.push_back(std::move(line));

  return lines;
}

}  // namespace ydecode
