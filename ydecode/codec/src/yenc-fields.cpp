#include "ydecode/yenc-fields.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "ydecode/utf8.hpp"

namespace ydecode {

namespace {

constexpr std::string_view kWhitespace = " \t\r\n";

constexpr bool IsAlnum(char ch) {
  return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

constexpr std::string_view Trim(std::string_view str) {
  const auto first = str.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = str.find_last_not_of(kWhitespace);
  return str.substr(first, last - first + 1);
}

}  // namespace

std::optional<std::string_view> YencFields::get(std::string_view key) const noexcept {
  const auto it = std::ranges::find_if(_fields, [key](const auto& field) { return field.first == key; });
  if (it == _fields.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

void YencFields::add(std::string_view key, std::string_view value) {
  if (!contains(key)) {
    _fields.emplace_back(key, value);
  }
}

YencFields ParseYencLine(std::string_view line, std::string_view marker) {
  YencFields fields;
  if (!line.starts_with(marker)) {
    return fields;
  }
  std::string_view rest = line.substr(marker.size());
  bool firstToken = true;
  while (true) {
    const auto tokenBeg = rest.find_first_not_of(kWhitespace);
    if (tokenBeg == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(tokenBeg);
    const auto tokenEnd = std::min(rest.find_first_of(kWhitespace), rest.size());
    const std::string_view token = rest.substr(0, tokenEnd);
    const auto eqPos = token.find('=');
    const std::string_view key = token.substr(0, std::min(eqPos, token.size()));
    const bool validKey = eqPos != std::string_view::npos && !key.empty() && std::ranges::all_of(key, IsAlnum);

    if (validKey && key == "name") {
      // The filename consumes the remainder of the line verbatim.
      fields.add(key, Trim(rest.substr(eqPos + 1)));
      break;
    }
    if (validKey) {
      fields.add(key, token.substr(eqPos + 1));
    } else if (firstToken) {
      fields.add("line", token);
    }
    firstToken = false;
    rest.remove_prefix(tokenEnd);
  }
  return fields;
}

YencHeader MakeYencHeader(const YencFields& beginLine, const YencFields* partLine) {
  YencHeader header;
  header.lineLength = beginLine.getUnsigned<uint32_t>("line");
  header.size = beginLine.getUnsigned<uint64_t>("size");
  header.part = beginLine.getUnsigned<uint32_t>("part");
  header.hasPartField = beginLine.contains("part");
  header.total = beginLine.getUnsigned<uint32_t>("total");
  if (const auto name = beginLine.get("name"); name && !name->empty()) {
    header.name.emplace(*name);
  }
  if (partLine != nullptr) {
    header.hasPartLine = true;
    header.partBegin = partLine->getUnsigned<uint64_t>("begin");
    header.partEnd = partLine->getUnsigned<uint64_t>("end");
  }
  return header;
}

YencTrailer MakeYencTrailer(const YencFields& endLine) {
  YencTrailer trailer;
  trailer.size = endLine.getUnsigned<uint64_t>("size");
  trailer.part = endLine.getUnsigned<uint32_t>("part");
  if (const auto crc = endLine.get("crc32")) {
    trailer.crc32.emplace(*crc);
  }
  if (const auto pcrc = endLine.get("pcrc32")) {
    trailer.pcrc32.emplace(*pcrc);
  }
  return trailer;
}

std::string FixYencFilename(std::string_view rawName) {
  if (IsValidUtf8(rawName)) {
    return std::string(rawName);
  }
  return Latin1ToUtf8(rawName);
}

}  // namespace ydecode
