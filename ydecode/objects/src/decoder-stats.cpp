#include "ydecode/decoder-stats.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace ydecode {

std::string DecoderStats::json_str() const {
  std::string out;
  out.reserve(320UL);
  out.push_back('{');
  bool first = true;
  for_each_field([&out, &first](std::string_view name, uint64_t value) {
    if (!first) {
      out.push_back(',');
    } else {
      first = false;
    }
    char buf[20];
    const char *end = std::to_chars(buf, buf + sizeof(buf), value).ptr;
    out.append("\"").append(name).append("\":").append(buf, static_cast<std::size_t>(end - buf));
  });
  out.push_back('}');
  return out;
}

}  // namespace ydecode
