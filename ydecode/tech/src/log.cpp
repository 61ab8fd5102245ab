#include "ydecode/log.hpp"

#include <array>
#include <optional>
#include <string_view>
#include <utility>

#include "ydecode/ascii.hpp"

namespace ydecode {

std::optional<log::level::level_enum> LogLevelFromName(std::string_view name) noexcept {
  static constexpr std::array<std::pair<std::string_view, log::level::level_enum>, 9> kLevels{{
      {"trace", log::level::trace},
      {"debug", log::level::debug},
      {"info", log::level::info},
      {"warn", log::level::warn},
      {"warning", log::level::warn},
      {"error", log::level::err},
      {"err", log::level::err},
      {"critical", log::level::critical},
      {"off", log::level::off},
  }};
  for (const auto& [levelName, level] : kLevels) {
    if (CaseInsensitiveEqual(name, levelName)) {
      return level;
    }
  }
  return std::nullopt;
}

}  // namespace ydecode
