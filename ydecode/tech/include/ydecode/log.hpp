#pragma once

#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

#include <optional>
#include <string_view>

namespace ydecode {

namespace log = spdlog;

// Maps a level name ("trace", "debug", "info", "warn", "error", "critical", "off") to its spdlog level.
// "warning" and "err" are accepted as aliases. Returns std::nullopt for unknown names.
[[nodiscard]] std::optional<log::level::level_enum> LogLevelFromName(std::string_view name) noexcept;

}  // namespace ydecode
