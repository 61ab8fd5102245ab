#include "ydecode/decode-outcome.hpp"

#include <string_view>

namespace ydecode {

std::string_view MalformedReasonName(MalformedReason reason) noexcept {
  switch (reason) {
    case MalformedReason::NoData:
      return "no data";
    case MalformedReason::MissingHeader:
      return "missing =ybegin";
    case MalformedReason::MissingTrailer:
      return "missing =yend";
    case MalformedReason::Precheck:
      return "precheck";
    default:
      return "unknown";
  }
}

std::string_view SystemFaultKindName(SystemFaultKind kind) noexcept {
  switch (kind) {
    case SystemFaultKind::OutOfMemory:
      return "out of memory";
    case SystemFaultKind::Io:
      return "I/O error";
    default:
      return "unknown";
  }
}

}  // namespace ydecode
