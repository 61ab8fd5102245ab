#include "ydecode/yenc-backend.hpp"

#include <memory>
#include <stdexcept>

#include "ydecode/decoder-config.hpp"
#include "ydecode/reference-yenc-backend.hpp"
#include "ydecode/streaming-yenc-backend.hpp"

namespace ydecode {

std::unique_ptr<YencBackend> MakeYencBackend(const DecoderConfig& config) {
  switch (config.backend) {
    case DecodeBackend::Reference:
      return std::make_unique<ReferenceYencBackend>(config.headerScanLines, config.trailerScanLines);
    case DecodeBackend::Streaming:
      return std::make_unique<StreamingYencBackend>(config.headerScanLines, config.trailerScanLines);
    default:
      throw std::invalid_argument("Invalid decode backend");
  }
}

}  // namespace ydecode
