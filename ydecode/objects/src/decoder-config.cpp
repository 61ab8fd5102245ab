#include "ydecode/decoder-config.hpp"

#include <stdexcept>
#include <string>
#include <string_view>

#include "ydecode/log.hpp"

namespace ydecode {

std::string_view DecodeBackendName(DecodeBackend backend) noexcept {
  switch (backend) {
    case DecodeBackend::Reference:
      return "reference";
    case DecodeBackend::Streaming:
      return "streaming";
    default:
      return "unknown";
  }
}

void DecoderConfig::validate() const {
  if (backend != DecodeBackend::Reference && backend != DecodeBackend::Streaming) {
    throw std::invalid_argument("Invalid decode backend");
  }
  if (nbWorkers == 0) {
    throw std::invalid_argument("nbWorkers must be > 0");
  }
  if (queueCapacity == 0) {
    throw std::invalid_argument("queueCapacity must be > 0");
  }
  if (hardQueueLimit == 0) {
    throw std::invalid_argument("hardQueueLimit must be > 0");
  }
  if (softQueueLimit > hardQueueLimit) {
    throw std::invalid_argument("softQueueLimit must be <= hardQueueLimit");
  }
  if (yieldInterval.count() < 0) {
    throw std::invalid_argument("yieldInterval must be >= 0");
  }
  if (headerScanLines == 0 || trailerScanLines == 0) {
    throw std::invalid_argument("header and trailer scan line counts must be > 0");
  }
  if (fingerprintBytes == 0) {
    throw std::invalid_argument("fingerprintBytes must be > 0");
  }
  if (!LogLevelFromName(logLevel)) {
    throw std::invalid_argument("Unknown log level '" + logLevel + "'");
  }
}

}  // namespace ydecode
