#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace ydecode {

enum class DecodeBackend : std::uint8_t {
  // Joins the payload then applies the 256 entries lookup table with escape lookahead.
  Reference,
  // Decodes line by line straight into the output buffer, computing the CRC on the fly.
  Streaming
};

[[nodiscard]] std::string_view DecodeBackendName(DecodeBackend backend) noexcept;

struct DecoderConfig {
  void validate() const;

  DecoderConfig& withBackend(DecodeBackend value) {
    backend = value;
    return *this;
  }

  DecoderConfig& withNbWorkers(uint32_t value) {
    nbWorkers = value;
    return *this;
  }

  DecoderConfig& withQueueCapacity(std::size_t value) {
    queueCapacity = value;
    return *this;
  }

  DecoderConfig& withQueueLimits(std::size_t soft, std::size_t hard) {
    softQueueLimit = soft;
    hardQueueLimit = hard;
    return *this;
  }

  DecoderConfig& withYieldInterval(std::chrono::microseconds value) {
    yieldInterval = value;
    return *this;
  }

  DecoderConfig& withLogDecoding(bool value = true) {
    logDecoding = value;
    return *this;
  }

  DecoderConfig& withLogLevel(std::string_view value) {
    logLevel.assign(value);
    return *this;
  }

  // Decode backend strategy, selected once at startup and shared by all workers.
  DecodeBackend backend{DecodeBackend::Streaming};

  // Number of decoder threads started by DecoderPool.
  uint32_t nbWorkers{2};

  // Maximum number of jobs waiting in the decode queue. Producers block when it is reached.
  std::size_t queueCapacity{256};

  // Backpressure: the fetch layer is resumed when the queue depth is below softQueueLimit (or the article store
  // reports enough reserved space) and below hardQueueLimit.
  std::size_t softQueueLimit{10};
  std::size_t hardQueueLimit{20};

  // Short pause before each dequeue, leaving room to the component filling the output buffer.
  std::chrono::microseconds yieldInterval{100};

  // Maximum number of (non empty) lines scanned for the =ybegin header or a foreign encoding marker.
  std::size_t headerScanLines{40};

  // Maximum number of (non empty) lines scanned backwards for the =yend trailer.
  std::size_t trailerScanLines{10};

  // Number of leading bytes of the first fragment hashed into the file fingerprint.
  std::size_t fingerprintBytes{16UL * 1024UL};

  // Emit a debug log line for each decoded article.
  bool logDecoding{false};

  // Level applied to the default logger when the decoder pool starts.
  std::string logLevel{"info"};
};

}  // namespace ydecode
