#pragma once

#include <atomic>
#include <cstdint>

#include "ydecode/decoder-stats.hpp"

namespace ydecode {

// Counters shared by all the workers of a pool.
struct DecoderCounters {
  static void Increment(std::atomic<uint64_t>& counter, uint64_t value = 1) noexcept {
    counter.fetch_add(value, std::memory_order_relaxed);
  }

  [[nodiscard]] DecoderStats snapshot() const noexcept;

  std::atomic<uint64_t> jobsProcessed{0};
  std::atomic<uint64_t> articlesDecoded{0};
  std::atomic<uint64_t> bytesDecoded{0};
  std::atomic<uint64_t> crcErrors{0};
  std::atomic<uint64_t> malformedArticles{0};
  std::atomic<uint64_t> removedArticles{0};
  std::atomic<uint64_t> unsupportedArticles{0};
  std::atomic<uint64_t> retriesRequested{0};
  std::atomic<uint64_t> articlesMissing{0};
  std::atomic<uint64_t> systemFaults{0};
  std::atomic<uint64_t> unknownFaults{0};
  std::atomic<uint64_t> resumeSignals{0};
};

}  // namespace ydecode
