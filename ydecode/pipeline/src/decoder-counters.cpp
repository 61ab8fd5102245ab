#include "ydecode/decoder-counters.hpp"

#include <atomic>

#include "ydecode/decoder-stats.hpp"

namespace ydecode {

DecoderStats DecoderCounters::snapshot() const noexcept {
  DecoderStats stats;
  stats.jobsProcessed = jobsProcessed.load(std::memory_order_relaxed);
  stats.articlesDecoded = articlesDecoded.load(std::memory_order_relaxed);
  stats.bytesDecoded = bytesDecoded.load(std::memory_order_relaxed);
  stats.crcErrors = crcErrors.load(std::memory_order_relaxed);
  stats.malformedArticles = malformedArticles.load(std::memory_order_relaxed);
  stats.removedArticles = removedArticles.load(std::memory_order_relaxed);
  stats.unsupportedArticles = unsupportedArticles.load(std::memory_order_relaxed);
  stats.retriesRequested = retriesRequested.load(std::memory_order_relaxed);
  stats.articlesMissing = articlesMissing.load(std::memory_order_relaxed);
  stats.systemFaults = systemFaults.load(std::memory_order_relaxed);
  stats.unknownFaults = unknownFaults.load(std::memory_order_relaxed);
  stats.resumeSignals = resumeSignals.load(std::memory_order_relaxed);
  return stats;
}

}  // namespace ydecode
