#pragma once

#include <cstdint>
#include <string>

namespace ydecode {

// Snapshot of the decoder counters, aggregated over all workers of a pool.
struct DecoderStats {
  // Serialize this stats snapshot to JSON (single object).
  [[nodiscard]] std::string json_str() const;

  // Introspection enumeration of the fields (order matches serialization order).
  template <class F>
  void for_each_field(F&& fun) const {
    fun("jobsProcessed", jobsProcessed);
    fun("articlesDecoded", articlesDecoded);
    fun("bytesDecoded", bytesDecoded);
    fun("crcErrors", crcErrors);
    fun("malformedArticles", malformedArticles);
    fun("removedArticles", removedArticles);
    fun("unsupportedArticles", unsupportedArticles);
    fun("retriesRequested", retriesRequested);
    fun("articlesMissing", articlesMissing);
    fun("systemFaults", systemFaults);
    fun("unknownFaults", unknownFaults);
    fun("resumeSignals", resumeSignals);
  }

  uint64_t jobsProcessed{};
  uint64_t articlesDecoded{};
  uint64_t bytesDecoded{};
  uint64_t crcErrors{};
  uint64_t malformedArticles{};
  uint64_t removedArticles{};
  uint64_t unsupportedArticles{};
  uint64_t retriesRequested{};
  uint64_t articlesMissing{};
  uint64_t systemFaults{};
  uint64_t unknownFaults{};
  uint64_t resumeSignals{};
};

}  // namespace ydecode
