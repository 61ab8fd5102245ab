#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include "ydecode/article-text.hpp"
#include "ydecode/collaborators.hpp"
#include "ydecode/decode-outcome.hpp"
#include "ydecode/decoder-config.hpp"
#include "ydecode/decoder-counters.hpp"
#include "ydecode/filename-verifier.hpp"
#include "ydecode/retry-policy.hpp"
#include "ydecode/source.hpp"
#include "ydecode/yenc-backend.hpp"
#include "ydecode/yenc-codec.hpp"

namespace ydecode {

class Article;
class DecodeJob;
class DecodeQueue;

// Consumer loop of one decoder thread.
//
// Each dequeued job is one of:
//  - Stop:    the stop sentinel, ends the loop.
//  - Process: a job with lines or raw chunks, decoded then stored and registered, or classified and retried.
//  - Starve:  a job without any payload (no data received), sent straight to the retry policy.
// Before any of them, the worker checks whether the fetch layer can be resumed.
class DecodeWorker {
 public:
  enum class JobKind : std::uint8_t { Stop, Process, Starve };

  DecodeWorker(DecodeQueue& queue, const YencBackend& backend, std::span<const Source> sources,
               Collaborators collaborators, const DecoderConfig& config, DecoderCounters& counters);

  DecodeWorker(const DecodeWorker&) = delete;
  DecodeWorker& operator=(const DecodeWorker&) = delete;

  [[nodiscard]] static JobKind KindOf(const DecodeJob& job) noexcept;

  // Runs until a stop sentinel is dequeued. An exception raised while handling a job is logged and the loop
  // goes on with the next job.
  void run();

  // Handles one dequeued job (backpressure check included). Returns false for the stop sentinel.
  // If a collaborator throws while the outcome is reported, the article is retried or registered as not found.
  bool handle(const DecodeJob& job);

  // Resumes the fetch layer if it is delayed and the decode queue is short enough, or the article store has enough
  // room for 'job'. The queue depth must stay below the hard limit in any case.
  void applyBackpressure(const DecodeJob& job);

 private:
  void process(const DecodeJob& job);

  void processWithoutData(Article& article);

  [[nodiscard]] DecodeOutcome decode(const DecodeJob& job, std::optional<ArticleText>& text) const;

  void onAccepted(Article& article, Accepted& accepted);
  void onChecksumMismatch(Article& article, ChecksumMismatch& mismatch);
  void onMalformed(Article& article, const Malformed& malformed, std::span<const std::string_view> lines);
  void onUnsupportedEncoding(Article& article);
  void onSystemFault(Article& article, const SystemFault& fault);
  void onUnknownFault(Article& article, const UnknownFault& fault);

  void reportBadArticle(Article& article, BadArticleKind kind);

  // Returns true if the article will be fetched again from another source.
  bool retry(Article& article);

  DecodeQueue* _queue;
  Collaborators _collaborators;
  const DecoderConfig* _config;
  DecoderCounters* _counters;
  YencCodec _codec;
  RetryPolicy _retryPolicy;
  FilenameVerifier _filenameVerifier;
};

}  // namespace ydecode
