#include "ydecode/decode-worker.hpp"

#include <exception>
#include <new>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <type_traits>
#include <utility>
#include <variant>

#include "ydecode/article-text.hpp"
#include "ydecode/article.hpp"
#include "ydecode/collaborators.hpp"
#include "ydecode/decode-job.hpp"
#include "ydecode/decode-outcome.hpp"
#include "ydecode/decode-queue.hpp"
#include "ydecode/decoder-config.hpp"
#include "ydecode/decoder-counters.hpp"
#include "ydecode/file-fragment-set.hpp"
#include "ydecode/log.hpp"
#include "ydecode/outcome-classifier.hpp"
#include "ydecode/retry-policy.hpp"
#include "ydecode/source.hpp"

namespace ydecode {

namespace {

std::string_view SourceName(const Article& article) {
  const Source* source = article.fetcher();
  return source == nullptr ? std::string_view("none") : source->name();
}

}  // namespace

DecodeWorker::DecodeWorker(DecodeQueue& queue, const YencBackend& backend, std::span<const Source> sources,
                           Collaborators collaborators, const DecoderConfig& config, DecoderCounters& counters)
    : _queue(&queue),
      _collaborators(collaborators),
      _config(&config),
      _counters(&counters),
      _codec(backend, config.headerScanLines),
      _retryPolicy(sources, collaborators.queue),
      _filenameVerifier(collaborators.queue, config.fingerprintBytes) {}

DecodeWorker::JobKind DecodeWorker::KindOf(const DecodeJob& job) noexcept {
  if (job.isStop()) {
    return JobKind::Stop;
  }
  return job.hasPayload() ? JobKind::Process : JobKind::Starve;
}

void DecodeWorker::run() {
  while (true) {
    if (_config->yieldInterval.count() > 0) {
      std::this_thread::sleep_for(_config->yieldInterval);
    }
    const DecodeJob job = _queue->pop();
    const bool isStop = job.isStop();
    try {
      if (!handle(job)) {
        break;
      }
    } catch (const std::exception& ex) {
      log::error("Unexpected error while handling decode job of {}: {}",
                 isStop ? std::string_view("stop sentinel") : job.article()->messageId(), ex.what());
    }
    if (isStop) {
      break;
    }
  }
}

bool DecodeWorker::handle(const DecodeJob& job) {
  try {
    applyBackpressure(job);
  } catch (const std::exception& ex) {
    log::error("Backpressure check failed: {}", ex.what());
  }
  const JobKind kind = KindOf(job);
  if (kind == JobKind::Stop) {
    return false;
  }
  DecoderCounters::Increment(_counters->jobsProcessed);
  Article& article = *job.article();
  try {
    if (kind == JobKind::Starve) {
      processWithoutData(article);
    } else {
      process(job);
    }
  } catch (const std::exception& ex) {
    // A collaborator failed while the outcome was being reported: the article is neither stored nor registered yet.
    log::error("Error while reporting the outcome of {}: {}", article.messageId(), ex.what());
    DecoderCounters::Increment(_counters->unknownFaults);
    if (!retry(article)) {
      _collaborators.queue.registerArticle(article, false);
    }
  }
  return true;
}

void DecodeWorker::applyBackpressure(const DecodeJob& job) {
  const auto depth = _queue->size();
  const bool roomInStore = _collaborators.store.freeReservedSpace(job);
  if ((roomInStore || depth < _config->softQueueLimit) && depth < _config->hardQueueLimit &&
      _collaborators.fetcher.isDelayed()) {
    _collaborators.fetcher.resume();
    DecoderCounters::Increment(_counters->resumeSignals);
  }
}

void DecodeWorker::processWithoutData(Article& article) {
  if (!retry(article)) {
    _collaborators.queue.registerArticle(article, false);
  }
}

DecodeOutcome DecodeWorker::decode(const DecodeJob& job, std::optional<ArticleText>& text) const {
  Article& article = *job.article();
  try {
    const ArticleText& articleText = text.emplace(job);
    if (article.file().precheck()) {
      return Malformed{MalformedReason::Precheck};
    }
    if (_config->logDecoding) {
      log::debug("Decoding {}", article.messageId());
    }
    return _codec.decode(articleText, article.file());
  } catch (const std::bad_alloc& ex) {
    return SystemFault{SystemFaultKind::OutOfMemory, ex.what()};
  } catch (const std::system_error& ex) {
    // std::ios_base::failure is a std::system_error as well.
    return SystemFault{SystemFaultKind::Io, ex.what()};
  } catch (const std::exception& ex) {
    return UnknownFault{ex.what()};
  }
}

void DecodeWorker::process(const DecodeJob& job) {
  Article& article = *job.article();
  std::optional<ArticleText> text;
  DecodeOutcome outcome = decode(job, text);

  std::visit(
      [this, &article, &text](auto& result) {
        using T = std::decay_t<decltype(result)>;
        if constexpr (std::is_same_v<T, Accepted>) {
          onAccepted(article, result);
        } else if constexpr (std::is_same_v<T, ChecksumMismatch>) {
          onChecksumMismatch(article, result);
        } else if constexpr (std::is_same_v<T, Malformed>) {
          onMalformed(article, result, text ? text->lines() : std::span<const std::string_view>{});
        } else if constexpr (std::is_same_v<T, UnsupportedEncoding>) {
          onUnsupportedEncoding(article);
        } else if constexpr (std::is_same_v<T, SystemFault>) {
          onSystemFault(article, result);
        } else {
          static_assert(std::is_same_v<T, UnknownFault>);
          onUnknownFault(article, result);
        }
      },
      outcome);
}

void DecodeWorker::onAccepted(Article& article, Accepted& accepted) {
  if (!accepted.data.empty()) {
    // The fragment itself is valid whatever happens to its filename proposal.
    try {
      _filenameVerifier.verify(article, accepted.data, accepted.filename);
    } catch (const std::exception& ex) {
      log::warn("Filename verification failed for {}: {}", article.messageId(), ex.what());
    }
  }
  article.file().incrementDecodedFragments();
  DecoderCounters::Increment(_counters->articlesDecoded);
  DecoderCounters::Increment(_counters->bytesDecoded, accepted.data.size());
  if (!accepted.data.empty()) {
    _collaborators.store.save(article, std::move(accepted.data));
  }
  _collaborators.queue.registerArticle(article, true);
}

void DecodeWorker::onChecksumMismatch(Article& article, ChecksumMismatch& mismatch) {
  log::info("CRC Error in {} (expected {}, got {})", article.messageId(), mismatch.expected.value_or("none"),
            mismatch.actual);
  DecoderCounters::Increment(_counters->crcErrors);
  reportBadArticle(article, BadArticleKind::Bad);
  if (!mismatch.data.empty()) {
    _collaborators.store.save(article, std::move(mismatch.data));
  }
  _collaborators.queue.registerArticle(article, true);
}

void DecodeWorker::onMalformed(Article& article, const Malformed& malformed, std::span<const std::string_view> lines) {
  FileFragmentSet& file = article.file();
  const ArticleClass articleClass = ClassifyArticle(lines, file.precheck());
  const bool removed = articleClass == ArticleClass::Removed;
  const bool found = articleClass == ArticleClass::Found || articleClass == ArticleClass::HeaderOnlyMatch;

  // Whether the article counts as a bad one, unless it gets retried.
  bool faulty = false;
  if (removed) {
    log::info("Article removed from server ({})", article.messageId());
    DecoderCounters::Increment(_counters->removedArticles);
    faulty = true;
  }
  if (file.precheck()) {
    if (found) {
      log::debug("Server {} has article {}", SourceName(article), article.messageId());
    }
  } else if (!removed && !found) {
    log::info("Badly formed yEnc article in {} ({})", article.messageId(), MalformedReasonName(malformed.reason));
    DecoderCounters::Increment(_counters->malformedArticles);
    faulty = true;
  }

  if (!found && retry(article)) {
    return;
  }
  if (faulty) {
    reportBadArticle(article, removed ? BadArticleKind::Killed : BadArticleKind::Bad);
  }
  _collaborators.queue.registerArticle(article, found);
}

void DecodeWorker::onUnsupportedEncoding(Article& article) {
  FileFragmentSet& file = article.file();
  DecoderCounters::Increment(_counters->unsupportedArticles);
  if (_collaborators.queue.pauseFile(file)) {
    log::warn("UUencode detected, only yEnc encoding is supported [{}]", file.jobName());
  }
  _collaborators.queue.registerArticle(article, true);
}

void DecodeWorker::onSystemFault(Article& article, const SystemFault& fault) {
  DecoderCounters::Increment(_counters->systemFaults);
  if (fault.kind == SystemFaultKind::OutOfMemory) {
    log::warn("Decoder failure: Out of memory");
    const CacheInfo info = _collaborators.store.cacheInfo();
    log::info("Decoder-Queue: {}, Cache: {}, {}, {}", _queue->size(), info.articleCount, info.cacheSize,
              info.cacheLimit);
  } else {
    log::warn("Decoding {} failed: {}", article.messageId(), fault.what);
  }
  _collaborators.fetcher.pause();
  _collaborators.queue.resetTryLists(article, true);
  reportBadArticle(article, BadArticleKind::Bad);
}

void DecodeWorker::onUnknownFault(Article& article, const UnknownFault& fault) {
  log::info("Unknown Error while decoding {}: {}", article.messageId(), fault.what);
  DecoderCounters::Increment(_counters->unknownFaults);
  if (retry(article)) {
    return;
  }
  reportBadArticle(article, BadArticleKind::Bad);
  _collaborators.queue.registerArticle(article, false);
}

void DecodeWorker::reportBadArticle(Article& article, BadArticleKind kind) {
  log::debug("Reporting {} as a {} article", article.messageId(), BadArticleKindName(kind));
  _collaborators.queue.reportBadArticle(article.file(), kind);
}

bool DecodeWorker::retry(Article& article) {
  if (_retryPolicy.searchNewSource(article) == RetryPolicy::Decision::RetryRequested) {
    DecoderCounters::Increment(_counters->retriesRequested);
    return true;
  }
  DecoderCounters::Increment(_counters->articlesMissing);
  return false;
}

}  // namespace ydecode
