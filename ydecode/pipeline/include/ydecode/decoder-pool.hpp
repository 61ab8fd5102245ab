#pragma once

#include <cstddef>
#include <exception>
#include <memory>
#include <span>
#include <thread>
#include <vector>

#include "ydecode/collaborators.hpp"
#include "ydecode/decode-job.hpp"
#include "ydecode/decode-queue.hpp"
#include "ydecode/decode-worker.hpp"
#include "ydecode/decoder-config.hpp"
#include "ydecode/decoder-counters.hpp"
#include "ydecode/decoder-stats.hpp"
#include "ydecode/source.hpp"
#include "ydecode/yenc-backend.hpp"

namespace ydecode {

// Owns the decode queue, the selected decode backend and the decoder threads.
//
// Usage:
//   DecoderPool pool(DecoderConfig{}.withNbWorkers(4), sources, {store, bookkeeper, fetchController});
//   pool.start();
//   pool.enqueue(DecodeJob::FromRawChunks(article, std::move(chunks)));
//   ...
//   pool.stop();
//   pool.rethrowIfError();
class DecoderPool {
 public:
  // Validates 'config' (throws std::invalid_argument). 'sources' and the collaborators must outlive the pool.
  DecoderPool(DecoderConfig config, std::span<const Source> sources, Collaborators collaborators);

  DecoderPool(const DecoderPool&) = delete;
  DecoderPool(DecoderPool&&) = delete;
  DecoderPool& operator=(const DecoderPool&) = delete;
  DecoderPool& operator=(DecoderPool&&) = delete;

  // Stops the workers if still running.
  ~DecoderPool();

  // Applies the configured log level and launches the decoder threads.
  // Throws std::logic_error if the pool is already started.
  void start();

  // Enqueues exactly one stop sentinel per running worker, then joins them.
  // Jobs enqueued before the call are all processed. No-op if the pool is not running.
  void stop() noexcept;

  // Blocks while the decode queue is full.
  void enqueue(DecodeJob job);

  [[nodiscard]] std::size_t queueSize() const { return _queue.size(); }

  [[nodiscard]] bool isRunning() const noexcept { return !_threads.empty(); }

  [[nodiscard]] std::size_t nbWorkers() const noexcept { return _threads.size(); }

  [[nodiscard]] DecoderStats stats() const noexcept { return _counters.snapshot(); }

  [[nodiscard]] const DecoderConfig& config() const noexcept { return _config; }

  [[nodiscard]] const YencBackend& backend() const noexcept { return *_backend; }

  // Rethrows the first exception that escaped a decoder thread, if any. Should be called after stop().
  void rethrowIfError();

 private:
  DecoderConfig _config;
  std::span<const Source> _sources;
  Collaborators _collaborators;
  std::unique_ptr<YencBackend> _backend;
  DecodeQueue _queue;
  DecoderCounters _counters;
  std::vector<std::unique_ptr<DecodeWorker>> _workers;
  std::vector<std::exception_ptr> _errors;
  std::vector<std::jthread> _threads;
};

}  // namespace ydecode
