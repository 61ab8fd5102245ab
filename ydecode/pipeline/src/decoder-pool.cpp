#include "ydecode/decoder-pool.hpp"

#include <cstddef>
#include <exception>
#include <memory>
#include <span>
#include <stdexcept>
#include <thread>
#include <utility>

#include "ydecode/collaborators.hpp"
#include "ydecode/decode-job.hpp"
#include "ydecode/decode-worker.hpp"
#include "ydecode/decoder-config.hpp"
#include "ydecode/log.hpp"
#include "ydecode/source.hpp"
#include "ydecode/yenc-backend.hpp"

namespace ydecode {

namespace {
DecoderConfig ValidatedConfig(DecoderConfig config) {
  config.validate();
  return config;
}
}  // namespace

DecoderPool::DecoderPool(DecoderConfig config, std::span<const Source> sources, Collaborators collaborators)
    : _config(ValidatedConfig(std::move(config))),
      _sources(sources),
      _collaborators(collaborators),
      _backend(MakeYencBackend(_config)),
      _queue(_config.queueCapacity) {}

DecoderPool::~DecoderPool() { stop(); }

void DecoderPool::start() {
  if (isRunning()) {
    throw std::logic_error("DecoderPool already started");
  }
  if (const auto level = LogLevelFromName(_config.logLevel)) {
    log::set_level(*level);
  }

  _workers.clear();
  _errors.assign(_config.nbWorkers, nullptr);
  _workers.reserve(_config.nbWorkers);
  for (std::size_t idx = 0; idx < _config.nbWorkers; ++idx) {
    _workers.push_back(
        std::make_unique<DecodeWorker>(_queue, *_backend, _sources, _collaborators, _config, _counters));
  }

  _threads.reserve(_config.nbWorkers);
  for (std::size_t idx = 0; idx < _config.nbWorkers; ++idx) {
    _threads.emplace_back([this, idx] {
      try {
        _workers[idx]->run();
      } catch (...) {
        _errors[idx] = std::current_exception();
      }
    });
  }
  log::info("Started {} decoder(s) with the {} backend", _config.nbWorkers, DecodeBackendName(_backend->kind()));
}

void DecoderPool::stop() noexcept {
  if (!isRunning()) {
    return;
  }
  // One sentinel per worker: a worker exits as soon as it dequeues one.
  for (std::size_t idx = 0; idx < _threads.size(); ++idx) {
    _queue.push(DecodeJob::Stop());
  }
  for (auto& thread : _threads) {
    thread.join();
  }
  _threads.clear();
  log::debug("Decoders stopped");
}

void DecoderPool::enqueue(DecodeJob job) { _queue.push(std::move(job)); }

void DecoderPool::rethrowIfError() {
  for (const auto& error : _errors) {
    if (error) {
      std::rethrow_exception(error);
    }
  }
}

}  // namespace ydecode
