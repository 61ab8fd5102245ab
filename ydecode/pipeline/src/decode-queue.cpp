#include "ydecode/decode-queue.hpp"

#include <cstddef>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "ydecode/decode-job.hpp"

namespace ydecode {

DecodeQueue::DecodeQueue(std::size_t capacity) : _capacity(capacity) {
  if (capacity == 0) {
    throw std::invalid_argument("DecodeQueue capacity must be > 0");
  }
}

void DecodeQueue::push(DecodeJob job) {
  {
    std::unique_lock lock(_mutex);
    _notFull.wait(lock, [this] { return _jobs.size() < _capacity; });
    _jobs.push_back(std::move(job));
  }
  _notEmpty.notify_one();
}

DecodeJob DecodeQueue::pop() {
  DecodeJob job;
  {
    std::unique_lock lock(_mutex);
    _notEmpty.wait(lock, [this] { return !_jobs.empty(); });
    job = std::move(_jobs.front());
    _jobs.pop_front();
  }
  _notFull.notify_one();
  return job;
}

std::size_t DecodeQueue::size() const {
  std::scoped_lock lock(_mutex);
  return _jobs.size();
}

}  // namespace ydecode
