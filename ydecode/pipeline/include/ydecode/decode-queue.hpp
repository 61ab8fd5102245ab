#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

#include "ydecode/decode-job.hpp"

namespace ydecode {

// Bounded blocking FIFO shared by the fetch layer (producer) and the decoder threads (consumers).
class DecodeQueue {
 public:
  explicit DecodeQueue(std::size_t capacity);

  DecodeQueue(const DecodeQueue&) = delete;
  DecodeQueue& operator=(const DecodeQueue&) = delete;

  // Blocks while the queue is full.
  void push(DecodeJob job);

  // Blocks while the queue is empty.
  [[nodiscard]] DecodeJob pop();

  [[nodiscard]] std::size_t size() const;

  [[nodiscard]] std::size_t capacity() const noexcept { return _capacity; }

 private:
  mutable std::mutex _mutex;
  std::condition_variable _notEmpty;
  std::condition_variable _notFull;
  std::deque<DecodeJob> _jobs;
  std::size_t _capacity;
};

}  // namespace ydecode
