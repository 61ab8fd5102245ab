#include "ydecode/decode-queue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "ydecode/article.hpp"
#include "ydecode/decode-job.hpp"
#include "ydecode/file-fragment-set.hpp"

namespace ydecode {

TEST(DecodeQueue, ZeroCapacityThrows) { EXPECT_THROW(DecodeQueue(0), std::invalid_argument); }

TEST(DecodeQueue, Fifo) {
  FileFragmentSet file("job", "file.bin");
  Article first("<1@test>", 1, file);
  Article second("<2@test>", 1, file);
  DecodeQueue queue(4);
  queue.push(DecodeJob::FromLines(first, {"a"}));
  queue.push(DecodeJob::Empty(second));
  queue.push(DecodeJob::Stop());
  EXPECT_EQ(queue.size(), 3U);
  EXPECT_EQ(queue.capacity(), 4U);

  EXPECT_EQ(queue.pop().article(), &first);
  EXPECT_EQ(queue.pop().article(), &second);
  EXPECT_TRUE(queue.pop().isStop());
  EXPECT_EQ(queue.size(), 0U);
}

TEST(DecodeQueue, PushBlocksWhileFull) {
  DecodeQueue queue(1);
  queue.push(DecodeJob::Stop());

  std::atomic<bool> pushed{false};
  std::jthread producer([&] {
    queue.push(DecodeJob::Stop());
    pushed = true;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds{20});
  EXPECT_FALSE(pushed.load());

  EXPECT_TRUE(queue.pop().isStop());
  producer.join();
  EXPECT_TRUE(pushed.load());
  EXPECT_EQ(queue.size(), 1U);
}

TEST(DecodeQueue, PopBlocksWhileEmpty) {
  DecodeQueue queue(2);
  std::atomic<bool> popped{false};
  std::jthread consumer([&] {
    EXPECT_TRUE(queue.pop().isStop());
    popped = true;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds{20});
  EXPECT_FALSE(popped.load());

  queue.push(DecodeJob::Stop());
  consumer.join();
  EXPECT_TRUE(popped.load());
}

}  // namespace ydecode
