#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "docqa_core/util/bounded_queue.hpp"
#include "docqa_core/util/hashing.hpp"
#include "docqa_core/util/keyed_mutex.hpp"
#include "docqa_core/util/text_utils.hpp"

namespace docqa_core {

TEST(HashingTest, Sha256KnownVectors) {
  EXPECT_EQ(sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(TextUtilsTest, CodePointsNotBytes) {
  const std::string text = "na\xC3\xAFve \xE2\x9C\x93";  // "naïve ✓"
  EXPECT_EQ(text::code_point_length(text), 7u);
  EXPECT_EQ(text::truncate_code_points(text, 3), "na\xC3\xAF");
  EXPECT_EQ(text::truncate_code_points(text, 100), text);
}

TEST(TextUtilsTest, InvalidBytesAreReplaced) {
  const std::string bad = "ok\xFF";
  const std::string clean = text::sanitize_utf8(bad);
  EXPECT_EQ(clean, "ok\xEF\xBF\xBD");
  EXPECT_EQ(text::code_point_length(bad), 3u);
}

TEST(TextUtilsTest, TrimBlankAndWords) {
  EXPECT_EQ(text::trim("  \t hello world \n"), "hello world");
  EXPECT_EQ(text::trim("   "), "");
  EXPECT_TRUE(text::is_blank(" \n\t"));
  EXPECT_TRUE(text::is_blank(""));
  EXPECT_FALSE(text::is_blank(" x "));
  EXPECT_EQ(text::words("What's FAISS? It's fast!"),
            (std::vector<std::string>{"what", "s", "faiss", "it", "s", "fast"}));
}

TEST(KeyedMutexTest, SameKeySerializesDifferentKeysDoNot) {
  KeyedMutex locks;
  std::atomic<int> inside{0};
  std::atomic<int> max_inside{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&] {
      auto guard = locks.acquire("owner:hash");
      const int now = ++inside;
      int seen = max_inside.load();
      while (now > seen && !max_inside.compare_exchange_weak(seen, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      --inside;
    });
  }
  for (auto &t : threads) {
    t.join();
  }
  EXPECT_EQ(max_inside.load(), 1);

  auto a = locks.acquire("a");
  auto b = locks.acquire("b");  // would deadlock if keys shared a mutex
  EXPECT_EQ(locks.active_keys(), 2u);
}

TEST(KeyedMutexTest, EntriesAreDroppedWhenReleased) {
  KeyedMutex locks;
  {
    auto guard = locks.acquire("k");
    EXPECT_EQ(locks.active_keys(), 1u);
  }
  EXPECT_EQ(locks.active_keys(), 0u);
}

TEST(BoundedQueueTest, FifoAndDrainAfterClose) {
  BoundedQueue<int> queue(4);
  EXPECT_TRUE(queue.push(1));
  EXPECT_TRUE(queue.push(2));
  queue.close();

  EXPECT_FALSE(queue.push(3));
  EXPECT_EQ(queue.pop(), 1);
  EXPECT_EQ(queue.pop(), 2);
  EXPECT_FALSE(queue.pop().has_value());
}

TEST(BoundedQueueTest, FullQueueBlocksProducer) {
  BoundedQueue<int> queue(1);
  ASSERT_TRUE(queue.push(1));
  std::atomic<bool> pushed{false};

  std::thread producer([&] {
    queue.push(2);
    pushed = true;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(pushed.load());

  EXPECT_EQ(queue.pop(), 1);
  producer.join();
  EXPECT_TRUE(pushed.load());
  EXPECT_EQ(queue.pop(), 2);
}

TEST(BoundedQueueTest, AbortWakesBothSidesAndDrops) {
  BoundedQueue<int> queue(1);
  queue.push(1);
  std::atomic<bool> push_result{true};
  std::thread producer([&] { push_result = queue.push(2); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  queue.abort();
  producer.join();

  EXPECT_FALSE(push_result.load());
  EXPECT_FALSE(queue.pop().has_value());
  EXPECT_EQ(queue.size(), 0u);
}

TEST(BoundedQueueTest, ZeroCapacityMeansOne) {
  BoundedQueue<int> queue(0);
  EXPECT_EQ(queue.capacity(), 1u);
}

}  // namespace docqa_core
