#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>
#include "utils/bounded_queue.hpp"

using namespace stash::utils;

class BoundedQueueTest : public ::testing::Test {
protected:
  BoundedQueue<int> queue{4};
};

TEST_F(BoundedQueueTest, InitialState) {
  EXPECT_TRUE(queue.empty());
  EXPECT_EQ(queue.size(), 0u);
  EXPECT_EQ(queue.capacity(), 4u);
  EXPECT_FALSE(queue.closed());
}

TEST_F(BoundedQueueTest, PreservesOrder) {
  for (int i = 0; i < 4; ++i) {
    ASSERT_TRUE(queue.produce(i));
  }
  EXPECT_EQ(queue.size(), 4u);

  int value = -1;
  for (int i = 0; i < 4; ++i) {
    ASSERT_TRUE(queue.consume(value));
    EXPECT_EQ(value, i);
  }
  EXPECT_TRUE(queue.empty());
}

TEST_F(BoundedQueueTest, ZeroCapacityRejected) {
  EXPECT_THROW(BoundedQueue<int>(0), std::invalid_argument);
}

TEST_F(BoundedQueueTest, ProducerBlocksWhileFull) {
  for (int i = 0; i < 4; ++i) {
    ASSERT_TRUE(queue.produce(i));
  }

  std::atomic<bool> produced{false};
  std::thread producer([&] {
    queue.produce(99);
    produced = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(produced);

  int value;
  ASSERT_TRUE(queue.consume(value));
  producer.join();
  EXPECT_TRUE(produced);
  EXPECT_EQ(queue.size(), 4u);
}

TEST_F(BoundedQueueTest, CloseDrainsThenStops) {
  ASSERT_TRUE(queue.produce(1));
  ASSERT_TRUE(queue.produce(2));
  queue.close();

  EXPECT_FALSE(queue.produce(3));

  int value;
  EXPECT_TRUE(queue.consume(value));
  EXPECT_EQ(value, 1);
  EXPECT_TRUE(queue.consume(value));
  EXPECT_EQ(value, 2);
  EXPECT_FALSE(queue.consume(value));
}

TEST_F(BoundedQueueTest, CloseWakesBlockedConsumer) {
  std::atomic<bool> result{true};
  std::thread consumer([&] {
    int value;
    result = queue.consume(value);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  queue.close();
  consumer.join();
  EXPECT_FALSE(result);
}

TEST_F(BoundedQueueTest, AbortDropsQueuedItems) {
  BoundedQueue<std::shared_ptr<int>> owned(2);
  auto item = std::make_shared<int>(7);
  ASSERT_TRUE(owned.produce(item));
  EXPECT_EQ(item.use_count(), 2);

  owned.abort();
  EXPECT_EQ(item.use_count(), 1);
  EXPECT_TRUE(owned.empty());

  std::shared_ptr<int> out;
  EXPECT_FALSE(owned.consume(out));
}

TEST_F(BoundedQueueTest, ConcurrentProducersAndConsumers) {
  const int producers = 4;
  const int per_producer = 1000;
  std::atomic<long> sum{0};
  std::atomic<int> consumed{0};

  std::vector<std::thread> consumers;
  for (int i = 0; i < 3; ++i) {
    consumers.emplace_back([&] {
      int value;
      while (queue.consume(value)) {
        sum += value;
        ++consumed;
      }
    });
  }

  std::vector<std::thread> threads;
  for (int p = 0; p < producers; ++p) {
    threads.emplace_back([&] {
      for (int i = 1; i <= per_producer; ++i) {
        queue.produce(i);
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  queue.close();
  for (auto& t : consumers) {
    t.join();
  }

  EXPECT_EQ(consumed, producers * per_producer);
  EXPECT_EQ(sum, static_cast<long>(producers) * per_producer * (per_producer + 1) / 2);
}
