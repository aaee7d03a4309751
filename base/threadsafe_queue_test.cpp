#include "gtest/gtest.h"
#include "glog/logging.h"

#include "base/threadsafe_queue.hpp"

#include <memory>
#include <thread>
#include <vector>

namespace objcp {
namespace {

class TestThreadsafeQueue : public testing::Test {};

TEST_F(TestThreadsafeQueue, PushPop) {
  ThreadsafeQueue<int> q;
  EXPECT_TRUE(q.Push(1));
  EXPECT_TRUE(q.Push(2));
  EXPECT_EQ(q.Size(), 2);
  int v;
  EXPECT_TRUE(q.WaitAndPop(&v));
  EXPECT_EQ(v, 1);
  EXPECT_TRUE(q.WaitAndPop(&v));
  EXPECT_EQ(v, 2);
}

TEST_F(TestThreadsafeQueue, CloseDrainsRemaining) {
  ThreadsafeQueue<int> q;
  q.Push(1);
  q.Close();
  EXPECT_FALSE(q.Push(2));
  int v;
  EXPECT_TRUE(q.WaitAndPop(&v));
  EXPECT_EQ(v, 1);
  EXPECT_FALSE(q.WaitAndPop(&v));
}

TEST_F(TestThreadsafeQueue, CancelDropsPending) {
  ThreadsafeQueue<std::unique_ptr<int>> q;
  q.Push(std::unique_ptr<int>(new int(1)));
  q.Cancel();
  EXPECT_EQ(q.Size(), 0);
  std::unique_ptr<int> v;
  EXPECT_FALSE(q.WaitAndPop(&v));
  EXPECT_TRUE(q.IsClosed());
}

TEST_F(TestThreadsafeQueue, CloseWakesConsumers) {
  ThreadsafeQueue<int> q;
  std::vector<std::thread> consumers;
  for (int i = 0; i < 4; ++i) {
    consumers.emplace_back([&q] {
      int v;
      while (q.WaitAndPop(&v)) {
      }
    });
  }
  for (int i = 0; i < 100; ++i) {
    q.Push(i);
  }
  q.Close();
  for (auto& t : consumers) {
    t.join();
  }
  EXPECT_EQ(q.Size(), 0);
}

TEST_F(TestThreadsafeQueue, BoundedPushBlocks) {
  ThreadsafeQueue<int> q(1);
  q.Push(1);
  std::thread producer([&q] {
    EXPECT_TRUE(q.Push(2));
  });
  int v;
  EXPECT_TRUE(q.WaitAndPop(&v));
  EXPECT_EQ(v, 1);
  EXPECT_TRUE(q.WaitAndPop(&v));
  EXPECT_EQ(v, 2);
  producer.join();
}

TEST_F(TestThreadsafeQueue, CancelReleasesBlockedProducer) {
  ThreadsafeQueue<int> q(1);
  q.Push(1);
  std::thread producer([&q] {
    EXPECT_FALSE(q.Push(2));
  });
  q.Cancel();
  producer.join();
}

}  // namespace
}  // namespace objcp
