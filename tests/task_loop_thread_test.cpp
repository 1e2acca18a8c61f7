// =============================================================================
// task_loop_thread_test.cpp
// =============================================================================
// Unit tests for orex::TaskLoopThread and orex::SequenceGenerator.
//
// Validates:
//   - Tasks run on the worker in FIFO order
//   - waitIdle() also waits for tasks posted by tasks
//   - A throwing task does not kill the worker
//   - stop() is idempotent and leaves later posts queued until restart
//   - SequenceGenerator IDs are unique under concurrent use
// =============================================================================

#include "orex/concurrent/sequence_generator.hpp"
#include "orex/concurrent/task_loop_thread.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

class TaskLoopThreadTest : public ::testing::Test {
 protected:
  void SetUp() override { loop.start(); }
  void TearDown() override { loop.stop(); }

  orex::TaskLoopThread loop{"test-loop"};
  std::mutex mutex;
  std::vector<int> order;
};

// -----------------------------------------------------------------------------
// 1. FIFO execution off the caller's thread
// -----------------------------------------------------------------------------
TEST_F(TaskLoopThreadTest, RunsTasksInOrderOnWorker) {
  const auto caller = std::this_thread::get_id();
  std::thread::id worker;

  for (int i = 0; i < 50; ++i) {
    loop.post([this, i, &worker] {
      std::lock_guard lock(mutex);
      order.push_back(i);
      worker = std::this_thread::get_id();
    });
  }
  ASSERT_TRUE(loop.waitIdle(2s));

  std::lock_guard lock(mutex);
  ASSERT_EQ(order.size(), 50u);
  for (int i = 0; i < 50; ++i) {
    EXPECT_EQ(order[i], i);
  }
  EXPECT_NE(worker, caller);
  EXPECT_EQ(loop.pending(), 0u);
}

// -----------------------------------------------------------------------------
// 2. Nested posts are part of the idle condition
// -----------------------------------------------------------------------------
TEST_F(TaskLoopThreadTest, WaitIdleCoversTasksPostedByTasks) {
  loop.post([this] {
    loop.post([this] {
      std::this_thread::sleep_for(20ms);
      std::lock_guard lock(mutex);
      order.push_back(2);
    });
    std::lock_guard lock(mutex);
    order.push_back(1);
  });

  ASSERT_TRUE(loop.waitIdle(2s));
  std::lock_guard lock(mutex);
  EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

// -----------------------------------------------------------------------------
// 3. A failing task is contained
// -----------------------------------------------------------------------------
TEST_F(TaskLoopThreadTest, ThrowingTaskDoesNotStopTheLoop) {
  loop.post([] { throw std::runtime_error("child placement failed"); });
  loop.post([this] {
    std::lock_guard lock(mutex);
    order.push_back(7);
  });

  ASSERT_TRUE(loop.waitIdle(2s));
  EXPECT_TRUE(loop.running());
  std::lock_guard lock(mutex);
  EXPECT_EQ(order, (std::vector<int>{7}));
}

// -----------------------------------------------------------------------------
// 4. Stop / restart
// -----------------------------------------------------------------------------
TEST_F(TaskLoopThreadTest, PostsAfterStopWaitForRestart) {
  loop.stop();
  loop.stop();
  EXPECT_FALSE(loop.running());

  loop.post([this] {
    std::lock_guard lock(mutex);
    order.push_back(3);
  });
  EXPECT_FALSE(loop.waitIdle(50ms));
  EXPECT_EQ(loop.pending(), 1u);

  loop.start();
  ASSERT_TRUE(loop.waitIdle(2s));
  std::lock_guard lock(mutex);
  EXPECT_EQ(order, (std::vector<int>{3}));
}

// -----------------------------------------------------------------------------
// 5. SequenceGenerator
// -----------------------------------------------------------------------------
TEST(SequenceGeneratorTest, StartsAtOneWithPrefix) {
  orex::SequenceGenerator ids("evt");
  EXPECT_EQ(ids.next(), "evt-1");
  EXPECT_EQ(ids.next(), "evt-2");
  EXPECT_EQ(ids.next_value(), 3u);
}

TEST(SequenceGeneratorTest, UniqueAcrossThreads) {
  orex::SequenceGenerator ids("dep");
  std::mutex mutex;
  std::set<std::string> seen;

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 500; ++i) {
        auto id = ids.next();
        std::lock_guard lock(mutex);
        seen.insert(id);
      }
    });
  }
  for (auto& t : threads) t.join();

  EXPECT_EQ(seen.size(), 2'000u);
}
