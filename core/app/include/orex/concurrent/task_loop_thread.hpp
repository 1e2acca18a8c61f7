#pragma once

#include "orex/concurrent/thread_safe_queue.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace orex {

// -----------------------------------------------------------------------------
// TaskLoopThread
// -----------------------------------------------------------------------------
// Responsibility: Owns one worker thread that drains a ThreadSafeQueue of
// std::function<void()> tasks and runs them in FIFO order.
//
// Why in architecture: Lifecycle callbacks run on whichever thread performed
// the transition. Work that must not run inside that call stack (dependency
// triggering, routing a triggered child order to its venue) is posted here
// instead, so a slow or failing child cannot stall the parent's transition.
//
// Exceptions: a task that throws std::exception is logged to std::cerr
// under the loop's name and the loop continues. Tasks are expected to do
// their own error reporting; this is the last line of defence that keeps
// the worker alive.
//
// Thread model: post() is safe from any thread. start()/stop()/waitIdle()
// may be called from any thread except the worker itself.
// -----------------------------------------------------------------------------
class TaskLoopThread {
 public:
  using Task = std::function<void()>;

  // @param  name  Used as the "[name]" prefix in diagnostics.
  explicit TaskLoopThread(std::string name);

  // Joins the worker. Tasks still queued at destruction are dropped.
  ~TaskLoopThread();

  TaskLoopThread(const TaskLoopThread&) = delete;
  TaskLoopThread& operator=(const TaskLoopThread&) = delete;
  TaskLoopThread(TaskLoopThread&&) = delete;
  TaskLoopThread& operator=(TaskLoopThread&&) = delete;

  // -------------------------------------------------------------------------
  // start() / stop()
  // -------------------------------------------------------------------------
  // Both idempotent. stop() lets the task currently running finish, then
  // joins. Tasks posted after stop() stay queued until the next start().
  // -------------------------------------------------------------------------
  void start();
  void stop();

  bool running() const { return running_.load(); }

  // -------------------------------------------------------------------------
  // post(task)
  // -------------------------------------------------------------------------
  // Enqueues a task for the worker. Never blocks on task execution.
  // -------------------------------------------------------------------------
  void post(Task task);

  // -------------------------------------------------------------------------
  // waitIdle(timeout)
  // -------------------------------------------------------------------------
  // @brief  Blocks until every task posted before the call has finished,
  //         or until the timeout elapses.
  //
  // @return true if the loop drained, false on timeout or if the loop is
  //         not running.
  //
  // @details
  // Counts outstanding tasks rather than posting a barrier, so tasks posted
  // by tasks (a trigger that posts a routing task) are waited for too.
  // -------------------------------------------------------------------------
  bool waitIdle(std::chrono::milliseconds timeout);

  std::size_t pending() const { return outstanding_.load(); }

 private:
  void run();
  void finishTask();

  const std::string name_;
  ThreadSafeQueue<Task> queue_;
  std::atomic<bool> running_{false};
  std::atomic<std::size_t> outstanding_{0};

  // Signalled whenever outstanding_ drops to zero.
  std::mutex idle_mutex_;
  std::condition_variable idle_cv_;

  std::thread thread_;
};

}  // namespace orex
