#include "orex/concurrent/task_loop_thread.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

namespace orex {

namespace {

// Upper bound on how long the worker sleeps in pop_for() before it
// re-checks running_. Keeps stop() responsive without busy-waiting.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

TaskLoopThread::TaskLoopThread(std::string name) : name_(std::move(name)) {}

// -----------------------------------------------------------------------------
// Destructor: join before the queue and sync primitives go away
// -----------------------------------------------------------------------------
TaskLoopThread::~TaskLoopThread() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void TaskLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }

  // running_ must be set before the thread exists so run() sees it on its
  // first check.
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void TaskLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }

  running_.store(false);
  thread_.join();

  // Anyone blocked in waitIdle() must not wait for tasks that will never run.
  idle_cv_.notify_all();
}

// -----------------------------------------------------------------------------
// post()
// -----------------------------------------------------------------------------
void TaskLoopThread::post(Task task) {
  outstanding_.fetch_add(1);
  queue_.push(std::move(task));
}

// -----------------------------------------------------------------------------
// waitIdle()
// -----------------------------------------------------------------------------
bool TaskLoopThread::waitIdle(std::chrono::milliseconds timeout) {
  std::unique_lock lock(idle_mutex_);
  return idle_cv_.wait_for(lock, timeout, [this] {
    return outstanding_.load() == 0 || !running_.load();
  }) && outstanding_.load() == 0;
}

// -----------------------------------------------------------------------------
// finishTask(): decrement and wake idle waiters at zero
// -----------------------------------------------------------------------------
void TaskLoopThread::finishTask() {
  if (outstanding_.fetch_sub(1) == 1) {
    // Take the mutex so a waiter cannot check the predicate, miss this
    // notify, and then sleep for the full timeout.
    std::lock_guard lock(idle_mutex_);
    idle_cv_.notify_all();
  }
}

// -----------------------------------------------------------------------------
// run() — worker loop
// -----------------------------------------------------------------------------
void TaskLoopThread::run() {
  while (running_.load()) {
    std::optional<Task> task = queue_.pop_for(kIdleWaitTimeout);
    if (!task) {
      continue;
    }

    try {
      (*task)();
    } catch (const std::exception& e) {
      std::cerr << "[" << name_ << "] ERROR: task threw: " << e.what()
                << "\n";
    }

    finishTask();
  }
}

}  // namespace orex
