#include "scheduler/delayed_task_queue.hpp"
#include "common/logger.hpp"
#include <exception>

DelayedTaskQueue::DelayedTaskQueue(size_t max_pending) : max_pending_(max_pending) {
  worker_ = std::thread(&DelayedTaskQueue::Worker, this);
}

DelayedTaskQueue::~DelayedTaskQueue() {
  size_t dropped = Shutdown(false);
  if (dropped > 0) Logger::Warning("DelayedTaskQueue destroyed with " + std::to_string(dropped) + " pending task(s)");
}

bool DelayedTaskQueue::Schedule(std::chrono::milliseconds delay, std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) return false;
    if (max_pending_ != 0 && tasks_.size() >= max_pending_) return false;
    tasks_.push(Entry{std::chrono::steady_clock::now() + delay, next_seq_++, std::move(task)});
  }
  cv_.notify_one();
  return true;
}

size_t DelayedTaskQueue::Pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size() + running_;
}

bool DelayedTaskQueue::WaitIdle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return idle_cv_.wait_for(lock, timeout, [this]{ return tasks_.empty() && running_ == 0; });
}

size_t DelayedTaskQueue::Shutdown(bool drain) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!stopping_) {
      stopping_ = true;
      drain_ = drain;
    }
  }
  cv_.notify_all();
  if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) worker_.join();
  size_t dropped = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    dropped = tasks_.size();
    while (!tasks_.empty()) tasks_.pop();
  }
  idle_cv_.notify_all();
  return dropped;
}

void DelayedTaskQueue::Worker() {
  for (;;) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      for (;;) {
        if (stopping_ && (!drain_ || tasks_.empty())) return;
        if (tasks_.empty()) { cv_.wait(lock); continue; }
        if (stopping_) break; // draining: run now
        auto due = tasks_.top().due;
        if (std::chrono::steady_clock::now() >= due) break;
        cv_.wait_until(lock, due);
      }
      task = tasks_.top().task;
      tasks_.pop();
      ++running_;
    }
    RunTask(task);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      --running_;
    }
    idle_cv_.notify_all();
  }
}

void DelayedTaskQueue::RunTask(const std::function<void()>& task) {
  try {
    task();
  } catch (const std::exception& ex) {
    Logger::Error(std::string("Delayed task threw: ") + ex.what());
  }
}
