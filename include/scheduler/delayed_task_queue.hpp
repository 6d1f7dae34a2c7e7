#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

// Runs closures on one worker thread once their delay has elapsed, earliest first.
class DelayedTaskQueue {
public:
  // max_pending == 0 means unbounded
  explicit DelayedTaskQueue(size_t max_pending = 0);
  ~DelayedTaskQueue();
  DelayedTaskQueue(const DelayedTaskQueue&) = delete;
  DelayedTaskQueue& operator=(const DelayedTaskQueue&) = delete;

  // False when the queue is full or shutting down; the task is not kept.
  bool Schedule(std::chrono::milliseconds delay, std::function<void()> task);
  // Queued plus currently running
  size_t Pending() const;
  // True once nothing is queued or running, false on timeout
  bool WaitIdle(std::chrono::milliseconds timeout);
  // drain=true runs every queued task now; drain=false drops them.
  // Returns the number of dropped tasks. Idempotent.
  size_t Shutdown(bool drain);

private:
  struct Entry {
    std::chrono::steady_clock::time_point due;
    uint64_t seq;
    std::function<void()> task;
  };
  struct Later {
    bool operator()(const Entry& a, const Entry& b) const {
      if (a.due != b.due) return a.due > b.due;
      return a.seq > b.seq;
    }
  };
  void Worker();
  void RunTask(const std::function<void()>& task);

  std::priority_queue<Entry, std::vector<Entry>, Later> tasks_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::thread worker_;
  size_t max_pending_;
  size_t running_ = 0;
  uint64_t next_seq_ = 0;
  bool stopping_ = false;
  bool drain_ = false;
};
