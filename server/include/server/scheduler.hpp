#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace trivia::server {

// Runs one-off tasks after a delay on a single timer thread. Tasks can be
// cancelled until they start; tasks still queued at shutdown are dropped.
class Scheduler {
 public:
  using TaskId = std::uint64_t;
  using Clock = std::chrono::steady_clock;

  Scheduler();
  ~Scheduler();

  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  // Returns 0 when the scheduler is shutting down.
  TaskId schedule_after(std::chrono::milliseconds delay, std::function<void()> task);
  // True if the task was still queued and will not run.
  bool cancel(TaskId id);
  void shutdown();

  std::size_t pending() const;

 private:
  void timer_loop();

  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::multimap<Clock::time_point, TaskId> due_;
  std::unordered_map<TaskId, std::function<void()>> tasks_;
  TaskId next_id_{1};
  bool stopping_{false};
  std::thread thread_;
};

}  // namespace trivia::server
