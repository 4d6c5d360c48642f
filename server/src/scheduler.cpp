#include "server/scheduler.hpp"

#include <spdlog/spdlog.h>

namespace trivia::server {

Scheduler::Scheduler() : thread_(&Scheduler::timer_loop, this) {}

Scheduler::~Scheduler() {
  shutdown();
}

Scheduler::TaskId Scheduler::schedule_after(std::chrono::milliseconds delay,
                                            std::function<void()> task) {
  TaskId id = 0;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (stopping_) return 0;
    id = next_id_++;
    tasks_.emplace(id, std::move(task));
    due_.emplace(Clock::now() + delay, id);
  }
  cv_.notify_one();
  return id;
}

bool Scheduler::cancel(TaskId id) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = tasks_.find(id);
  if (it == tasks_.end()) return false;
  tasks_.erase(it);
  // The matching entry in due_ is skipped when it comes up.
  return true;
}

void Scheduler::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (stopping_) return;
    stopping_ = true;
    tasks_.clear();
    due_.clear();
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

std::size_t Scheduler::pending() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return tasks_.size();
}

void Scheduler::timer_loop() {
  std::unique_lock<std::mutex> lock(mtx_);
  while (!stopping_) {
    if (due_.empty()) {
      cv_.wait(lock, [this] { return stopping_ || !due_.empty(); });
      continue;
    }
    auto next = due_.begin();
    if (Clock::now() < next->first) {
      cv_.wait_until(lock, next->first);
      continue;
    }
    TaskId id = next->second;
    due_.erase(next);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) continue;  // cancelled
    auto task = std::move(it->second);
    tasks_.erase(it);

    lock.unlock();
    try {
      task();
    } catch (const std::exception& ex) {
      spdlog::error("scheduled task {} failed: {}", id, ex.what());
    }
    lock.lock();
  }
}

}  // namespace trivia::server
