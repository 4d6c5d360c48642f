#include "server/thread_pool.hpp"

#include <spdlog/spdlog.h>

namespace trivia::server {

ThreadPool::ThreadPool(std::size_t workers) {
  if (workers == 0) workers = 1;
  threads_.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads_.emplace_back(&ThreadPool::worker_loop, this, i);
  }
}

ThreadPool::~ThreadPool() {
  shutdown();
}

bool ThreadPool::enqueue(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (stopping_) return false;
    tasks_.push(std::move(task));
  }
  cv_.notify_one();
  return true;
}

void ThreadPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (stopping_) return;
    stopping_ = true;
  }
  cv_.notify_all();
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
}

std::size_t ThreadPool::queued() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return tasks_.size();
}

void ThreadPool::worker_loop(std::size_t index) {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mtx_);
      cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
      if (stopping_ && tasks_.empty()) return;
      task = std::move(tasks_.front());
      tasks_.pop();
    }
    try {
      task();
    } catch (const std::exception& ex) {
      spdlog::error("worker {} task failed: {}", index, ex.what());
    }
  }
}

}  // namespace trivia::server
