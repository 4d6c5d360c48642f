#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace trivia::server {

// Fixed set of workers running request handlers. Queued tasks still run on
// shutdown; tasks enqueued after it are refused.
class ThreadPool {
 public:
  explicit ThreadPool(std::size_t workers);
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  bool enqueue(std::function<void()> task);
  void shutdown();

  std::size_t worker_count() const { return threads_.size(); }
  std::size_t queued() const;

 private:
  void worker_loop(std::size_t index);

  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::queue<std::function<void()>> tasks_;
  bool stopping_{false};
  std::vector<std::thread> threads_;
};

}  // namespace trivia::server
