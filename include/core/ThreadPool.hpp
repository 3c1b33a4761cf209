#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace rwd::core {

/// Fixed-size pool of std::jthread workers.
/// Used to fan out per-service work within one rollback phase.
/// Class abbreviation: tp
class ThreadPool {
 public:
  explicit ThreadPool(int iSize = 0);
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  template <typename F, typename... Args>
  auto submit(F&& fnTask, Args&&... args) -> std::future<decltype(fnTask(args...))>;

  void shutdown();

  int size() const { return static_cast<int>(_vWorkers.size()); }

 private:
  void workerLoop(std::stop_token stToken);

  std::vector<std::jthread> _vWorkers;
  std::queue<std::packaged_task<void()>> _qTasks;
  std::mutex _mtx;
  std::condition_variable _cv;
  bool _bStopping = false;
};

template <typename F, typename... Args>
auto ThreadPool::submit(F&& fnTask, Args&&... args) -> std::future<decltype(fnTask(args...))> {
  using Result = decltype(fnTask(args...));

  auto spTask = std::make_shared<std::packaged_task<Result()>>(
      std::bind(std::forward<F>(fnTask), std::forward<Args>(args)...));
  std::future<Result> fut = spTask->get_future();

  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (_bStopping) {
      throw std::runtime_error("ThreadPool is shutting down");
    }
    _qTasks.emplace([spTask]() { (*spTask)(); });
  }
  _cv.notify_one();
  return fut;
}

}  // namespace rwd::core
