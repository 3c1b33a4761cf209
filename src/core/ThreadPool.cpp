#include "core/ThreadPool.hpp"

namespace rwd::core {

ThreadPool::ThreadPool(int iSize) {
  if (iSize <= 0) {
    iSize = static_cast<int>(std::thread::hardware_concurrency());
    if (iSize <= 0) iSize = 1;
  }
  _vWorkers.reserve(static_cast<size_t>(iSize));
  for (int i = 0; i < iSize; ++i) {
    _vWorkers.emplace_back([this](std::stop_token stToken) { workerLoop(stToken); });
  }
}

ThreadPool::~ThreadPool() {
  shutdown();
}

void ThreadPool::workerLoop(std::stop_token stToken) {
  while (true) {
    std::packaged_task<void()> task;
    {
      std::unique_lock<std::mutex> lock(_mtx);
      _cv.wait(lock, [this, &stToken]() {
        return _bStopping || stToken.stop_requested() || !_qTasks.empty();
      });
      // Drain queued work before exiting so no submitted future is abandoned
      if (_qTasks.empty()) {
        return;
      }
      task = std::move(_qTasks.front());
      _qTasks.pop();
    }
    task();  // exceptions are captured in the task's future
  }
}

void ThreadPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (_bStopping) return;
    _bStopping = true;
  }
  _cv.notify_all();
  for (auto& thread : _vWorkers) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

}  // namespace rwd::core
