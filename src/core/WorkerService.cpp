#include "WorkerService.h"
#include "Logger.h"

WorkerService::WorkerService(std::size_t numThreads, std::string name)
    : name_(std::move(name)) {
  if (numThreads == 0)
    numThreads = 1;
  workers_.reserve(numThreads);
  for (std::size_t i = 0; i < numThreads; ++i) {
    workers_.emplace_back([this] { this->workerLoop(); });
  }
  LOG_D(name_, "Started {} worker thread(s)", numThreads);
}

WorkerService::~WorkerService() { stop(); }

void WorkerService::workerLoop() {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(queueMutex_);
      condition_.wait(lock, [this] { return shouldStop_ || !tasks_.empty(); });

      if (shouldStop_ && tasks_.empty()) {
        return;
      }

      task = std::move(tasks_.front());
      tasks_.pop();
      ++active_;
    }
    try {
      task();
    } catch (const std::exception &e) {
      LOG_E(name_, "Exception in background task: {}", e.what());
    } catch (...) {
      LOG_E(name_, "Unknown exception in background task.");
    }
    {
      std::lock_guard<std::mutex> lock(queueMutex_);
      --active_;
      if (active_ == 0 && tasks_.empty())
        idle_.notify_all();
    }
  }
}

bool WorkerService::submitTask(std::function<void()> task) {
  {
    std::unique_lock<std::mutex> lock(queueMutex_);
    if (shouldStop_) {
      LOG_W(name_, "Rejecting task: pool is shutting down");
      return false;
    }
    tasks_.push(std::move(task));
  }
  condition_.notify_one();
  return true;
}

void WorkerService::waitIdle() {
  std::unique_lock<std::mutex> lock(queueMutex_);
  idle_.wait(lock, [this] { return active_ == 0 && tasks_.empty(); });
}

void WorkerService::stop() {
  {
    std::unique_lock<std::mutex> lock(queueMutex_);
    if (shouldStop_) {
      return;
    }
    shouldStop_ = true;
  }
  condition_.notify_all();
  for (std::thread &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}
