#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

// Fixed-size pool of background threads draining a FIFO task queue.
// std::exception escaping a task is logged so one bad task cannot take the
// pool down.
class WorkerService {
public:
  explicit WorkerService(std::size_t numThreads, std::string name = "Worker");

  ~WorkerService();

  // Submit a task to be executed by a worker thread. Returns false if the
  // pool is stopping.
  bool submitTask(std::function<void()> task);

  // Block until the queue is empty and no task is running.
  void waitIdle();

  // Stop all worker threads. Queued tasks still run before the threads exit.
  void stop();

  std::size_t threadCount() const { return workers_.size(); }

private:
  WorkerService(const WorkerService &) = delete;
  WorkerService &operator=(const WorkerService &) = delete;

  void workerLoop();

  std::string name_;
  bool shouldStop_ = false;
  std::size_t active_ = 0;
  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> tasks_;
  std::mutex queueMutex_;
  std::condition_variable condition_;
  std::condition_variable idle_;
};
