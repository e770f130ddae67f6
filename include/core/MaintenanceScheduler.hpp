#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace dnscache::core {

/// Runs periodic background tasks on a single std::jthread.
/// Every task runs once immediately after start(), then on its interval.
/// A task that throws is logged and retried on its next tick.
/// stop() requests the thread's stop token, wakes it, and joins.
/// Class abbreviation: ms
class MaintenanceScheduler {
 public:
  MaintenanceScheduler();
  ~MaintenanceScheduler();

  MaintenanceScheduler(const MaintenanceScheduler&) = delete;
  MaintenanceScheduler& operator=(const MaintenanceScheduler&) = delete;

  /// Register a task. Must be called before start(); throws std::logic_error otherwise.
  void schedule(const std::string& sName, std::chrono::milliseconds durInterval,
                std::function<void()> fnTask);
  void start();
  void stop();
  bool isRunning() const;

 private:
  struct Task {
    std::string sName;
    std::chrono::milliseconds durInterval;
    std::function<void()> fn;
    std::chrono::steady_clock::time_point tpNextRun;
    int iConsecutiveFailures = 0;
  };

  void runLoop(std::stop_token stToken);
  void runTask(Task& task);

  std::vector<Task> _vTasks;
  std::jthread _thread;
  mutable std::mutex _mtx;
  std::condition_variable_any _cv;
  bool _bRunning = false;
};

}  // namespace dnscache::core
