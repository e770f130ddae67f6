#include "core/MaintenanceScheduler.hpp"

#include "common/Logger.hpp"

#include <algorithm>
#include <stdexcept>

namespace dnscache::core {

MaintenanceScheduler::MaintenanceScheduler() = default;

MaintenanceScheduler::~MaintenanceScheduler() {
  stop();
}

void MaintenanceScheduler::schedule(const std::string& sName,
                                    std::chrono::milliseconds durInterval,
                                    std::function<void()> fnTask) {
  std::lock_guard<std::mutex> lock(_mtx);
  if (_bRunning) {
    throw std::logic_error("MaintenanceScheduler: cannot schedule '" + sName +
                           "' while running");
  }
  _vTasks.push_back(Task{
      sName,
      durInterval,
      std::move(fnTask),
      std::chrono::steady_clock::now(),  // run immediately on first pass
  });
}

void MaintenanceScheduler::start() {
  std::lock_guard<std::mutex> lock(_mtx);
  if (_bRunning) return;
  _bRunning = true;

  _thread = std::jthread([this](std::stop_token stToken) { runLoop(stToken); });
  common::Logger::get()->info("MaintenanceScheduler started with {} task(s)", _vTasks.size());
}

void MaintenanceScheduler::stop() {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (!_bRunning) return;
    _bRunning = false;
  }

  _thread.request_stop();
  _cv.notify_all();

  if (_thread.joinable()) {
    _thread.join();
  }
  common::Logger::get()->info("MaintenanceScheduler stopped");
}

bool MaintenanceScheduler::isRunning() const {
  std::lock_guard<std::mutex> lock(_mtx);
  return _bRunning;
}

void MaintenanceScheduler::runTask(Task& task) {
  auto spLog = common::Logger::get();
  try {
    task.fn();
    if (task.iConsecutiveFailures > 0) {
      spLog->info("MaintenanceScheduler: task '{}' recovered after {} failure(s)", task.sName,
                  task.iConsecutiveFailures);
    }
    task.iConsecutiveFailures = 0;
  } catch (const std::exception& ex) {
    ++task.iConsecutiveFailures;
    spLog->error("MaintenanceScheduler: task '{}' failed ({} in a row), retrying in {}ms: {}",
                 task.sName, task.iConsecutiveFailures, task.durInterval.count(), ex.what());
  }
  task.tpNextRun = std::chrono::steady_clock::now() + task.durInterval;
}

void MaintenanceScheduler::runLoop(std::stop_token stToken) {
  while (!stToken.stop_requested()) {
    const auto tpNow = std::chrono::steady_clock::now();

    for (auto& task : _vTasks) {
      if (stToken.stop_requested()) return;
      if (tpNow >= task.tpNextRun) {
        runTask(task);
      }
    }

    // Sleep until the next task is due, or until stop is requested
    auto tpNextWake = std::chrono::steady_clock::now() + std::chrono::hours(1);
    for (const auto& task : _vTasks) {
      tpNextWake = std::min(tpNextWake, task.tpNextRun);
    }

    std::unique_lock<std::mutex> ulock(_mtx);
    _cv.wait_until(ulock, stToken, tpNextWake, [] { return false; });
  }
}

}  // namespace dnscache::core
