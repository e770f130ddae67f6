#pragma once

#include <memory>
#include <mutex>
#include <string>

#include <spdlog/spdlog.h>

namespace dnscache::common {

/// Process-wide spdlog setup for the cache daemon and its tests.
/// The "dnscache" logger is installed as spdlog's default so that any thread
/// (resolver callers, listener workers, the sweep thread) logs through one sink.
/// Class abbreviation: N/A (static interface)
///
/// Usage:
///   Logger::init("debug");
///   Logger::get()->debug("Cache hit for {}/{}", sDomain, uType);
class Logger {
 public:
  /// Create the logger on first call; later calls only change the level.
  /// Valid levels: "trace", "debug", "info", "warn", "error", "critical", "off"
  static void init(const std::string& sLevel);

  /// Returns the default logger, initializing it at "info" if needed.
  static std::shared_ptr<spdlog::logger> get();

  /// Flush and drop all loggers. Safe to call more than once.
  static void shutdown();

 private:
  static std::mutex _mtx;
  static bool _bInitialized;
};

}  // namespace dnscache::common
