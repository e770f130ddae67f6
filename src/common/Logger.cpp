#include "common/Logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace dnscache::common {

std::mutex Logger::_mtx;
bool Logger::_bInitialized = false;

void Logger::init(const std::string& sLevel) {
  std::lock_guard<std::mutex> lock(_mtx);
  const auto level = spdlog::level::from_str(sLevel);

  if (_bInitialized) {
    spdlog::set_level(level);
    return;
  }

  auto spLogger = spdlog::get("dnscache");
  if (!spLogger) {
    spLogger = spdlog::stdout_color_mt("dnscache");
  }
  spLogger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] [tid %t] %v");
  spLogger->set_level(level);
  spLogger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(spLogger);

  _bInitialized = true;
  spLogger->info("Logger initialized at level '{}'", spdlog::level::to_string_view(level));
}

std::shared_ptr<spdlog::logger> Logger::get() {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (_bInitialized) {
      return spdlog::default_logger();
    }
  }
  init("info");
  return spdlog::default_logger();
}

void Logger::shutdown() {
  std::lock_guard<std::mutex> lock(_mtx);
  if (!_bInitialized) return;
  spdlog::default_logger()->flush();
  spdlog::drop_all();
  spdlog::shutdown();
  _bInitialized = false;
}

}  // namespace dnscache::common
