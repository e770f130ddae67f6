#include "common/Config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace dnscache::common {

namespace {

void requireRange(const char* pVarName, int iValue, int iMin, int iMax) {
  if (iValue < iMin || iValue > iMax) {
    throw std::runtime_error(std::string(pVarName) + " must be in [" + std::to_string(iMin) +
                             ", " + std::to_string(iMax) + "] (got " +
                             std::to_string(iValue) + ")");
  }
}

}  // namespace

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  try {
    std::size_t uPos = 0;
    const int iValue = std::stoi(sValue, &uPos);
    if (uPos != sValue.size()) {
      throw std::invalid_argument(sValue);
    }
    return iValue;
  } catch (const std::logic_error&) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
}

std::string Config::getEnvString(const char* pVarName, const std::string& sDefault) {
  std::string sValue = getEnv(pVarName);
  return sValue.empty() ? sDefault : sValue;
}

std::optional<std::string> Config::loadSecret(const char* pVarName) {
  // Try the direct env var first
  std::string sValue = getEnv(pVarName);
  if (!sValue.empty()) {
    return sValue;
  }

  // Try _FILE fallback
  const std::string sFileVar = std::string(pVarName) + "_FILE";
  const std::string sFilePath = getEnv(sFileVar.c_str());
  if (sFilePath.empty()) {
    return std::nullopt;
  }

  std::ifstream ifs(sFilePath);
  if (!ifs.is_open()) {
    throw std::runtime_error(
        "Cannot open file specified by " + sFileVar + ": " + sFilePath);
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  sValue = oss.str();

  // Trim trailing whitespace/newlines
  while (!sValue.empty() &&
         (sValue.back() == '\n' || sValue.back() == '\r' || sValue.back() == ' ')) {
    sValue.pop_back();
  }

  if (sValue.empty()) {
    throw std::runtime_error("File is empty: " + sFilePath + " (from " + sFileVar + ")");
  }

  return sValue;
}

Config Config::load() {
  Config cfg;

  // ── Database ───────────────────────────────────────────────────────────
  cfg.oDbUrl = loadSecret("DNSCACHE_DB_URL");
  cfg.iDbPoolSize = getEnvInt("DNSCACHE_DB_POOL_SIZE", 4);

  // ── Listener ───────────────────────────────────────────────────────────
  cfg.sListenAddr = getEnvString("DNSCACHE_LISTEN_ADDR", "127.0.0.1");
  cfg.iListenPort = getEnvInt("DNSCACHE_LISTEN_PORT", 5353);
  cfg.iWorkerThreads = getEnvInt("DNSCACHE_WORKER_THREADS", 0);

  // ── Upstream ───────────────────────────────────────────────────────────
  cfg.sUpstreamAddr = getEnvString("DNSCACHE_UPSTREAM_ADDR", "1.1.1.1");
  cfg.iUpstreamPort = getEnvInt("DNSCACHE_UPSTREAM_PORT", 53);
  cfg.iUpstreamTimeoutMs = getEnvInt("DNSCACHE_UPSTREAM_TIMEOUT_MS", 2000);

  // ── Cache ──────────────────────────────────────────────────────────────
  cfg.iCacheShards = getEnvInt("DNSCACHE_CACHE_SHARDS", 16);
  cfg.iPruneIntervalSeconds = getEnvInt("DNSCACHE_PRUNE_INTERVAL_SECONDS", 60);

  // ── Logging ────────────────────────────────────────────────────────────
  cfg.sLogLevel = getEnvString("DNSCACHE_LOG_LEVEL", "info");

  // ── Validation ─────────────────────────────────────────────────────────
  requireRange("DNSCACHE_DB_POOL_SIZE", cfg.iDbPoolSize, 1, 256);
  requireRange("DNSCACHE_LISTEN_PORT", cfg.iListenPort, 1, 65535);
  requireRange("DNSCACHE_UPSTREAM_PORT", cfg.iUpstreamPort, 1, 65535);
  requireRange("DNSCACHE_UPSTREAM_TIMEOUT_MS", cfg.iUpstreamTimeoutMs, 1, 60000);
  requireRange("DNSCACHE_CACHE_SHARDS", cfg.iCacheShards, 1, 4096);
  requireRange("DNSCACHE_PRUNE_INTERVAL_SECONDS", cfg.iPruneIntervalSeconds, 1, 86400);
  requireRange("DNSCACHE_WORKER_THREADS", cfg.iWorkerThreads, 0, 1024);

  return cfg;
}

}  // namespace dnscache::common
