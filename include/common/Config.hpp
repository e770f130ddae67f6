#pragma once

#include <optional>
#include <string>

namespace dnscache::common {

/// Environment variable loader.
/// Loads all DNSCACHE_* env vars into a typed struct with validation.
/// Class abbreviation: cfg
struct Config {
  // ── Database ──────────────────────────────────────────────────────────
  // Unset means records are kept in process memory only.
  std::optional<std::string> oDbUrl;
  int iDbPoolSize = 4;

  // ── Listener ──────────────────────────────────────────────────────────
  std::string sListenAddr = "127.0.0.1";
  int iListenPort = 5353;
  int iWorkerThreads = 0;  // 0 = std::thread::hardware_concurrency()

  // ── Upstream ──────────────────────────────────────────────────────────
  std::string sUpstreamAddr = "1.1.1.1";
  int iUpstreamPort = 53;
  int iUpstreamTimeoutMs = 2000;

  // ── Cache ─────────────────────────────────────────────────────────────
  int iCacheShards = 16;
  int iPruneIntervalSeconds = 60;

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";

  /// Load and validate all config from environment variables.
  /// DNSCACHE_DB_URL falls back to the file named by DNSCACHE_DB_URL_FILE.
  /// Throws on invalid values or constraint violations.
  static Config load();

 private:
  /// Read an env var with optional _FILE fallback for credentials.
  /// Returns nullopt if neither varName nor varName + "_FILE" is set.
  static std::optional<std::string> loadSecret(const char* pVarName);

  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var as int with a default value.
  static int getEnvInt(const char* pVarName, int iDefault);

  /// Read an env var as a string with a default value.
  static std::string getEnvString(const char* pVarName, const std::string& sDefault);
};

}  // namespace dnscache::common
