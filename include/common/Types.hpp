#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace dnscache::common {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/// Source of "now" for expiration decisions. Injected so tests can move time.
using ClockFn = std::function<TimePoint()>;

/// Default clock: std::chrono::system_clock::now().
ClockFn systemClock();

/// Standard DNS numeric type assignments handled by the cache.
enum class RecordType : uint16_t {
  A = 1,
  NS = 2,
  CNAME = 5,
  MX = 15,
  AAAA = 28,
};

constexpr uint16_t toCode(RecordType rt) { return static_cast<uint16_t>(rt); }

/// One cached answer unit; mirrors a row of the entries table.
/// Class abbreviation: rr
struct ResourceRecord {
  int64_t iId = 0;  // assigned by the store
  std::string sDomain;
  uint16_t uRecordType = 0;
  std::optional<std::string> oAddress;  // A / AAAA
  std::optional<std::string> oHost;     // NS / CNAME / MX
  int iPriority = 0;
  std::chrono::seconds durTtl{0};
  TimePoint tpExpiresAt{};
};

/// Lookup key of the cache and the single-flight table.
/// Class abbreviation: ck
struct CacheKey {
  std::string sDomain;
  uint16_t uRecordType = 0;

  bool operator==(const CacheKey&) const = default;
};

struct CacheKeyHash {
  std::size_t operator()(const CacheKey& ck) const noexcept {
    return std::hash<std::string>{}(ck.sDomain) ^
           (static_cast<std::size_t>(ck.uRecordType) * 0x9e3779b97f4a7c15ULL);
  }
};

/// Counters reported by CacheManager::stats().
/// Class abbreviation: cs
struct CacheStats {
  uint64_t uHits = 0;
  uint64_t uMisses = 0;
  std::size_t uEntries = 0;
};

}  // namespace dnscache::common
