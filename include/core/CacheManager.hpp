#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/Types.hpp"

namespace dnscache::core {

/// A cache hit: records sorted by priority plus the rotation ticket drawn for this read.
/// Class abbreviation: ca
struct CachedAnswer {
  std::vector<common::ResourceRecord> vRecords;
  uint64_t uTicket = 0;
};

/// Key-sharded in-memory view of live records, indexed by (domain, record type).
/// Reads take a shard's shared lock; writes take that shard's unique lock only.
/// An entry is served only while now < its earliest member expiration.
/// Class abbreviation: cm
class CacheManager {
 public:
  explicit CacheManager(int iShardCount = 16, common::ClockFn fnClock = common::systemClock());
  ~CacheManager();

  CacheManager(const CacheManager&) = delete;
  CacheManager& operator=(const CacheManager&) = delete;

  /// Returns nullopt on a miss or when the entry has expired (lazily erased).
  std::optional<CachedAnswer> get(const std::string& sDomain, uint16_t uRecordType);

  /// Install or replace the entry for the key. Effective expiration is the minimum of
  /// tpExpiration and every record's tpExpiresAt. An empty record list is ignored.
  /// uFirstTicket is the rotation ticket the next get() draws.
  void put(const std::string& sDomain, uint16_t uRecordType,
           std::vector<common::ResourceRecord> vRecords, common::TimePoint tpExpiration,
           uint64_t uFirstTicket = 0);

  /// Remove the entry for the key, if any.
  void invalidate(const std::string& sDomain, uint16_t uRecordType);

  /// Erase every entry whose expiration is <= tpNow. Returns entries removed.
  std::size_t removeExpired(common::TimePoint tpNow);

  void clear();

  common::CacheStats stats() const;

 private:
  struct Entry {
    std::vector<common::ResourceRecord> vRecords;
    common::TimePoint tpExpiresAt;
    std::atomic<uint64_t> uRotation{0};
  };

  struct Shard {
    std::unordered_map<common::CacheKey, std::shared_ptr<Entry>, common::CacheKeyHash> mEntries;
    mutable std::shared_mutex mtx;
  };

  Shard& shardFor(const common::CacheKey& ck);

  std::vector<std::unique_ptr<Shard>> _vShards;
  common::CacheKeyHash _hasher;
  common::ClockFn _fnClock;
  std::atomic<uint64_t> _uHits{0};
  std::atomic<uint64_t> _uMisses{0};
};

}  // namespace dnscache::core
