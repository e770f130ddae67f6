#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/Types.hpp"

namespace dnscache::dal {
class IRecordStore;
}

namespace dnscache::upstream {
class IUpstream;
}

namespace dnscache::core {

class CacheManager;

/// Public lookup entry point.
///
/// A hit is served from the CacheManager with equal-priority rotation. A miss runs at
/// most one fetch per (domain, type): concurrent callers attach to the in-flight
/// std::shared_future and observe the same records or the same exception. The fetch
/// reads back live rows from the store first, then asks the upstream with a deadline,
/// and writes accepted answers through the store and then the cache.
///
/// No cache or in-flight lock is held during store I/O or while the upstream works.
/// Class abbreviation: rs
class Resolver {
 public:
  Resolver(CacheManager& cmCache, dal::IRecordStore& rsStore, upstream::IUpstream& upUpstream,
           std::chrono::milliseconds durUpstreamTimeout,
           common::ClockFn fnClock = common::systemClock());
  ~Resolver();

  Resolver(const Resolver&) = delete;
  Resolver& operator=(const Resolver&) = delete;

  /// Records for (domain, type) ordered by ascending priority, equal priorities rotated.
  /// An empty vector means the name has no data of this type. Throws NameNotFoundError,
  /// UpstreamTimeoutError, UpstreamUnreachableError, StoreIOError or MalformedRecordError.
  std::vector<common::ResourceRecord> resolve(const std::string& sDomain, uint16_t uRecordType);

  /// Cache and store only; never contacts the upstream. nullopt when nothing live is held.
  std::optional<std::vector<common::ResourceRecord>> lookupCached(const std::string& sDomain,
                                                                  uint16_t uRecordType);

  /// Drop the cached entry and fetch a fresh answer from the upstream.
  std::vector<common::ResourceRecord> refresh(const std::string& sDomain, uint16_t uRecordType);

  /// Number of fetches currently registered in the in-flight table.
  std::size_t inflightCount() const;

 private:
  using Records = std::vector<common::ResourceRecord>;

  /// Removes the in-flight marker for a key on every exit path.
  class InflightGuard {
   public:
    InflightGuard(Resolver& rs, common::CacheKey ck) : _rs(rs), _ck(std::move(ck)) {}
    ~InflightGuard();

    InflightGuard(const InflightGuard&) = delete;
    InflightGuard& operator=(const InflightGuard&) = delete;

   private:
    Resolver& _rs;
    common::CacheKey _ck;
  };

  Records coalesce(const common::CacheKey& ck, bool bBypassStore);
  Records fetch(const common::CacheKey& ck, bool bBypassStore);
  std::optional<Records> readBack(const common::CacheKey& ck);
  Records fetchUpstream(const common::CacheKey& ck);
  Records writeThrough(const common::CacheKey& ck, Records vAccepted);

  static Records rotated(Records vRecords, uint64_t uTicket);

  CacheManager& _cmCache;
  dal::IRecordStore& _rsStore;
  upstream::IUpstream& _upUpstream;
  std::chrono::milliseconds _durUpstreamTimeout;
  common::ClockFn _fnClock;

  mutable std::mutex _mtxInflight;
  std::unordered_map<common::CacheKey, std::shared_future<Records>, common::CacheKeyHash>
      _mInflight;
};

}  // namespace dnscache::core
