#pragma once

#include <cstddef>

#include "common/Types.hpp"

namespace dnscache::dal {
class IRecordStore;
}

namespace dnscache::core {

class CacheManager;

/// Outcome of one sweep.
/// Class abbreviation: sr
struct SweepResult {
  int iStoreRowsPruned = 0;
  std::size_t uCacheEntriesRemoved = 0;
};

/// One tick of eager expiration: prune the store, then drop expired cache entries.
/// Registered with MaintenanceScheduler as the "expiration-sweep" task and run once
/// synchronously at startup before the first lookup.
/// Class abbreviation: es
class ExpirationSweeper {
 public:
  ExpirationSweeper(dal::IRecordStore& rsStore, CacheManager& cmCache,
                    common::ClockFn fnClock = common::systemClock());
  ~ExpirationSweeper();

  /// Throws StoreIOError if the store prune fails. The cache is then left to lazy
  /// expiration until the next tick.
  SweepResult sweep();

 private:
  dal::IRecordStore& _rsStore;
  CacheManager& _cmCache;
  common::ClockFn _fnClock;
};

}  // namespace dnscache::core
