#include "core/ExpirationSweeper.hpp"

#include "common/Logger.hpp"
#include "core/CacheManager.hpp"
#include "dal/IRecordStore.hpp"

namespace dnscache::core {

ExpirationSweeper::ExpirationSweeper(dal::IRecordStore& rsStore, CacheManager& cmCache,
                                     common::ClockFn fnClock)
    : _rsStore(rsStore), _cmCache(cmCache), _fnClock(std::move(fnClock)) {}

ExpirationSweeper::~ExpirationSweeper() = default;

SweepResult ExpirationSweeper::sweep() {
  const auto tpNow = _fnClock();
  SweepResult sr;

  sr.iStoreRowsPruned = _rsStore.pruneExpired(tpNow);
  sr.uCacheEntriesRemoved = _cmCache.removeExpired(tpNow);

  if (sr.iStoreRowsPruned > 0 || sr.uCacheEntriesRemoved > 0) {
    common::Logger::get()->info("Expiration sweep: pruned {} rows, {} cache entries",
                                sr.iStoreRowsPruned, sr.uCacheEntriesRemoved);
  }
  return sr;
}

}  // namespace dnscache::core
