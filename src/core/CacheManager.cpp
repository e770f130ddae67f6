#include "core/CacheManager.hpp"

#include "common/Logger.hpp"
#include "common/RecordRules.hpp"

#include <algorithm>
#include <mutex>

namespace dnscache::core {

CacheManager::CacheManager(int iShardCount, common::ClockFn fnClock)
    : _fnClock(std::move(fnClock)) {
  const int iShards = std::max(iShardCount, 1);
  _vShards.reserve(static_cast<std::size_t>(iShards));
  for (int i = 0; i < iShards; ++i) {
    _vShards.push_back(std::make_unique<Shard>());
  }
}

CacheManager::~CacheManager() = default;

CacheManager::Shard& CacheManager::shardFor(const common::CacheKey& ck) {
  return *_vShards[_hasher(ck) % _vShards.size()];
}

std::optional<CachedAnswer> CacheManager::get(const std::string& sDomain,
                                              uint16_t uRecordType) {
  const common::CacheKey ck{common::normalizeDomain(sDomain), uRecordType};
  auto& shard = shardFor(ck);
  const auto tpNow = _fnClock();

  bool bStale = false;
  {
    std::shared_lock<std::shared_mutex> lock(shard.mtx);
    auto it = shard.mEntries.find(ck);
    if (it != shard.mEntries.end()) {
      const auto& spEntry = it->second;
      if (spEntry->tpExpiresAt > tpNow) {
        _uHits.fetch_add(1, std::memory_order_relaxed);
        return CachedAnswer{spEntry->vRecords,
                            spEntry->uRotation.fetch_add(1, std::memory_order_relaxed)};
      }
      bStale = true;
    }
  }

  _uMisses.fetch_add(1, std::memory_order_relaxed);
  if (bStale) {
    std::unique_lock<std::shared_mutex> lock(shard.mtx);
    auto it = shard.mEntries.find(ck);
    // A writer may have replaced the entry between the two locks
    if (it != shard.mEntries.end() && it->second->tpExpiresAt <= tpNow) {
      shard.mEntries.erase(it);
    }
  }
  return std::nullopt;
}

void CacheManager::put(const std::string& sDomain, uint16_t uRecordType,
                       std::vector<common::ResourceRecord> vRecords,
                       common::TimePoint tpExpiration, uint64_t uFirstTicket) {
  if (vRecords.empty()) return;

  common::CacheKey ck{common::normalizeDomain(sDomain), uRecordType};

  auto spEntry = std::make_shared<Entry>();
  spEntry->tpExpiresAt = tpExpiration;
  spEntry->uRotation.store(uFirstTicket, std::memory_order_relaxed);
  for (const auto& rr : vRecords) {
    spEntry->tpExpiresAt = std::min(spEntry->tpExpiresAt, rr.tpExpiresAt);
  }
  common::sortByPriority(vRecords);
  spEntry->vRecords = std::move(vRecords);

  auto& shard = shardFor(ck);
  std::unique_lock<std::shared_mutex> lock(shard.mtx);
  shard.mEntries.insert_or_assign(std::move(ck), std::move(spEntry));
}

void CacheManager::invalidate(const std::string& sDomain, uint16_t uRecordType) {
  const common::CacheKey ck{common::normalizeDomain(sDomain), uRecordType};
  auto& shard = shardFor(ck);
  std::unique_lock<std::shared_mutex> lock(shard.mtx);
  shard.mEntries.erase(ck);
}

std::size_t CacheManager::removeExpired(common::TimePoint tpNow) {
  std::size_t uRemoved = 0;
  for (auto& upShard : _vShards) {
    std::unique_lock<std::shared_mutex> lock(upShard->mtx);
    uRemoved += std::erase_if(upShard->mEntries, [tpNow](const auto& kv) {
      return kv.second->tpExpiresAt <= tpNow;
    });
  }
  if (uRemoved > 0) {
    common::Logger::get()->debug("Cache: removed {} expired entries", uRemoved);
  }
  return uRemoved;
}

void CacheManager::clear() {
  for (auto& upShard : _vShards) {
    std::unique_lock<std::shared_mutex> lock(upShard->mtx);
    upShard->mEntries.clear();
  }
}

common::CacheStats CacheManager::stats() const {
  common::CacheStats cs;
  cs.uHits = _uHits.load(std::memory_order_relaxed);
  cs.uMisses = _uMisses.load(std::memory_order_relaxed);
  for (const auto& upShard : _vShards) {
    std::shared_lock<std::shared_mutex> lock(upShard->mtx);
    cs.uEntries += upShard->mEntries.size();
  }
  return cs;
}

}  // namespace dnscache::core
