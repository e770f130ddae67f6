#include "dal/MemoryRecordStore.hpp"

#include "common/RecordRules.hpp"

namespace dnscache::dal {

namespace {

/// Same key as the entries_key_idx unique index: address and host compared
/// separately, a missing value counting as ''.
bool samePayload(const common::ResourceRecord& a, const common::ResourceRecord& b) {
  return a.oAddress.value_or("") == b.oAddress.value_or("") &&
         a.oHost.value_or("") == b.oHost.value_or("");
}

}  // namespace

MemoryRecordStore::MemoryRecordStore(common::ClockFn fnClock) : _fnClock(std::move(fnClock)) {}
MemoryRecordStore::~MemoryRecordStore() = default;

int MemoryRecordStore::upsert(const std::vector<common::ResourceRecord>& vRecords) {
  const auto tpNow = _fnClock();
  common::validateRecords(vRecords, tpNow);

  // Normalize before taking the lock; normalizeDomain may throw.
  std::vector<common::ResourceRecord> vNormalized = vRecords;
  for (auto& rr : vNormalized) {
    rr.sDomain = common::normalizeDomain(rr.sDomain);
  }

  std::lock_guard<std::mutex> lock(_mtx);
  for (auto& rr : vNormalized) {
    auto& bucket = _mRows[common::CacheKey{rr.sDomain, rr.uRecordType}];
    for (auto it = bucket.begin(); it != bucket.end(); ++it) {
      if (samePayload(it->second, rr)) {
        bucket.erase(it);
        break;
      }
    }
    rr.iId = _iNextId++;
    bucket.emplace(rr.iId, rr);
  }
  return static_cast<int>(vNormalized.size());
}

std::vector<common::ResourceRecord> MemoryRecordStore::query(const std::string& sDomain,
                                                             uint16_t uRecordType,
                                                             common::TimePoint tpNow) {
  const common::CacheKey ck{common::normalizeDomain(sDomain), uRecordType};

  std::vector<common::ResourceRecord> vOut;
  {
    std::lock_guard<std::mutex> lock(_mtx);
    auto it = _mRows.find(ck);
    if (it == _mRows.end()) return vOut;
    for (const auto& [iId, rr] : it->second) {
      if (rr.tpExpiresAt > tpNow) {
        vOut.push_back(rr);
      }
    }
  }
  common::sortByPriority(vOut);
  return vOut;
}

int MemoryRecordStore::pruneExpired(common::TimePoint tpNow) {
  std::lock_guard<std::mutex> lock(_mtx);
  int iDeleted = 0;
  for (auto itBucket = _mRows.begin(); itBucket != _mRows.end();) {
    auto& bucket = itBucket->second;
    for (auto it = bucket.begin(); it != bucket.end();) {
      if (it->second.tpExpiresAt <= tpNow) {
        it = bucket.erase(it);
        ++iDeleted;
      } else {
        ++it;
      }
    }
    if (bucket.empty()) {
      itBucket = _mRows.erase(itBucket);
    } else {
      ++itBucket;
    }
  }
  return iDeleted;
}

std::size_t MemoryRecordStore::size() const {
  std::lock_guard<std::mutex> lock(_mtx);
  std::size_t uTotal = 0;
  for (const auto& [ck, bucket] : _mRows) {
    uTotal += bucket.size();
  }
  return uTotal;
}

}  // namespace dnscache::dal
