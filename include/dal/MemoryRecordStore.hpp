#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/Types.hpp"
#include "dal/IRecordStore.hpp"

namespace dnscache::dal {

/// Process-local record store used when no database is configured.
/// Rows do not survive a restart.
/// Class abbreviation: mrs
class MemoryRecordStore : public IRecordStore {
 public:
  explicit MemoryRecordStore(common::ClockFn fnClock = common::systemClock());
  ~MemoryRecordStore() override;

  int upsert(const std::vector<common::ResourceRecord>& vRecords) override;
  std::vector<common::ResourceRecord> query(const std::string& sDomain, uint16_t uRecordType,
                                            common::TimePoint tpNow) override;
  int pruneExpired(common::TimePoint tpNow) override;

  /// Total rows held, expired or not.
  std::size_t size() const;

 private:
  // Rows of one (domain, type), keyed by id so iteration follows insertion order.
  using Bucket = std::map<int64_t, common::ResourceRecord>;

  common::ClockFn _fnClock;
  std::unordered_map<common::CacheKey, Bucket, common::CacheKeyHash> _mRows;
  int64_t _iNextId = 1;
  mutable std::mutex _mtx;
};

}  // namespace dnscache::dal
