#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "common/Types.hpp"
#include "dal/IRecordStore.hpp"

namespace dnscache::dal {

class ConnectionPool;

/// Manages the entries table; upsert, query, pruneExpired.
/// Each call runs in its own transaction on a pooled connection.
/// Class abbreviation: rr
class RecordRepository : public IRecordStore {
 public:
  explicit RecordRepository(ConnectionPool& cpPool,
                            common::ClockFn fnClock = common::systemClock());
  ~RecordRepository() override;

  /// Create the entries table and its uniqueness index if they do not exist.
  void ensureSchema();

  int upsert(const std::vector<common::ResourceRecord>& vRecords) override;
  std::vector<common::ResourceRecord> query(const std::string& sDomain, uint16_t uRecordType,
                                            common::TimePoint tpNow) override;
  int pruneExpired(common::TimePoint tpNow) override;

 private:
  ConnectionPool& _cpPool;
  common::ClockFn _fnClock;
};

}  // namespace dnscache::dal
