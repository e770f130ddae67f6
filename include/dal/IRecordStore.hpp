#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace dnscache::dal {

/// Durable owner of resource record rows.
/// Every call is atomic: callers never observe a half-applied upsert or prune.
class IRecordStore {
 public:
  virtual ~IRecordStore() = default;

  /// Validate, then insert or replace rows keyed by (domain, record_type, address/host).
  /// A replaced row gets a new id and a new insertion position.
  /// Throws MalformedRecordError (nothing written) or StoreIOError (nothing written).
  /// Returns the number of rows written.
  virtual int upsert(const std::vector<common::ResourceRecord>& vRecords) = 0;

  /// Rows for the key with expiration_date > tpNow, ordered by priority then insertion.
  virtual std::vector<common::ResourceRecord> query(const std::string& sDomain,
                                                    uint16_t uRecordType,
                                                    common::TimePoint tpNow) = 0;

  /// Delete rows with expiration_date <= tpNow. Returns rows deleted.
  virtual int pruneExpired(common::TimePoint tpNow) = 0;
};

}  // namespace dnscache::dal
