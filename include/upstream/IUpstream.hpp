#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace dnscache::upstream {

/// Pure abstract interface for the authority consulted on a cache miss.
/// Implementations must return or throw within durTimeout.
class IUpstream {
 public:
  virtual ~IUpstream() = default;

  virtual std::string name() const = 0;

  /// Records answering (domain, type), each with its source-declared ttl.
  /// tpExpiresAt is left for the caller to compute. An empty result means the
  /// name exists but has no data of this type (NODATA).
  /// Throws NameNotFoundError, UpstreamTimeoutError or UpstreamUnreachableError.
  virtual std::vector<common::ResourceRecord> query(const std::string& sDomain,
                                                    uint16_t uRecordType,
                                                    std::chrono::milliseconds durTimeout) = 0;
};

}  // namespace dnscache::upstream
