#include "core/Resolver.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "common/RecordRules.hpp"
#include "core/CacheManager.hpp"
#include "dal/IRecordStore.hpp"
#include "upstream/IUpstream.hpp"

#include <algorithm>
#include <exception>

namespace dnscache::core {

Resolver::InflightGuard::~InflightGuard() {
  std::lock_guard<std::mutex> lock(_rs._mtxInflight);
  _rs._mInflight.erase(_ck);
}

Resolver::Resolver(CacheManager& cmCache, dal::IRecordStore& rsStore,
                   upstream::IUpstream& upUpstream,
                   std::chrono::milliseconds durUpstreamTimeout, common::ClockFn fnClock)
    : _cmCache(cmCache),
      _rsStore(rsStore),
      _upUpstream(upUpstream),
      _durUpstreamTimeout(durUpstreamTimeout),
      _fnClock(std::move(fnClock)) {}

Resolver::~Resolver() = default;

std::vector<common::ResourceRecord> Resolver::resolve(const std::string& sDomain,
                                                      uint16_t uRecordType) {
  const common::CacheKey ck{common::normalizeDomain(sDomain), uRecordType};

  if (auto oHit = _cmCache.get(ck.sDomain, ck.uRecordType)) {
    common::Logger::get()->debug("Cache hit for {}/{}", ck.sDomain, ck.uRecordType);
    return rotated(std::move(oHit->vRecords), oHit->uTicket);
  }
  common::Logger::get()->debug("Cache miss for {}/{}", ck.sDomain, ck.uRecordType);
  return coalesce(ck, false);
}

std::optional<std::vector<common::ResourceRecord>> Resolver::lookupCached(
    const std::string& sDomain, uint16_t uRecordType) {
  const common::CacheKey ck{common::normalizeDomain(sDomain), uRecordType};

  if (auto oHit = _cmCache.get(ck.sDomain, ck.uRecordType)) {
    return rotated(std::move(oHit->vRecords), oHit->uTicket);
  }
  return readBack(ck);
}

std::vector<common::ResourceRecord> Resolver::refresh(const std::string& sDomain,
                                                      uint16_t uRecordType) {
  const common::CacheKey ck{common::normalizeDomain(sDomain), uRecordType};
  _cmCache.invalidate(ck.sDomain, ck.uRecordType);
  common::Logger::get()->info("Refreshing {}/{} from upstream", ck.sDomain, ck.uRecordType);
  return coalesce(ck, true);
}

std::size_t Resolver::inflightCount() const {
  std::lock_guard<std::mutex> lock(_mtxInflight);
  return _mInflight.size();
}

Resolver::Records Resolver::coalesce(const common::CacheKey& ck, bool bBypassStore) {
  std::promise<Records> prResult;
  std::shared_future<Records> sfResult;
  bool bLeader = false;
  {
    std::lock_guard<std::mutex> lock(_mtxInflight);
    auto it = _mInflight.find(ck);
    if (it != _mInflight.end()) {
      sfResult = it->second;
    } else {
      sfResult = prResult.get_future().share();
      _mInflight.emplace(ck, sfResult);
      bLeader = true;
    }
  }

  if (!bLeader) {
    common::Logger::get()->debug("Joining in-flight fetch for {}/{}", ck.sDomain,
                                 ck.uRecordType);
    return sfResult.get();
  }

  // Marker must be gone before the outcome is published; a caller woken by a
  // failure then starts a new attempt.
  Records vResult;
  std::exception_ptr epFailure;
  {
    InflightGuard guard(*this, ck);
    try {
      vResult = fetch(ck, bBypassStore);
    } catch (const std::exception&) {
      epFailure = std::current_exception();
    }
  }

  if (epFailure) {
    prResult.set_exception(epFailure);
    std::rethrow_exception(epFailure);
  }
  prResult.set_value(vResult);
  return vResult;
}

Resolver::Records Resolver::fetch(const common::CacheKey& ck, bool bBypassStore) {
  if (!bBypassStore) {
    // Another leader may have completed between our miss and our registration
    if (auto oHit = _cmCache.get(ck.sDomain, ck.uRecordType)) {
      return rotated(std::move(oHit->vRecords), oHit->uTicket);
    }
    if (auto oStored = readBack(ck)) {
      return std::move(*oStored);
    }
  }
  return fetchUpstream(ck);
}

std::optional<Resolver::Records> Resolver::readBack(const common::CacheKey& ck) {
  Records vStored;
  try {
    vStored = _rsStore.query(ck.sDomain, ck.uRecordType, _fnClock());
  } catch (const common::StoreIOError& ex) {
    common::Logger::get()->warn("Store read for {}/{} failed, treating as miss: {}",
                                ck.sDomain, ck.uRecordType, ex.what());
    return std::nullopt;
  }
  if (vStored.empty()) return std::nullopt;

  common::Logger::get()->debug("Restored {} records for {}/{} from the store", vStored.size(),
                               ck.sDomain, ck.uRecordType);
  common::TimePoint tpEarliest = vStored.front().tpExpiresAt;
  for (const auto& rr : vStored) {
    tpEarliest = std::min(tpEarliest, rr.tpExpiresAt);
  }
  // This read is the entry's first turn; the next hit draws ticket 1
  _cmCache.put(ck.sDomain, ck.uRecordType, vStored, tpEarliest, 1);
  return vStored;
}

Resolver::Records Resolver::fetchUpstream(const common::CacheKey& ck) {
  auto spLog = common::Logger::get();
  spLog->info("Querying upstream '{}' for {}/{}", _upUpstream.name(), ck.sDomain,
              ck.uRecordType);

  const auto tpStart = std::chrono::steady_clock::now();
  Records vAnswer;
  try {
    vAnswer = _upUpstream.query(ck.sDomain, ck.uRecordType, _durUpstreamTimeout);
  } catch (const common::NameNotFoundError& ex) {
    spLog->info("Upstream has no such name {}: {}", ck.sDomain, ex.what());
    throw;
  } catch (const common::AppError& ex) {
    spLog->warn("Upstream lookup for {}/{} failed: {}", ck.sDomain, ck.uRecordType,
                ex.what());
    throw;
  } catch (const std::exception& ex) {
    spLog->warn("Upstream lookup for {}/{} failed: {}", ck.sDomain, ck.uRecordType,
                ex.what());
    throw common::UpstreamUnreachableError("upstream_failed", ex.what());
  }

  const auto durElapsed = std::chrono::steady_clock::now() - tpStart;
  if (durElapsed > _durUpstreamTimeout) {
    spLog->warn("Upstream answer for {}/{} arrived after {}ms, discarding", ck.sDomain,
                ck.uRecordType,
                std::chrono::duration_cast<std::chrono::milliseconds>(durElapsed).count());
    throw common::UpstreamTimeoutError(
        "upstream_timeout", "Upstream did not answer " + ck.sDomain + " within " +
                                std::to_string(_durUpstreamTimeout.count()) + "ms");
  }

  const auto tpNow = _fnClock();
  Records vAccepted;
  for (auto& rr : vAnswer) {
    if (rr.uRecordType != ck.uRecordType) continue;
    rr.iId = 0;
    rr.sDomain = ck.sDomain;
    rr.tpExpiresAt = tpNow + rr.durTtl;
    auto oViolation = common::findViolation(rr, tpNow);
    if (oViolation) {
      spLog->warn("Dropping upstream record for {}/{}: {}", ck.sDomain, ck.uRecordType,
                  *oViolation);
      continue;
    }
    vAccepted.push_back(std::move(rr));
  }

  if (vAccepted.empty()) {
    spLog->info("Upstream has no usable records for {}/{}", ck.sDomain, ck.uRecordType);
    return vAccepted;
  }
  return writeThrough(ck, std::move(vAccepted));
}

Resolver::Records Resolver::writeThrough(const common::CacheKey& ck, Records vAccepted) {
  // Store first: a failed write must leave the cache untouched
  _rsStore.upsert(vAccepted);

  common::sortByPriority(vAccepted);
  common::TimePoint tpEarliest = vAccepted.front().tpExpiresAt;
  for (const auto& rr : vAccepted) {
    tpEarliest = std::min(tpEarliest, rr.tpExpiresAt);
  }
  _cmCache.put(ck.sDomain, ck.uRecordType, vAccepted, tpEarliest, 1);

  common::Logger::get()->info("Cached {} records for {}/{}", vAccepted.size(), ck.sDomain,
                              ck.uRecordType);
  return vAccepted;
}

Resolver::Records Resolver::rotated(Records vRecords, uint64_t uTicket) {
  common::rotateEqualPriority(vRecords, uTicket);
  return vRecords;
}

}  // namespace dnscache::core
