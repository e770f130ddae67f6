#include "common/RecordRules.hpp"

#include "common/Errors.hpp"

#include <arpa/inet.h>

#include <algorithm>
#include <cctype>

namespace dnscache::common {

namespace {

bool parsesAs(int iFamily, const std::string& sAddress) {
  unsigned char buf[sizeof(struct in6_addr)];
  return inet_pton(iFamily, sAddress.c_str(), buf) == 1;
}

}  // namespace

std::string normalizeDomain(const std::string& sDomain) {
  std::string sOut = sDomain;
  std::transform(sOut.begin(), sOut.end(), sOut.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (!sOut.empty() && sOut.back() == '.') {
    sOut.pop_back();
  }
  if (sOut.empty()) {
    throw MalformedRecordError("empty_domain", "Domain name is empty");
  }
  return sOut;
}

bool isAddressType(uint16_t uRecordType) {
  return uRecordType == toCode(RecordType::A) || uRecordType == toCode(RecordType::AAAA);
}

bool isHostType(uint16_t uRecordType) {
  return uRecordType == toCode(RecordType::NS) || uRecordType == toCode(RecordType::CNAME) ||
         uRecordType == toCode(RecordType::MX);
}

std::optional<std::string> findViolation(const ResourceRecord& rr, TimePoint tpNow) {
  if (rr.sDomain.empty()) return "domain is empty";
  if (rr.uRecordType == 0) return "record_type is not set";
  if (rr.durTtl.count() <= 0) return "ttl must be positive";
  if (rr.tpExpiresAt <= tpNow) return "expiration_date must be after the insertion instant";

  const bool bHasAddress = rr.oAddress.has_value() && !rr.oAddress->empty();
  const bool bHasHost = rr.oHost.has_value() && !rr.oHost->empty();

  if (isAddressType(rr.uRecordType)) {
    if (!bHasAddress || bHasHost) return "address record must carry an address and no host";
    const int iFamily = rr.uRecordType == toCode(RecordType::A) ? AF_INET : AF_INET6;
    if (!parsesAs(iFamily, *rr.oAddress)) {
      return "address '" + *rr.oAddress + "' does not match the record type";
    }
    return std::nullopt;
  }

  if (isHostType(rr.uRecordType)) {
    if (!bHasHost || bHasAddress) return "name record must carry a host and no address";
    return std::nullopt;
  }

  if (bHasAddress == bHasHost) return "exactly one of address and host must be set";
  return std::nullopt;
}

void validateRecords(const std::vector<ResourceRecord>& vRecords, TimePoint tpNow) {
  for (const auto& rr : vRecords) {
    auto oViolation = findViolation(rr, tpNow);
    if (oViolation) {
      throw MalformedRecordError("malformed_record",
                                 "Rejected record for '" + rr.sDomain + "' (type " +
                                     std::to_string(rr.uRecordType) + "): " + *oViolation);
    }
  }
}

void sortByPriority(std::vector<ResourceRecord>& vRecords) {
  std::stable_sort(vRecords.begin(), vRecords.end(),
                   [](const ResourceRecord& a, const ResourceRecord& b) {
                     return a.iPriority < b.iPriority;
                   });
}

void rotateEqualPriority(std::vector<ResourceRecord>& vRecords, uint64_t uTicket) {
  auto itBegin = vRecords.begin();
  while (itBegin != vRecords.end()) {
    const int iPriority = itBegin->iPriority;
    auto itEnd = std::find_if(itBegin, vRecords.end(), [iPriority](const ResourceRecord& rr) {
      return rr.iPriority != iPriority;
    });
    const auto uLen = static_cast<uint64_t>(std::distance(itBegin, itEnd));
    if (uLen > 1) {
      std::rotate(itBegin, itBegin + static_cast<std::ptrdiff_t>(uTicket % uLen), itEnd);
    }
    itBegin = itEnd;
  }
}

}  // namespace dnscache::common
