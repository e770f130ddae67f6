#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace dnscache::common {

/// Lower-case the name and strip a single trailing dot ("Example.COM." -> "example.com").
/// Throws MalformedRecordError if the result is empty.
std::string normalizeDomain(const std::string& sDomain);

/// True for types whose payload is an address literal (A, AAAA).
bool isAddressType(uint16_t uRecordType);

/// True for types whose payload is a target name (NS, CNAME, MX).
bool isHostType(uint16_t uRecordType);

/// Returns a description of the first data-model violation, or nullopt if the record
/// is well formed. tpNow is the insertion instant the expiration must exceed.
std::optional<std::string> findViolation(const ResourceRecord& rr, TimePoint tpNow);

/// Throws MalformedRecordError for the first malformed record in the batch.
void validateRecords(const std::vector<ResourceRecord>& vRecords, TimePoint tpNow);

/// Stable sort by ascending priority; equal priorities keep their relative order.
void sortByPriority(std::vector<ResourceRecord>& vRecords);

/// Rotate each run of equal-priority records left by uTicket % runLength.
/// Expects vRecords already sorted by priority.
void rotateEqualPriority(std::vector<ResourceRecord>& vRecords, uint64_t uTicket);

}  // namespace dnscache::common
