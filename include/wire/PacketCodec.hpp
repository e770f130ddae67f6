#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace dnscache::wire {

/// Maximum UDP payload accepted or produced without EDNS.
constexpr std::size_t kMaxUdpPayload = 512;

/// DNS message header (RFC 1035 §4.1.1). Section counts are derived from the
/// packet's vectors on encode.
/// Class abbreviation: hdr
struct Header {
  uint16_t uId = 0;
  bool bResponse = false;
  uint8_t uOpcode = 0;
  bool bAuthoritative = false;
  bool bTruncated = false;
  bool bRecursionDesired = false;
  bool bRecursionAvailable = false;
  uint8_t uRcode = 0;
};

/// Class abbreviation: q
struct Question {
  std::string sName;
  uint16_t uType = 0;
  uint16_t uClass = 1;  // IN
};

/// Decoded message. Only the answer section is kept; answers for types the cache
/// does not model are skipped on decode.
/// Class abbreviation: pkt
struct Packet {
  Header hdr;
  std::vector<Question> vQuestions;
  std::vector<common::ResourceRecord> vAnswers;
};

/// Translates between wire-format DNS messages and the typed form used by the core.
/// All failures throw PacketFormatError.
class PacketCodec {
 public:
  static Packet decode(const std::vector<uint8_t>& vBytes);
  static Packet decode(const uint8_t* pData, std::size_t uLen);

  /// Answer TTLs are written as the time left until tpExpiresAt when it is set
  /// (relative to tpNow), otherwise as durTtl.
  static std::vector<uint8_t> encode(const Packet& pkt,
                                     common::TimePoint tpNow = common::Clock::now());

  /// Recursion-desired query with a single question.
  static Packet makeQuery(uint16_t uId, const std::string& sDomain, uint16_t uRecordType);

  /// Response echoing the request's id, flags and question.
  static Packet makeResponse(const Packet& pktRequest,
                             std::vector<common::ResourceRecord> vAnswers, uint8_t uRcode);

  /// Header-only response carrying just an error code.
  static Packet makeErrorResponse(uint16_t uId, uint8_t uRcode);
};

}  // namespace dnscache::wire
