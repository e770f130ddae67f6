#include "wire/PacketCodec.hpp"

#include "common/Errors.hpp"
#include "common/RecordRules.hpp"

#include <arpa/inet.h>

#include <algorithm>
#include <limits>

namespace dnscache::wire {

namespace {

constexpr std::size_t kHeaderSize = 12;
constexpr std::size_t kMaxNameLength = 255;
constexpr std::size_t kMaxLabelLength = 63;
constexpr int kMaxPointerJumps = 16;

[[noreturn]] void fail(const std::string& sMsg) {
  throw common::PacketFormatError("malformed_packet", sMsg);
}

/// Bounds-checked cursor over a received message.
class Reader {
 public:
  Reader(const uint8_t* pData, std::size_t uLen) : _pData(pData), _uLen(uLen) {}

  std::size_t pos() const { return _uPos; }

  void skip(std::size_t uCount) {
    need(uCount);
    _uPos += uCount;
  }

  uint8_t readU8() {
    need(1);
    return _pData[_uPos++];
  }

  uint16_t readU16() {
    need(2);
    const uint16_t u = static_cast<uint16_t>((_pData[_uPos] << 8) | _pData[_uPos + 1]);
    _uPos += 2;
    return u;
  }

  uint32_t readU32() {
    const uint32_t uHigh = readU16();
    const uint32_t uLow = readU16();
    return (uHigh << 16) | uLow;
  }

  const uint8_t* bytes(std::size_t uCount) {
    need(uCount);
    const uint8_t* p = _pData + _uPos;
    _uPos += uCount;
    return p;
  }

  /// Reads a possibly compressed name; the cursor ends after the name's
  /// in-place bytes (the first pointer, or the terminating zero).
  std::string readName() {
    std::string sName;
    std::size_t uCursor = _uPos;
    std::size_t uResume = 0;
    bool bJumped = false;
    int iJumps = 0;

    for (;;) {
      if (uCursor >= _uLen) fail("name runs past end of packet");
      const uint8_t uLen = _pData[uCursor];

      if ((uLen & 0xC0) == 0xC0) {
        if (uCursor + 1 >= _uLen) fail("truncated compression pointer");
        if (++iJumps > kMaxPointerJumps) fail("too many compression pointers");
        if (!bJumped) {
          uResume = uCursor + 2;
          bJumped = true;
        }
        uCursor = static_cast<std::size_t>(((uLen & 0x3F) << 8) | _pData[uCursor + 1]);
        continue;
      }
      if ((uLen & 0xC0) != 0) fail("unsupported label type");

      ++uCursor;
      if (uLen == 0) break;
      if (uCursor + uLen > _uLen) fail("label runs past end of packet");
      if (!sName.empty()) sName.push_back('.');
      sName.append(reinterpret_cast<const char*>(_pData + uCursor), uLen);
      if (sName.size() > kMaxNameLength) fail("name longer than 255 octets");
      uCursor += uLen;
    }

    _uPos = bJumped ? uResume : uCursor;
    return sName;
  }

 private:
  void need(std::size_t uCount) const {
    if (_uPos + uCount > _uLen) fail("packet truncated");
  }

  const uint8_t* _pData;
  std::size_t _uLen;
  std::size_t _uPos = 0;
};

class Writer {
 public:
  void writeU8(uint8_t u) { _vBuf.push_back(u); }

  void writeU16(uint16_t u) {
    _vBuf.push_back(static_cast<uint8_t>(u >> 8));
    _vBuf.push_back(static_cast<uint8_t>(u & 0xFF));
  }

  void writeU32(uint32_t u) {
    writeU16(static_cast<uint16_t>(u >> 16));
    writeU16(static_cast<uint16_t>(u & 0xFFFF));
  }

  void writeBytes(const uint8_t* p, std::size_t uLen) { _vBuf.insert(_vBuf.end(), p, p + uLen); }

  void writeName(const std::string& sName) {
    std::string sPlain = sName;
    if (!sPlain.empty() && sPlain.back() == '.') sPlain.pop_back();
    if (sPlain.size() > kMaxNameLength - 2) fail("name too long: " + sName);

    std::size_t uStart = 0;
    while (!sPlain.empty() && uStart <= sPlain.size()) {
      std::size_t uDot = sPlain.find('.', uStart);
      if (uDot == std::string::npos) uDot = sPlain.size();
      const std::size_t uLabel = uDot - uStart;
      if (uLabel == 0 || uLabel > kMaxLabelLength) fail("invalid label in name: " + sName);
      writeU8(static_cast<uint8_t>(uLabel));
      writeBytes(reinterpret_cast<const uint8_t*>(sPlain.data() + uStart), uLabel);
      uStart = uDot + 1;
    }
    writeU8(0);
  }

  /// Reserve a 16-bit slot and return its offset for patchU16.
  std::size_t reserveU16() {
    writeU16(0);
    return _vBuf.size() - 2;
  }

  void patchU16(std::size_t uOffset, uint16_t u) {
    _vBuf[uOffset] = static_cast<uint8_t>(u >> 8);
    _vBuf[uOffset + 1] = static_cast<uint8_t>(u & 0xFF);
  }

  std::size_t size() const { return _vBuf.size(); }
  std::vector<uint8_t> take() { return std::move(_vBuf); }

 private:
  std::vector<uint8_t> _vBuf;
};

std::string addressToText(int iFamily, const uint8_t* pRaw) {
  char buf[INET6_ADDRSTRLEN] = {};
  if (inet_ntop(iFamily, pRaw, buf, sizeof(buf)) == nullptr) {
    fail("unprintable address");
  }
  return std::string(buf);
}

uint32_t wireTtl(const common::ResourceRecord& rr, common::TimePoint tpNow) {
  int64_t iSeconds = rr.durTtl.count();
  if (rr.tpExpiresAt != common::TimePoint{}) {
    iSeconds = std::chrono::duration_cast<std::chrono::seconds>(rr.tpExpiresAt - tpNow).count();
  }
  iSeconds = std::clamp<int64_t>(iSeconds, 0, std::numeric_limits<int32_t>::max());
  return static_cast<uint32_t>(iSeconds);
}

void writeAnswer(Writer& w, const common::ResourceRecord& rr, common::TimePoint tpNow) {
  w.writeName(rr.sDomain);
  w.writeU16(rr.uRecordType);
  w.writeU16(1);  // IN
  w.writeU32(wireTtl(rr, tpNow));
  const std::size_t uLenAt = w.reserveU16();
  const std::size_t uStart = w.size();

  const auto uType = rr.uRecordType;
  if (uType == common::toCode(common::RecordType::A) ||
      uType == common::toCode(common::RecordType::AAAA)) {
    const bool bV4 = uType == common::toCode(common::RecordType::A);
    uint8_t raw[16] = {};
    if (!rr.oAddress ||
        inet_pton(bV4 ? AF_INET : AF_INET6, rr.oAddress->c_str(), raw) != 1) {
      fail("record for " + rr.sDomain + " has no valid address");
    }
    w.writeBytes(raw, bV4 ? 4 : 16);
  } else if (uType == common::toCode(common::RecordType::MX)) {
    if (!rr.oHost) fail("MX record for " + rr.sDomain + " has no host");
    w.writeU16(static_cast<uint16_t>(std::clamp(rr.iPriority, 0, 0xFFFF)));
    w.writeName(*rr.oHost);
  } else if (common::isHostType(uType)) {
    if (!rr.oHost) fail("record for " + rr.sDomain + " has no host");
    w.writeName(*rr.oHost);
  } else {
    fail("cannot encode record type " + std::to_string(uType));
  }

  w.patchU16(uLenAt, static_cast<uint16_t>(w.size() - uStart));
}

/// Returns false when the record's type is not modelled and was skipped.
bool readAnswer(Reader& r, common::ResourceRecord& rr) {
  rr.sDomain = r.readName();
  rr.uRecordType = r.readU16();
  r.readU16();  // class
  rr.durTtl = std::chrono::seconds(r.readU32() & 0x7FFFFFFF);
  const uint16_t uLen = r.readU16();
  const std::size_t uEnd = r.pos() + uLen;

  const auto uType = rr.uRecordType;
  if (uType == common::toCode(common::RecordType::A)) {
    if (uLen != 4) fail("A record with rdlength " + std::to_string(uLen));
    rr.oAddress = addressToText(AF_INET, r.bytes(4));
  } else if (uType == common::toCode(common::RecordType::AAAA)) {
    if (uLen != 16) fail("AAAA record with rdlength " + std::to_string(uLen));
    rr.oAddress = addressToText(AF_INET6, r.bytes(16));
  } else if (uType == common::toCode(common::RecordType::MX)) {
    rr.iPriority = r.readU16();
    rr.oHost = r.readName();
  } else if (common::isHostType(uType)) {
    rr.oHost = r.readName();
  } else {
    r.skip(uLen);
    return false;
  }

  if (r.pos() != uEnd) fail("rdata length mismatch");
  return true;
}

void skipRecord(Reader& r) {
  r.readName();
  r.skip(8);  // type, class, ttl
  r.skip(r.readU16());
}

}  // namespace

Packet PacketCodec::decode(const std::vector<uint8_t>& vBytes) {
  return decode(vBytes.data(), vBytes.size());
}

Packet PacketCodec::decode(const uint8_t* pData, std::size_t uLen) {
  if (uLen < kHeaderSize) fail("packet shorter than header");
  Reader r(pData, uLen);
  Packet pkt;

  pkt.hdr.uId = r.readU16();
  const uint8_t uFlagsHigh = r.readU8();
  const uint8_t uFlagsLow = r.readU8();
  pkt.hdr.bResponse = (uFlagsHigh & 0x80) != 0;
  pkt.hdr.uOpcode = static_cast<uint8_t>((uFlagsHigh >> 3) & 0x0F);
  pkt.hdr.bAuthoritative = (uFlagsHigh & 0x04) != 0;
  pkt.hdr.bTruncated = (uFlagsHigh & 0x02) != 0;
  pkt.hdr.bRecursionDesired = (uFlagsHigh & 0x01) != 0;
  pkt.hdr.bRecursionAvailable = (uFlagsLow & 0x80) != 0;
  pkt.hdr.uRcode = static_cast<uint8_t>(uFlagsLow & 0x0F);

  const uint16_t uQuestions = r.readU16();
  const uint16_t uAnswers = r.readU16();
  const uint16_t uAuthorities = r.readU16();
  const uint16_t uAdditional = r.readU16();

  for (uint16_t i = 0; i < uQuestions; ++i) {
    Question q;
    q.sName = r.readName();
    q.uType = r.readU16();
    q.uClass = r.readU16();
    pkt.vQuestions.push_back(std::move(q));
  }

  for (uint16_t i = 0; i < uAnswers; ++i) {
    common::ResourceRecord rr;
    if (readAnswer(r, rr)) {
      pkt.vAnswers.push_back(std::move(rr));
    }
  }

  // Authority and additional sections are validated for framing only
  for (uint32_t i = 0; i < static_cast<uint32_t>(uAuthorities) + uAdditional; ++i) {
    skipRecord(r);
  }

  return pkt;
}

std::vector<uint8_t> PacketCodec::encode(const Packet& pkt, common::TimePoint tpNow) {
  if (pkt.vQuestions.size() > 0xFFFF || pkt.vAnswers.size() > 0xFFFF) {
    fail("too many records to encode");
  }

  Writer w;
  w.writeU16(pkt.hdr.uId);
  uint8_t uFlagsHigh = static_cast<uint8_t>((pkt.hdr.uOpcode & 0x0F) << 3);
  if (pkt.hdr.bResponse) uFlagsHigh |= 0x80;
  if (pkt.hdr.bAuthoritative) uFlagsHigh |= 0x04;
  if (pkt.hdr.bTruncated) uFlagsHigh |= 0x02;
  if (pkt.hdr.bRecursionDesired) uFlagsHigh |= 0x01;
  uint8_t uFlagsLow = static_cast<uint8_t>(pkt.hdr.uRcode & 0x0F);
  if (pkt.hdr.bRecursionAvailable) uFlagsLow |= 0x80;
  w.writeU8(uFlagsHigh);
  w.writeU8(uFlagsLow);
  w.writeU16(static_cast<uint16_t>(pkt.vQuestions.size()));
  w.writeU16(static_cast<uint16_t>(pkt.vAnswers.size()));
  w.writeU16(0);
  w.writeU16(0);

  for (const auto& q : pkt.vQuestions) {
    w.writeName(q.sName);
    w.writeU16(q.uType);
    w.writeU16(q.uClass);
  }
  for (const auto& rr : pkt.vAnswers) {
    writeAnswer(w, rr, tpNow);
  }
  return w.take();
}

Packet PacketCodec::makeQuery(uint16_t uId, const std::string& sDomain, uint16_t uRecordType) {
  Packet pkt;
  pkt.hdr.uId = uId;
  pkt.hdr.bRecursionDesired = true;
  pkt.vQuestions.push_back(Question{sDomain, uRecordType, 1});
  return pkt;
}

Packet PacketCodec::makeResponse(const Packet& pktRequest,
                                 std::vector<common::ResourceRecord> vAnswers, uint8_t uRcode) {
  Packet pkt;
  pkt.hdr.uId = pktRequest.hdr.uId;
  pkt.hdr.bResponse = true;
  pkt.hdr.uOpcode = pktRequest.hdr.uOpcode;
  pkt.hdr.bRecursionDesired = pktRequest.hdr.bRecursionDesired;
  pkt.hdr.bRecursionAvailable = true;
  pkt.hdr.uRcode = uRcode;
  pkt.vQuestions = pktRequest.vQuestions;
  pkt.vAnswers = std::move(vAnswers);
  return pkt;
}

Packet PacketCodec::makeErrorResponse(uint16_t uId, uint8_t uRcode) {
  Packet pkt;
  pkt.hdr.uId = uId;
  pkt.hdr.bResponse = true;
  pkt.hdr.bRecursionAvailable = true;
  pkt.hdr.uRcode = uRcode;
  return pkt;
}

}  // namespace dnscache::wire
