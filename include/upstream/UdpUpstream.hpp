#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include "upstream/IUpstream.hpp"

namespace dnscache::upstream {

/// Forwards a single recursion-desired query over UDP to a configured recursive server.
/// One socket per query; poll() bounds the wait so the call never outlives durTimeout.
/// Class abbreviation: uu
class UdpUpstream : public IUpstream {
 public:
  /// Throws std::invalid_argument if sServerAddr is not an IPv4 or IPv6 literal.
  UdpUpstream(std::string sServerAddr, uint16_t uPort);
  ~UdpUpstream() override;

  std::string name() const override;
  std::vector<common::ResourceRecord> query(const std::string& sDomain, uint16_t uRecordType,
                                            std::chrono::milliseconds durTimeout) override;

 private:
  uint16_t nextQueryId();

  std::string _sServerAddr;
  uint16_t _uPort;
  bool _bIpv6;
  std::mutex _mtxRng;
  std::mt19937 _rng;
};

}  // namespace dnscache::upstream
