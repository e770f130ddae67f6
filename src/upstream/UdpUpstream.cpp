#include "upstream/UdpUpstream.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "wire/PacketCodec.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace dnscache::upstream {

namespace {

/// Closes the socket descriptor on scope exit.
class SocketGuard {
 public:
  explicit SocketGuard(int iFd) : _iFd(iFd) {}
  ~SocketGuard() {
    if (_iFd >= 0) ::close(_iFd);
  }
  SocketGuard(const SocketGuard&) = delete;
  SocketGuard& operator=(const SocketGuard&) = delete;

  int fd() const { return _iFd; }

 private:
  int _iFd;
};

[[noreturn]] void unreachable(const std::string& sWhat) {
  throw common::UpstreamUnreachableError("upstream_unreachable",
                                         sWhat + ": " + std::strerror(errno));
}

}  // namespace

UdpUpstream::UdpUpstream(std::string sServerAddr, uint16_t uPort)
    : _sServerAddr(std::move(sServerAddr)), _uPort(uPort), _rng(std::random_device{}()) {
  in6_addr addr6{};
  in_addr addr4{};
  if (inet_pton(AF_INET, _sServerAddr.c_str(), &addr4) == 1) {
    _bIpv6 = false;
  } else if (inet_pton(AF_INET6, _sServerAddr.c_str(), &addr6) == 1) {
    _bIpv6 = true;
  } else {
    throw std::invalid_argument("Upstream address is not an IP literal: " + _sServerAddr);
  }
}

UdpUpstream::~UdpUpstream() = default;

std::string UdpUpstream::name() const {
  return "udp://" + (_bIpv6 ? "[" + _sServerAddr + "]" : _sServerAddr) + ":" +
         std::to_string(_uPort);
}

uint16_t UdpUpstream::nextQueryId() {
  std::lock_guard<std::mutex> lock(_mtxRng);
  return static_cast<uint16_t>(_rng() & 0xFFFF);
}

std::vector<common::ResourceRecord> UdpUpstream::query(const std::string& sDomain,
                                                       uint16_t uRecordType,
                                                       std::chrono::milliseconds durTimeout) {
  const auto tpDeadline = std::chrono::steady_clock::now() + durTimeout;
  const uint16_t uId = nextQueryId();
  const auto vQuery = wire::PacketCodec::encode(wire::PacketCodec::makeQuery(uId, sDomain, uRecordType));

  SocketGuard sock(::socket(_bIpv6 ? AF_INET6 : AF_INET, SOCK_DGRAM, 0));
  if (sock.fd() < 0) unreachable("socket() failed");

  sockaddr_storage ssServer{};
  socklen_t uAddrLen = 0;
  if (_bIpv6) {
    auto* pSin6 = reinterpret_cast<sockaddr_in6*>(&ssServer);
    pSin6->sin6_family = AF_INET6;
    pSin6->sin6_port = htons(_uPort);
    inet_pton(AF_INET6, _sServerAddr.c_str(), &pSin6->sin6_addr);
    uAddrLen = sizeof(sockaddr_in6);
  } else {
    auto* pSin = reinterpret_cast<sockaddr_in*>(&ssServer);
    pSin->sin_family = AF_INET;
    pSin->sin_port = htons(_uPort);
    inet_pton(AF_INET, _sServerAddr.c_str(), &pSin->sin_addr);
    uAddrLen = sizeof(sockaddr_in);
  }

  // connect() makes the kernel drop datagrams from any other source
  if (::connect(sock.fd(), reinterpret_cast<const sockaddr*>(&ssServer), uAddrLen) != 0) {
    unreachable("connect() to " + name() + " failed");
  }
  if (::send(sock.fd(), vQuery.data(), vQuery.size(), 0) < 0) {
    unreachable("send() to " + name() + " failed");
  }

  std::vector<uint8_t> vBuf(4096);
  for (;;) {
    const auto durLeft = std::chrono::duration_cast<std::chrono::milliseconds>(
        tpDeadline - std::chrono::steady_clock::now());
    if (durLeft.count() <= 0) {
      throw common::UpstreamTimeoutError(
          "upstream_timeout", "No answer from " + name() + " for " + sDomain + " within " +
                                  std::to_string(durTimeout.count()) + "ms");
    }

    pollfd pfd{sock.fd(), POLLIN, 0};
    const int iReady = ::poll(&pfd, 1, static_cast<int>(durLeft.count()));
    if (iReady < 0) {
      if (errno == EINTR) continue;
      unreachable("poll() failed");
    }
    if (iReady == 0) continue;  // deadline check above throws

    const ssize_t iRead = ::recv(sock.fd(), vBuf.data(), vBuf.size(), 0);
    if (iRead < 0) {
      if (errno == EINTR) continue;
      unreachable("recv() from " + name() + " failed");
    }

    wire::Packet pkt;
    try {
      pkt = wire::PacketCodec::decode(vBuf.data(), static_cast<std::size_t>(iRead));
    } catch (const common::PacketFormatError& ex) {
      common::Logger::get()->warn("Ignoring undecodable reply from {}: {}", name(), ex.what());
      continue;
    }
    if (!pkt.hdr.bResponse || pkt.hdr.uId != uId) {
      common::Logger::get()->debug("Ignoring unrelated datagram from {} (id {})", name(),
                                   pkt.hdr.uId);
      continue;
    }

    if (pkt.hdr.uRcode == common::rcode::kNxDomain) {
      throw common::NameNotFoundError("name_not_found",
                                      name() + " reports that " + sDomain + " does not exist");
    }
    if (pkt.hdr.uRcode != common::rcode::kNoError) {
      throw common::UpstreamUnreachableError(
          "upstream_error", name() + " answered " + sDomain + " with rcode " +
                                std::to_string(pkt.hdr.uRcode));
    }
    return std::move(pkt.vAnswers);
  }
}

}  // namespace dnscache::upstream
