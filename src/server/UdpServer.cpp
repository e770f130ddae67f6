#include "server/UdpServer.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/Resolver.hpp"
#include "core/ThreadPool.hpp"
#include "wire/PacketCodec.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace dnscache::server {

namespace {

constexpr int kPollIntervalMs = 200;
constexpr uint8_t kOpcodeQuery = 0;

/// Encode, falling back to a header-only SERVFAIL if the reply itself cannot be encoded.
std::vector<uint8_t> encodeOrServfail(const wire::Packet& pkt, common::TimePoint tpNow) {
  try {
    return wire::PacketCodec::encode(pkt, tpNow);
  } catch (const common::PacketFormatError& ex) {
    common::Logger::get()->error("Cannot encode reply {}: {}", pkt.hdr.uId, ex.what());
    return wire::PacketCodec::encode(
        wire::PacketCodec::makeErrorResponse(pkt.hdr.uId, common::rcode::kServFail), tpNow);
  }
}

}  // namespace

UdpServer::UdpServer(core::Resolver& rsResolver, core::ThreadPool& tpPool,
                     common::ClockFn fnClock)
    : _rsResolver(rsResolver), _tpPool(tpPool), _fnClock(std::move(fnClock)) {}

UdpServer::~UdpServer() {
  stop();
}

void UdpServer::start(const std::string& sAddr, uint16_t uPort) {
  if (_iFd >= 0) return;

  sockaddr_storage ssAddr{};
  socklen_t uAddrLen = 0;
  int iFamily = AF_INET;
  auto* pSin = reinterpret_cast<sockaddr_in*>(&ssAddr);
  auto* pSin6 = reinterpret_cast<sockaddr_in6*>(&ssAddr);
  if (inet_pton(AF_INET, sAddr.c_str(), &pSin->sin_addr) == 1) {
    pSin->sin_family = AF_INET;
    pSin->sin_port = htons(uPort);
    uAddrLen = sizeof(sockaddr_in);
  } else if (inet_pton(AF_INET6, sAddr.c_str(), &pSin6->sin6_addr) == 1) {
    iFamily = AF_INET6;
    pSin6->sin6_family = AF_INET6;
    pSin6->sin6_port = htons(uPort);
    uAddrLen = sizeof(sockaddr_in6);
  } else {
    throw std::runtime_error("Listen address is not an IP literal: " + sAddr);
  }

  const int iFd = ::socket(iFamily, SOCK_DGRAM, 0);
  if (iFd < 0) {
    throw std::runtime_error(std::string("socket() failed: ") + std::strerror(errno));
  }
  const int iOn = 1;
  ::setsockopt(iFd, SOL_SOCKET, SO_REUSEADDR, &iOn, sizeof(iOn));
  if (::bind(iFd, reinterpret_cast<const sockaddr*>(&ssAddr), uAddrLen) != 0) {
    const std::string sErr = std::strerror(errno);
    ::close(iFd);
    throw std::runtime_error("bind() to " + sAddr + ":" + std::to_string(uPort) +
                             " failed: " + sErr);
  }

  sockaddr_storage ssBound{};
  socklen_t uBoundLen = sizeof(ssBound);
  ::getsockname(iFd, reinterpret_cast<sockaddr*>(&ssBound), &uBoundLen);
  _uBoundPort = iFamily == AF_INET
                    ? ntohs(reinterpret_cast<sockaddr_in*>(&ssBound)->sin_port)
                    : ntohs(reinterpret_cast<sockaddr_in6*>(&ssBound)->sin6_port);

  _iFd = iFd;
  _thread = std::jthread([this](std::stop_token stToken) { receiveLoop(stToken); });
  common::Logger::get()->info("UDP listener bound to {}:{}", sAddr, _uBoundPort);
}

void UdpServer::stop() {
  if (_iFd < 0) return;
  _thread.request_stop();
  if (_thread.joinable()) {
    _thread.join();
  }
  {
    std::unique_lock<std::mutex> lock(_mtxPending);
    _cvPending.wait(lock, [this] { return _iPending == 0; });
  }
  ::close(_iFd);
  _iFd = -1;
  common::Logger::get()->info("UDP listener stopped");
}

void UdpServer::finishRequest() {
  {
    std::lock_guard<std::mutex> lock(_mtxPending);
    --_iPending;
  }
  _cvPending.notify_all();
}

void UdpServer::receiveLoop(std::stop_token stToken) {
  auto spLog = common::Logger::get();
  std::vector<uint8_t> vBuf(wire::kMaxUdpPayload * 8);

  while (!stToken.stop_requested()) {
    pollfd pfd{_iFd, POLLIN, 0};
    const int iReady = ::poll(&pfd, 1, kPollIntervalMs);
    if (iReady < 0) {
      if (errno == EINTR) continue;
      spLog->error("Listener poll() failed: {}", std::strerror(errno));
      return;
    }
    if (iReady == 0) continue;

    sockaddr_storage ssPeer{};
    socklen_t uPeerLen = sizeof(ssPeer);
    const ssize_t iRead = ::recvfrom(_iFd, vBuf.data(), vBuf.size(), 0,
                                     reinterpret_cast<sockaddr*>(&ssPeer), &uPeerLen);
    if (iRead < 0) {
      if (errno != EINTR && errno != EAGAIN) {
        spLog->warn("Listener recvfrom() failed: {}", std::strerror(errno));
      }
      continue;
    }

    std::vector<uint8_t> vRequest(vBuf.begin(), vBuf.begin() + iRead);
    const int iFd = _iFd;
    {
      std::lock_guard<std::mutex> lock(_mtxPending);
      ++_iPending;
    }
    try {
      _tpPool.submit([this, iFd, ssPeer, uPeerLen, vRequest = std::move(vRequest)]() {
        const auto vReply = handle(vRequest);
        if (!vReply.empty() &&
            ::sendto(iFd, vReply.data(), vReply.size(), 0,
                     reinterpret_cast<const sockaddr*>(&ssPeer), uPeerLen) < 0) {
          common::Logger::get()->warn("Listener sendto() failed: {}", std::strerror(errno));
        }
        finishRequest();
      });
    } catch (const std::runtime_error& ex) {
      finishRequest();
      spLog->warn("Dropping query, worker pool unavailable: {}", ex.what());
    }
  }
}

std::vector<uint8_t> UdpServer::handle(const std::vector<uint8_t>& vRequest) {
  auto spLog = common::Logger::get();
  const auto tpNow = _fnClock();

  wire::Packet pktRequest;
  try {
    pktRequest = wire::PacketCodec::decode(vRequest);
  } catch (const common::PacketFormatError& ex) {
    spLog->info("Received a malformed packet: {}", ex.what());
    if (vRequest.size() < 2) return {};
    const auto uId = static_cast<uint16_t>((vRequest[0] << 8) | vRequest[1]);
    return encodeOrServfail(wire::PacketCodec::makeErrorResponse(uId, common::rcode::kFormErr),
                            tpNow);
  }

  // Never answer a response; it is either a reflection or a misrouted reply
  if (pktRequest.hdr.bResponse) return {};

  if (pktRequest.hdr.uOpcode != kOpcodeQuery) {
    return encodeOrServfail(
        wire::PacketCodec::makeResponse(pktRequest, {}, common::rcode::kNotImp), tpNow);
  }
  if (pktRequest.vQuestions.size() != 1) {
    return encodeOrServfail(
        wire::PacketCodec::makeResponse(pktRequest, {}, common::rcode::kFormErr), tpNow);
  }

  const auto& q = pktRequest.vQuestions.front();
  try {
    std::vector<common::ResourceRecord> vAnswers;
    if (pktRequest.hdr.bRecursionDesired) {
      vAnswers = _rsResolver.resolve(q.sName, q.uType);
    } else {
      auto oCached = _rsResolver.lookupCached(q.sName, q.uType);
      if (oCached) vAnswers = std::move(*oCached);
    }
    // Echo the owner name as the client spelled it
    for (auto& rr : vAnswers) {
      rr.sDomain = q.sName;
    }
    spLog->debug("Answering {}/{} with {} records", q.sName, q.uType, vAnswers.size());

    auto pktReply =
        wire::PacketCodec::makeResponse(pktRequest, std::move(vAnswers), common::rcode::kNoError);
    auto vReply = encodeOrServfail(pktReply, tpNow);
    if (vReply.size() > wire::kMaxUdpPayload) {
      pktReply.vAnswers.clear();
      pktReply.hdr.bTruncated = true;
      vReply = encodeOrServfail(pktReply, tpNow);
    }
    return vReply;
  } catch (const common::NameNotFoundError& ex) {
    spLog->debug("Answering {}/{} with NXDOMAIN: {}", q.sName, q.uType, ex.what());
    return encodeOrServfail(
        wire::PacketCodec::makeResponse(pktRequest, {}, common::rcode::kNxDomain), tpNow);
  } catch (const common::AppError& ex) {
    spLog->warn("Resolution of {}/{} failed ({}): {}", q.sName, q.uType, ex._sErrorCode,
                ex.what());
    return encodeOrServfail(
        wire::PacketCodec::makeResponse(pktRequest, {}, static_cast<uint8_t>(ex._iRcode)),
        tpNow);
  } catch (const std::exception& ex) {
    spLog->error("Unexpected failure answering {}/{}: {}", q.sName, q.uType, ex.what());
    return encodeOrServfail(
        wire::PacketCodec::makeResponse(pktRequest, {}, common::rcode::kServFail), tpNow);
  }
}

}  // namespace dnscache::server
