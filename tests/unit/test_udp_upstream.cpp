#include "upstream/UdpUpstream.hpp"

#include "common/Errors.hpp"
#include "support/TestDoubles.hpp"
#include "wire/PacketCodec.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include <functional>
#include <stdexcept>
#include <thread>

using dnscache::common::NameNotFoundError;
using dnscache::common::RecordType;
using dnscache::common::toCode;
using dnscache::common::UpstreamTimeoutError;
using dnscache::common::UpstreamUnreachableError;
using dnscache::test::answer;
using dnscache::upstream::UdpUpstream;
using dnscache::wire::Packet;
using dnscache::wire::PacketCodec;
using namespace std::chrono_literals;

namespace {

constexpr uint16_t kA = toCode(RecordType::A);

/// One-shot loopback server: answers the first query it receives via fnReply.
class LoopbackServer {
 public:
  explicit LoopbackServer(std::function<Packet(const Packet&)> fnReply)
      : _fnReply(std::move(fnReply)) {
    _iFd = ::socket(AF_INET, SOCK_DGRAM, 0);
    sockaddr_in sin{};
    sin.sin_family = AF_INET;
    sin.sin_port = 0;
    inet_pton(AF_INET, "127.0.0.1", &sin.sin_addr);
    if (_iFd < 0 || ::bind(_iFd, reinterpret_cast<const sockaddr*>(&sin), sizeof(sin)) != 0) {
      throw std::runtime_error("cannot bind loopback server");
    }
    socklen_t uLen = sizeof(sin);
    ::getsockname(_iFd, reinterpret_cast<sockaddr*>(&sin), &uLen);
    _uPort = ntohs(sin.sin_port);
    _thread = std::thread([this]() { serveOnce(); });
  }

  ~LoopbackServer() {
    if (_thread.joinable()) _thread.join();
    ::close(_iFd);
  }

  uint16_t port() const { return _uPort; }

 private:
  void serveOnce() {
    pollfd pfd{_iFd, POLLIN, 0};
    if (::poll(&pfd, 1, 2000) != 1) return;
    std::vector<uint8_t> vBuf(512);
    sockaddr_storage ssPeer{};
    socklen_t uPeerLen = sizeof(ssPeer);
    const ssize_t iRead = ::recvfrom(_iFd, vBuf.data(), vBuf.size(), 0,
                                     reinterpret_cast<sockaddr*>(&ssPeer), &uPeerLen);
    if (iRead <= 0) return;
    vBuf.resize(static_cast<std::size_t>(iRead));

    const auto pktQuery = PacketCodec::decode(vBuf);
    const auto vReply = PacketCodec::encode(_fnReply(pktQuery));
    ::sendto(_iFd, vReply.data(), vReply.size(), 0, reinterpret_cast<const sockaddr*>(&ssPeer),
             uPeerLen);
  }

  std::function<Packet(const Packet&)> _fnReply;
  int _iFd = -1;
  uint16_t _uPort = 0;
  std::thread _thread;
};

}  // namespace

TEST(UdpUpstreamTest, RejectsNonLiteralAddress) {
  EXPECT_THROW(UdpUpstream("resolver.example", 53), std::invalid_argument);
}

TEST(UdpUpstreamTest, NameShowsEndpoint) {
  EXPECT_EQ(UdpUpstream("9.9.9.9", 53).name(), "udp://9.9.9.9:53");
  EXPECT_EQ(UdpUpstream("::1", 5300).name(), "udp://[::1]:5300");
}

TEST(UdpUpstreamTest, ReturnsDecodedAnswers) {
  LoopbackServer srv([](const Packet& pktQuery) {
    const auto& q = pktQuery.vQuestions.front();
    return PacketCodec::makeResponse(pktQuery, {answer(q.sName, q.uType, "10.0.0.7", 0, 120s)},
                                     0);
  });

  UdpUpstream uu("127.0.0.1", srv.port());
  const auto vRecords = uu.query("wiki.archlinux.org", kA, 2000ms);
  ASSERT_EQ(vRecords.size(), 1u);
  EXPECT_EQ(vRecords[0].oAddress.value_or(""), "10.0.0.7");
  EXPECT_EQ(vRecords[0].durTtl, 120s);
}

TEST(UdpUpstreamTest, NxDomainThrowsNameNotFound) {
  LoopbackServer srv([](const Packet& pktQuery) {
    return PacketCodec::makeResponse(pktQuery, {}, dnscache::common::rcode::kNxDomain);
  });

  UdpUpstream uu("127.0.0.1", srv.port());
  try {
    uu.query("no-such-name.invalid", kA, 2000ms);
    FAIL() << "expected NameNotFoundError";
  } catch (const NameNotFoundError& ex) {
    EXPECT_EQ(ex._iRcode, dnscache::common::rcode::kNxDomain);
  }
}

TEST(UdpUpstreamTest, NoDataIsAnEmptyAnswer) {
  LoopbackServer srv([](const Packet& pktQuery) {
    return PacketCodec::makeResponse(pktQuery, {}, dnscache::common::rcode::kNoError);
  });

  UdpUpstream uu("127.0.0.1", srv.port());
  EXPECT_TRUE(uu.query("wiki.archlinux.org", toCode(RecordType::MX), 2000ms).empty());
}

TEST(UdpUpstreamTest, ServfailIsUnreachable) {
  LoopbackServer srv([](const Packet& pktQuery) {
    return PacketCodec::makeResponse(pktQuery, {}, dnscache::common::rcode::kServFail);
  });

  UdpUpstream uu("127.0.0.1", srv.port());
  EXPECT_THROW(uu.query("broken.test", kA, 2000ms), UpstreamUnreachableError);
}

TEST(UdpUpstreamTest, ReplyWithWrongIdIsIgnoredUntilDeadline) {
  LoopbackServer srv([](const Packet& pktQuery) {
    auto pkt = PacketCodec::makeResponse(pktQuery, {}, 0);
    pkt.hdr.uId = static_cast<uint16_t>(pkt.hdr.uId + 1);
    return pkt;
  });

  UdpUpstream uu("127.0.0.1", srv.port());
  EXPECT_THROW(uu.query("spoofed.test", kA, 200ms), UpstreamTimeoutError);
}
