#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "common/Types.hpp"

namespace dnscache::core {
class Resolver;
class ThreadPool;
}  // namespace dnscache::core

namespace dnscache::server {

/// UDP transport listener. A receive loop on its own std::jthread hands each datagram
/// to the ThreadPool, which decodes it, asks the Resolver and sends the reply.
/// Class abbreviation: us
class UdpServer {
 public:
  UdpServer(core::Resolver& rsResolver, core::ThreadPool& tpPool,
            common::ClockFn fnClock = common::systemClock());
  ~UdpServer();

  UdpServer(const UdpServer&) = delete;
  UdpServer& operator=(const UdpServer&) = delete;

  /// Bind and start receiving. Throws std::runtime_error if the socket cannot be bound.
  void start(const std::string& sAddr, uint16_t uPort);

  /// Stop receiving, wait for dispatched requests to send their replies, then close
  /// the socket.
  void stop();

  /// Port actually bound (useful when started on port 0).
  uint16_t boundPort() const { return _uBoundPort; }

  /// Build the wire reply for one request datagram. Never throws; failures become
  /// FORMERR or SERVFAIL responses. Returns an empty vector when no reply is due.
  std::vector<uint8_t> handle(const std::vector<uint8_t>& vRequest);

 private:
  void receiveLoop(std::stop_token stToken);
  void finishRequest();

  core::Resolver& _rsResolver;
  core::ThreadPool& _tpPool;
  common::ClockFn _fnClock;
  int _iFd = -1;
  uint16_t _uBoundPort = 0;
  std::jthread _thread;

  // Requests handed to the pool whose reply has not been sent yet
  std::mutex _mtxPending;
  std::condition_variable _cvPending;
  int _iPending = 0;
};

}  // namespace dnscache::server
