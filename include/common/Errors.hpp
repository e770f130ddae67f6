#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace dnscache::common {

/// DNS response codes used when an error reaches the packet layer.
namespace rcode {
constexpr int kNoError = 0;
constexpr int kFormErr = 1;
constexpr int kServFail = 2;
constexpr int kNxDomain = 3;
constexpr int kNotImp = 4;
}  // namespace rcode

/// Base error for all application-level exceptions.
/// Carries the DNS response code and machine-readable error code slug.
struct AppError : public std::runtime_error {
  int _iRcode;
  std::string _sErrorCode;

  explicit AppError(int iRcode, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _iRcode(iRcode),
        _sErrorCode(std::move(sCode)) {}
};

/// SERVFAIL: upstream did not answer before the deadline.
struct UpstreamTimeoutError : AppError {
  explicit UpstreamTimeoutError(std::string sCode, std::string sMsg)
      : AppError(rcode::kServFail, std::move(sCode), std::move(sMsg)) {}
};

/// SERVFAIL: upstream could not be reached or sent an unusable reply.
struct UpstreamUnreachableError : AppError {
  explicit UpstreamUnreachableError(std::string sCode, std::string sMsg)
      : AppError(rcode::kServFail, std::move(sCode), std::move(sMsg)) {}
};

/// NXDOMAIN: the upstream authority reports that the name does not exist.
struct NameNotFoundError : AppError {
  explicit NameNotFoundError(std::string sCode, std::string sMsg)
      : AppError(rcode::kNxDomain, std::move(sCode), std::move(sMsg)) {}
};

/// SERVFAIL: persistence failure. The failed call left no partial state.
struct StoreIOError : AppError {
  explicit StoreIOError(std::string sCode, std::string sMsg)
      : AppError(rcode::kServFail, std::move(sCode), std::move(sMsg)) {}
};

/// SERVFAIL: record violates the data model; rejected before storage.
struct MalformedRecordError : AppError {
  explicit MalformedRecordError(std::string sCode, std::string sMsg)
      : AppError(rcode::kServFail, std::move(sCode), std::move(sMsg)) {}
};

/// FORMERR: wire-format packet could not be decoded or encoded.
struct PacketFormatError : AppError {
  explicit PacketFormatError(std::string sCode, std::string sMsg)
      : AppError(rcode::kFormErr, std::move(sCode), std::move(sMsg)) {}
};

}  // namespace dnscache::common
