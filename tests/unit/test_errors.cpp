#include "common/Errors.hpp"

#include <gtest/gtest.h>

using namespace dnscache::common;

TEST(ErrorsTest, AppErrorCarriesRcodeAndCode) {
  AppError err(rcode::kServFail, "internal_error", "Something went wrong");
  EXPECT_EQ(err._iRcode, 2);
  EXPECT_EQ(err._sErrorCode, "internal_error");
  EXPECT_STREQ(err.what(), "Something went wrong");
}

TEST(ErrorsTest, UpstreamTimeoutIsServfail) {
  UpstreamTimeoutError err("upstream_timeout", "no answer within 2000ms");
  EXPECT_EQ(err._iRcode, rcode::kServFail);
  EXPECT_EQ(err._sErrorCode, "upstream_timeout");
}

TEST(ErrorsTest, UpstreamUnreachableIsServfail) {
  UpstreamUnreachableError err("upstream_unreachable", "connection refused");
  EXPECT_EQ(err._iRcode, rcode::kServFail);
}

TEST(ErrorsTest, StoreIOErrorIsServfail) {
  StoreIOError err("db_upsert_failed", "rolled back");
  EXPECT_EQ(err._iRcode, rcode::kServFail);
  EXPECT_EQ(err._sErrorCode, "db_upsert_failed");
}

TEST(ErrorsTest, MalformedRecordIsServfail) {
  MalformedRecordError err("malformed_record", "ttl must be positive");
  EXPECT_EQ(err._iRcode, rcode::kServFail);
}

TEST(ErrorsTest, PacketFormatErrorIsFormerr) {
  PacketFormatError err("malformed_packet", "packet truncated");
  EXPECT_EQ(err._iRcode, rcode::kFormErr);
}

TEST(ErrorsTest, PolymorphicCatchAsAppError) {
  try {
    throw UpstreamTimeoutError("t", "timeout");
  } catch (const AppError& err) {
    EXPECT_EQ(err._iRcode, rcode::kServFail);
    EXPECT_EQ(err._sErrorCode, "t");
  }

  try {
    throw PacketFormatError("p", "bad packet");
  } catch (const AppError& err) {
    EXPECT_EQ(err._iRcode, rcode::kFormErr);
  }
}

TEST(ErrorsTest, CatchableAsStdRuntimeError) {
  try {
    throw StoreIOError("s", "disk full");
  } catch (const std::runtime_error& err) {
    EXPECT_STREQ(err.what(), "disk full");
  }
}

TEST(ErrorsTest, NameNotFoundIsNxDomain) {
  NameNotFoundError err("name_not_found", "no-such-name.invalid does not exist");
  EXPECT_EQ(err._iRcode, rcode::kNxDomain);
  EXPECT_EQ(err._sErrorCode, "name_not_found");
}
