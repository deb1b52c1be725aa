#include <gtest/gtest.h>
#include <string>
#include <utility>
#include "dut_probe/common/error_code.hpp"
#include "dut_probe/common/result.hpp"

using dutprobe::Error;
using dutprobe::ErrorCode;
using dutprobe::MakeError;
using dutprobe::Result;
using dutprobe::Status;

TEST(Result, HoldsValue) {
  Result<std::string> result = std::string("M001");
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(static_cast<bool>(result));
  EXPECT_EQ(*result, "M001");
  EXPECT_EQ(result->size(), 4u);
}

TEST(Result, HoldsError) {
  Result<int> result = MakeError(ErrorCode::kTimeout, "No datagram received");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::kTimeout);
  EXPECT_EQ(result.error().message, "No datagram received");
}

TEST(Result, MoveOutError) {
  Result<int> result = MakeError(ErrorCode::kSocketError, "bind() failed");
  Error error = std::move(result).error();
  EXPECT_EQ(error.code, ErrorCode::kSocketError);
}

TEST(Status, DefaultIsOk) {
  Status status;
  EXPECT_TRUE(status.ok());
  EXPECT_TRUE(Status::Ok().ok());
}

TEST(Status, FromError) {
  Status status = MakeError(ErrorCode::kConnectionRefused, "Connection refused");
  EXPECT_FALSE(status.ok());
  EXPECT_FALSE(static_cast<bool>(status));
  EXPECT_EQ(status.error().code, ErrorCode::kConnectionRefused);
}

TEST(ErrorCode, ToString) {
  EXPECT_EQ(dutprobe::ToString(ErrorCode::kParseError), "parse error");
  EXPECT_EQ(dutprobe::ToString(ErrorCode::kTimeout), "timeout");
}
