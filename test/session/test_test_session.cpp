#include <gtest/gtest.h>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include <vector>
#include "dut_probe/common/byte_helpers.hpp"
#include "dut_probe/common/error_code.hpp"
#include "dut_probe/protocol/status_sample.hpp"
#include "dut_probe/session/test_session.hpp"
#include "dut_probe/transport/memory_channel.hpp"

using dutprobe::ErrorCode;
using dutprobe::MemoryChannel;
using dutprobe::SessionState;
using dutprobe::StatusSample;
using dutprobe::TestParameters;
using dutprobe::TestSession;
using dutprobe::ToBytes;

namespace {

std::vector<StatusSample> Drain(TestSession &session) {
  std::vector<StatusSample> samples;
  for (StatusSample const &sample : session) {
    samples.push_back(sample);
  }
  return samples;
}

}  // namespace

TEST(TestSession, StartSendsCommand) {
  MemoryChannel channel;
  TestSession session(channel, {5, 250, 1000});
  EXPECT_EQ(session.GetState(), SessionState::kIdle);

  ASSERT_TRUE(session.Start());
  EXPECT_EQ(session.GetState(), SessionState::kStarting);
  ASSERT_EQ(channel.GetSentData().size(), 1u);
  EXPECT_EQ(channel.GetSentData()[0], ToBytes("TEST;CMD=START;DURATION=5;RATE=250;"));

  EXPECT_FALSE(session.Start());
  EXPECT_EQ(channel.GetSentData().size(), 1u);
}

TEST(TestSession, CompleteRun) {
  MemoryChannel channel;
  channel.PushInbound("TEST;RESULT=STARTED;");
  channel.PushInbound("STATUS;TIME=100;MV=4448.9;MA=-11.1;");
  channel.PushInbound("STATUS;TIME=200;MV=4449.0;MA=-11.0;");
  channel.PushInbound("STATUS;TIME=300;MV=4449.1;MA=-10.9;");
  channel.PushInbound("STATUS;STATE=IDLE;");

  TestSession session(channel, TestParameters{});
  auto samples = Drain(session);

  ASSERT_EQ(samples.size(), 3u);
  EXPECT_DOUBLE_EQ(samples[0].elapsed_seconds, 0.1);
  EXPECT_DOUBLE_EQ(samples[2].millivolts, 4449.1);
  EXPECT_EQ(session.GetState(), SessionState::kComplete);
  EXPECT_EQ(session.GetSamplesReceived(), 3u);
  EXPECT_FALSE(session.GetLastError().has_value());
  EXPECT_FALSE(channel.IsOpen());
}

TEST(TestSession, AcknowledgementMovesToRunning) {
  MemoryChannel channel;
  channel.PushInbound("TEST;RESULT=STARTED;");
  channel.PushInbound("STATUS;TIME=100;MV=1;MA=2;");

  TestSession session(channel, TestParameters{});
  auto sample = session.Next();
  ASSERT_TRUE(sample.has_value());
  EXPECT_EQ(session.GetState(), SessionState::kRunning);
  EXPECT_EQ(channel.ReceiveCount(), 2u);
}

TEST(TestSession, SampleBeforeAcknowledgement) {
  MemoryChannel channel;
  channel.PushInbound("STATUS;TIME=100;MV=1;MA=2;");
  channel.PushInbound("TEST;RESULT=STARTED;");
  channel.PushInbound("STATUS;STATE=IDLE;");

  TestSession session(channel, TestParameters{});
  ASSERT_TRUE(session.Next().has_value());
  EXPECT_EQ(session.GetState(), SessionState::kRunning);
  EXPECT_FALSE(session.Next().has_value());
  EXPECT_EQ(session.GetState(), SessionState::kComplete);
}

TEST(TestSession, SilenceTimesOut) {
  MemoryChannel channel;
  channel.PushInbound("TEST;RESULT=STARTED;");
  channel.PushInbound("STATUS;TIME=100;MV=1;MA=2;");

  TestSession session(channel, TestParameters{});
  auto samples = Drain(session);
  EXPECT_EQ(samples.size(), 1u);
  EXPECT_EQ(session.GetState(), SessionState::kTimedOut);
  EXPECT_FALSE(session.GetLastError().has_value());
  EXPECT_FALSE(channel.IsOpen());
}

TEST(TestSession, NoAcknowledgementTimesOut) {
  MemoryChannel channel;
  TestSession session(channel, TestParameters{});
  EXPECT_TRUE(Drain(session).empty());
  EXPECT_EQ(session.GetState(), SessionState::kTimedOut);
}

TEST(TestSession, MalformedDatagramIsFatal) {
  MemoryChannel channel;
  channel.PushInbound("TEST;RESULT=STARTED;");
  channel.PushInbound("STATUS;MV=1=2;");
  channel.PushInbound("STATUS;STATE=IDLE;");

  TestSession session(channel, TestParameters{});
  EXPECT_TRUE(Drain(session).empty());
  EXPECT_EQ(session.GetState(), SessionState::kError);
  ASSERT_TRUE(session.GetLastError().has_value());
  EXPECT_EQ(session.GetLastError()->code, ErrorCode::kParseError);
  EXPECT_EQ(session.GetLastError()->raw, ToBytes("STATUS;MV=1=2;"));
  EXPECT_EQ(channel.PendingInbound(), 1u);
}

TEST(TestSession, MissingFieldIsFatal) {
  MemoryChannel channel;
  channel.PushInbound("TEST;RESULT=STARTED;");
  channel.PushInbound("STATUS;TIME=100;MA=2;");

  TestSession session(channel, TestParameters{});
  EXPECT_TRUE(Drain(session).empty());
  EXPECT_EQ(session.GetState(), SessionState::kError);
  ASSERT_TRUE(session.GetLastError().has_value());
  EXPECT_EQ(session.GetLastError()->code, ErrorCode::kMissingField);
  EXPECT_EQ(session.GetLastError()->field, "MV");
  EXPECT_EQ(session.GetLastError()->raw, ToBytes("STATUS;TIME=100;MA=2;"));
}

TEST(TestSession, InvalidFieldIsFatal) {
  MemoryChannel channel;
  channel.PushInbound("STATUS;TIME=100;MV=banana;MA=2;");

  TestSession session(channel, TestParameters{});
  EXPECT_FALSE(session.Next().has_value());
  EXPECT_EQ(session.GetLastError()->code, ErrorCode::kInvalidField);
}

TEST(TestSession, UnexpectedMessageIsFatal) {
  MemoryChannel channel;
  channel.PushInbound("TEST;RESULT=STARTED;");
  channel.PushInbound("ID;MODEL=M001;SERIAL=SN1;");

  TestSession session(channel, TestParameters{});
  EXPECT_FALSE(session.Next().has_value());
  EXPECT_EQ(session.GetState(), SessionState::kError);
  EXPECT_EQ(session.GetLastError()->code, ErrorCode::kUnexpectedMessage);
  EXPECT_EQ(session.GetLastError()->message, "Unexpected 'ID' message during test");
}

TEST(TestSession, ConnectionRefused) {
  MemoryChannel channel;
  channel.PushInboundError(ErrorCode::kConnectionRefused);

  TestSession session(channel, TestParameters{});
  EXPECT_FALSE(session.Next().has_value());
  EXPECT_EQ(session.GetState(), SessionState::kError);
  EXPECT_EQ(session.GetLastError()->code, ErrorCode::kConnectionRefused);
  EXPECT_FALSE(channel.IsOpen());
}

TEST(TestSession, SendFailure) {
  MemoryChannel channel;
  channel.FailSends(ErrorCode::kSocketError);

  TestSession session(channel, TestParameters{});
  EXPECT_FALSE(session.Start());
  EXPECT_EQ(session.GetState(), SessionState::kError);
  EXPECT_EQ(session.GetLastError()->code, ErrorCode::kSocketError);
  EXPECT_FALSE(session.Next().has_value());
}

TEST(TestSession, FinishedSessionYieldsNothing) {
  MemoryChannel channel;
  channel.PushInbound("STATUS;STATE=IDLE;");

  TestSession session(channel, TestParameters{});
  EXPECT_FALSE(session.Next().has_value());
  EXPECT_TRUE(session.IsFinished());
  EXPECT_FALSE(session.Next().has_value());
  EXPECT_EQ(channel.ReceiveCount(), 1u);
}

TEST(TestSession, RequestStop) {
  MemoryChannel channel;
  channel.PushInbound("TEST;RESULT=STARTED;");
  channel.PushInbound("STATUS;TIME=100;MV=1;MA=2;");
  channel.PushInbound("TEST;RESULT=STOPPED;");
  channel.PushInbound("STATUS;STATE=IDLE;");

  TestSession session(channel, TestParameters{});
  EXPECT_FALSE(session.RequestStop());

  ASSERT_TRUE(session.Next().has_value());
  ASSERT_TRUE(session.RequestStop());
  ASSERT_EQ(channel.GetSentData().size(), 2u);
  EXPECT_EQ(channel.GetSentData()[1], ToBytes("TEST;CMD=STOP;"));

  EXPECT_FALSE(session.Next().has_value());
  EXPECT_EQ(session.GetState(), SessionState::kComplete);
  EXPECT_FALSE(session.RequestStop());
}

TEST(SessionState, ToString) {
  EXPECT_EQ(dutprobe::ToString(SessionState::kTimedOut), "TIMED_OUT");
  EXPECT_EQ(dutprobe::ToString(SessionState::kComplete), "COMPLETE");
}

TEST(TestSession, TimeoutIsLoggedAtDebugOnly) {
  auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(64);
  auto previous = spdlog::default_logger();
  auto capture = std::make_shared<spdlog::logger>("capture", sink);
  capture->set_level(spdlog::level::trace);
  spdlog::set_default_logger(capture);

  MemoryChannel channel;
  channel.PushInbound("TEST;RESULT=STARTED;");
  TestSession session(channel, TestParameters{});
  EXPECT_FALSE(session.Next().has_value());
  spdlog::set_default_logger(previous);

  EXPECT_EQ(session.GetState(), SessionState::kTimedOut);
  bool timeout_logged = false;
  for (auto const &record : sink->last_raw()) {
    std::string text(record.payload.data(), record.payload.size());
    if (text.find("No data from device") != std::string::npos) {
      timeout_logged = true;
      EXPECT_EQ(record.level, spdlog::level::debug);
    }
    EXPECT_LT(record.level, spdlog::level::warn) << text;
  }
  EXPECT_TRUE(timeout_logged);
}
