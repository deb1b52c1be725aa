#include <gtest/gtest.h>
#include <vector>
#include "dut_probe/protocol/status_sample.hpp"
#include "dut_probe/session/telemetry_summary.hpp"

using dutprobe::StatusSample;
using dutprobe::Summarize;

TEST(TelemetrySummary, EmptyHasNoSummary) {
  EXPECT_FALSE(Summarize({}).has_value());
}

TEST(TelemetrySummary, MeanMaxMin) {
  std::vector<StatusSample> samples{
      {-11.0, 4400.0, 0.1},
      {-12.0, 4500.0, 0.2},
      {-10.0, 4300.0, 0.3},
  };
  auto summary = Summarize(samples);
  ASSERT_TRUE(summary.has_value());
  EXPECT_EQ(summary->count, 3u);
  EXPECT_DOUBLE_EQ(summary->milliamps.mean, -11.0);
  EXPECT_DOUBLE_EQ(summary->milliamps.max, -10.0);
  EXPECT_DOUBLE_EQ(summary->milliamps.min, -12.0);
  EXPECT_DOUBLE_EQ(summary->millivolts.mean, 4400.0);
  EXPECT_DOUBLE_EQ(summary->millivolts.max, 4500.0);
  EXPECT_DOUBLE_EQ(summary->millivolts.min, 4300.0);
}

TEST(TelemetrySummary, SingleSample) {
  std::vector<StatusSample> samples{{1.5, 3.0, 0.0}};
  auto summary = Summarize(samples);
  ASSERT_TRUE(summary.has_value());
  EXPECT_DOUBLE_EQ(summary->milliamps.mean, 1.5);
  EXPECT_DOUBLE_EQ(summary->millivolts.min, 3.0);
}

TEST(TelemetrySummary, FormatQuantityGroupsThousands) {
  using dutprobe::FormatQuantity;
  EXPECT_EQ(FormatQuantity(4448.9), "4,448.90");
  EXPECT_EQ(FormatQuantity(-11.1), "-11.10");
  EXPECT_EQ(FormatQuantity(1234567.891), "1,234,567.89");
  EXPECT_EQ(FormatQuantity(999.0), "999.00");
  EXPECT_EQ(FormatQuantity(1500.0, 0), "1,500");
  EXPECT_EQ(FormatQuantity(300.0, 0), "300");
  EXPECT_EQ(FormatQuantity(-1000.0, 0), "-1,000");
}
