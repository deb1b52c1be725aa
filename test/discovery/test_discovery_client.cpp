#include <gtest/gtest.h>
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "device_simulator.hpp"
#include "dut_probe/common/byte_helpers.hpp"
#include "dut_probe/common/error_code.hpp"
#include "dut_probe/common/network_options.hpp"
#include "dut_probe/discovery/discovery_client.hpp"
#include "dut_probe/protocol/discovery_record.hpp"
#include "dut_probe/transport/datagram.hpp"

using dutprobe::Datagram;
using dutprobe::DeviceSimulator;
using dutprobe::DiscoveryClient;
using dutprobe::DiscoveryRecord;
using dutprobe::ErrorCode;
using dutprobe::NetworkOptions;
using dutprobe::SortRecords;
using dutprobe::ToBytes;

TEST(DiscoveryClient, ParseResponsesDropsInvalid) {
  std::vector<Datagram> datagrams{
      {"10.0.0.1", 6060, ToBytes("ID;MODEL=M002;SERIAL=SN1;")},
      {"10.0.0.2", 6060, ToBytes("ID;MODEL=M=1;")},
      {"10.0.0.3", 6060, ToBytes("ID;MODEL=M001;")},
      {"10.0.0.4", 6060, ToBytes("TEST;RESULT=STARTED;")},
      {"10.0.0.5", 6060, ToBytes("")},
      {"10.0.0.6", 6061, ToBytes("ID;MODEL=M001;SERIAL=SN9;")},
  };

  auto devices = DiscoveryClient::ParseResponses(datagrams);
  ASSERT_EQ(devices.size(), 2u);
  EXPECT_EQ(devices[0], (DiscoveryRecord{"10.0.0.1", 6060, "M002", "SN1"}));
  EXPECT_EQ(devices[1], (DiscoveryRecord{"10.0.0.6", 6061, "M001", "SN9"}));

  SortRecords(devices);
  EXPECT_EQ(devices[0].model, "M001");
}

TEST(DiscoveryClient, ParseResponsesEmpty) {
  EXPECT_TRUE(DiscoveryClient::ParseResponses({}).empty());
}

TEST(DiscoveryClient, FindsLoopbackDevice) {
  DeviceSimulator device({"M001", "SN0123457"});
  ASSERT_TRUE(device.Open("127.0.0.1", 0).ok());
  device.Start();

  DiscoveryClient client;
  auto devices = client.Discover(device.GetEndpoint(), 300);
  device.Stop();

  ASSERT_TRUE(devices.has_value());
  ASSERT_EQ(devices->size(), 1u);
  EXPECT_EQ((*devices)[0].model, "M001");
  EXPECT_EQ((*devices)[0].serial, "SN0123457");
  EXPECT_EQ((*devices)[0].address, "127.0.0.1");
  EXPECT_EQ((*devices)[0].port, device.GetEndpoint().port);

  auto received = device.GetReceived();
  ASSERT_EQ(received.size(), 1u);
  EXPECT_EQ(received[0], "ID;");
}

TEST(DiscoveryClient, UsesConfiguredGroup) {
  DeviceSimulator device({"M003", "SN42"});
  ASSERT_TRUE(device.Open("127.0.0.1", 0).ok());
  device.Start();

  NetworkOptions options;
  options.multicast = device.GetEndpoint();
  DiscoveryClient client(options);
  auto devices = client.Discover(300);
  device.Stop();

  ASSERT_TRUE(devices.has_value());
  ASSERT_EQ(devices->size(), 1u);
  EXPECT_EQ((*devices)[0].serial, "SN42");
}

TEST(DiscoveryClient, DefaultIdentity) {
  DeviceSimulator device;
  ASSERT_TRUE(device.Open("127.0.0.1", 0).ok());
  device.Start();

  DiscoveryClient client;
  auto devices = client.Discover(device.GetEndpoint(), 200);
  device.Stop();

  ASSERT_TRUE(devices.has_value());
  ASSERT_EQ(devices->size(), 1u);
  EXPECT_EQ((*devices)[0].model, "M001");
  EXPECT_EQ((*devices)[0].serial, "SN0123456");
}

TEST(DiscoveryClient, SilentDeviceGivesEmptyList) {
  DeviceSimulator device;
  ASSERT_TRUE(device.Open("127.0.0.1", 0).ok());
  device.SetIdReply(std::nullopt);
  device.Start();

  DiscoveryClient client;
  auto started = std::chrono::steady_clock::now();
  auto devices = client.Discover(device.GetEndpoint(), 200);
  auto elapsed = std::chrono::steady_clock::now() - started;
  device.Stop();

  ASSERT_TRUE(devices.has_value());
  EXPECT_TRUE(devices->empty());
  // Whole window waited out, allowing for timer granularity
  EXPECT_GE(elapsed, std::chrono::milliseconds(190));
  EXPECT_LT(elapsed, std::chrono::milliseconds(2000));
}

TEST(DiscoveryClient, GarbageReplyIsDropped) {
  DeviceSimulator device;
  ASSERT_TRUE(device.Open("127.0.0.1", 0).ok());
  device.SetIdReply(std::string("ID;MODEL;"));
  device.Start();

  DiscoveryClient client;
  auto devices = client.Discover(device.GetEndpoint(), 200);
  device.Stop();

  ASSERT_TRUE(devices.has_value());
  EXPECT_TRUE(devices->empty());
}

TEST(DiscoveryClient, TransportFailureIsReturned) {
  DiscoveryClient client;
  auto devices = client.Discover({"not an address!", 31115}, 10);
  ASSERT_FALSE(devices.has_value());
  EXPECT_EQ(devices.error().code, ErrorCode::kInvalidEndpoint);
}
