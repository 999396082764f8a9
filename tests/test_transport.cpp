// Tests for the UDP transport over loopback.
#include "lanlight/event_loop.h"
#include "lanlight/transport.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

lanlight::TransportOptions LoopbackOptions() {
  lanlight::TransportOptions options;
  options.bind_address = "127.0.0.1";
  return options;
}

}  // namespace

TEST(UdpTransportTest, DeliversDatagramsThroughLoop) {
  lanlight::SelectLoop loop;
  lanlight::UdpTransport receiver(loop);
  lanlight::UdpTransport sender(loop);
  lanlight::Error error;
  ASSERT_TRUE(receiver.Open(LoopbackOptions(), &error)) << error.message;
  ASSERT_TRUE(sender.Open(LoopbackOptions(), &error)) << error.message;
  ASSERT_NE(receiver.local_port(), 0);

  std::vector<std::vector<uint8_t>> received;
  lanlight::Endpoint from;
  receiver.SetReceiveHandler(
      [&](const uint8_t* data, size_t length, const lanlight::Endpoint& source) {
        received.emplace_back(data, data + length);
        from = source;
      });

  lanlight::Endpoint to;
  to.address = "127.0.0.1";
  to.port = receiver.local_port();
  ASSERT_TRUE(sender.Send({1, 2, 3}, to, &error)) << error.message;
  ASSERT_TRUE(sender.Send({4}, to, &error)) << error.message;

  for (int i = 0; i < 50 && received.size() < 2; ++i) {
    loop.RunOnce(std::chrono::milliseconds(20));
  }
  ASSERT_EQ(received.size(), 2u);
  EXPECT_EQ(received[0], (std::vector<uint8_t>{1, 2, 3}));
  EXPECT_EQ(received[1], (std::vector<uint8_t>{4}));
  EXPECT_EQ(from.address, "127.0.0.1");
  EXPECT_EQ(from.port, sender.local_port());
}

TEST(UdpTransportTest, SendAfterCloseFails) {
  lanlight::SelectLoop loop;
  lanlight::UdpTransport transport(loop);
  ASSERT_TRUE(transport.Open(LoopbackOptions()));
  transport.Close();
  transport.Close();
  EXPECT_FALSE(transport.is_open());

  lanlight::Endpoint to;
  to.address = "127.0.0.1";
  lanlight::Error error;
  EXPECT_FALSE(transport.Send({1}, to, &error));
  EXPECT_EQ(error.code, lanlight::ErrorCode::kTransport);
}

TEST(UdpTransportTest, RejectsAddressFamilyMismatch) {
  lanlight::SelectLoop loop;
  lanlight::UdpTransport transport(loop);
  ASSERT_TRUE(transport.Open(LoopbackOptions()));

  lanlight::Endpoint to;
  to.address = "::1";
  lanlight::Error error;
  EXPECT_FALSE(transport.Send({1}, to, &error));
  EXPECT_EQ(error.code, lanlight::ErrorCode::kTransport);
  EXPECT_NE(error.message.find("family"), std::string::npos);
}

TEST(UdpTransportTest, InvalidBindAddressFails) {
  lanlight::SelectLoop loop;
  lanlight::UdpTransport transport(loop);
  lanlight::TransportOptions options;
  options.bind_address = "999.1.1.1";
  lanlight::Error error;
  EXPECT_FALSE(transport.Open(options, &error));
  EXPECT_EQ(error.code, lanlight::ErrorCode::kTransport);
  EXPECT_FALSE(transport.is_open());
}

TEST(UdpTransportTest, FactoryReportsOpenFailure) {
  lanlight::SelectLoop loop;
  lanlight::TransportOptions options;
  options.bind_address = "not-an-address";
  lanlight::Error error;
  auto transport = lanlight::MakeUdpTransportFactory()(loop, options, &error);
  EXPECT_EQ(transport, nullptr);
  EXPECT_EQ(error.code, lanlight::ErrorCode::kTransport);
}
