// Tests for request tracking, retries and dispatch on a device session.
#include "lanlight/lanlight.h"
#include "lanlight/test_hooks.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using lanlight::Device;
using lanlight::Message;

const lanlight::MacAddress kMac = {0xd0, 0x73, 0xd5, 0x01, 0x02, 0x03};
constexpr uint32_t kSource = 0x1234;
constexpr size_t kDiscoveryTransport = 0;
constexpr size_t kSessionTransport = 1;

lanlight::Endpoint From(const std::string& address) {
  lanlight::Endpoint endpoint;
  endpoint.address = address;
  endpoint.port = lanlight::kDefaultPort;
  return endpoint;
}

struct Recorder {
  int calls = 0;
  std::vector<std::optional<Message>> replies;

  Device::ResponseCallback callback() {
    return [this](Device&, const std::optional<Message>& message) {
      calls++;
      replies.push_back(message);
    };
  }
};

class DeviceSessionTest : public ::testing::Test {
 protected:
  void SetUp() override { Discover(); }

  void Discover() {
    config.source_id = kSource;
    config.discovery_interval = std::chrono::milliseconds(60000);
    config.log_callback = [this](const std::string& line) { logs.push_back(line); };
    discovery = std::make_unique<lanlight::Discovery>(loop, registry, config,
                                                      network.factory());
    ASSERT_TRUE(discovery->Start()) << discovery->GetLastError();
    loop.RunPending();
    lanlight::StateService service;
    service.port = lanlight::kDefaultPort;
    ASSERT_TRUE(network.Deliver(kDiscoveryTransport,
                                lanlight::test::BuildDeviceFrame(kMac, kSource, 0, service),
                                From("192.168.1.50")));
    ASSERT_EQ(registry.registered.size(), 1u);
    device = registry.registered[0];
  }

  void Reply(uint8_t sequence, const lanlight::Payload& payload,
             uint32_t source = kSource, const std::string& address = "192.168.1.50") {
    network.Deliver(kSessionTransport,
                    lanlight::test::BuildDeviceFrame(kMac, source, sequence, payload),
                    From(address));
  }

  size_t SentCount() const { return network.sent(kSessionTransport).size(); }
  Message Sent(size_t n) const { return network.SentMessage(kSessionTransport, n); }

  lanlight::test::ManualLoop loop;
  lanlight::test::FakeNetwork network;
  lanlight::test::RecordingRegistry registry;
  lanlight::Config config;
  std::vector<std::string> logs;
  std::unique_ptr<lanlight::Discovery> discovery;
  std::shared_ptr<Device> device;
};

}  // namespace

TEST_F(DeviceSessionTest, QueryAsksForResponseAndResolvesOnce) {
  Recorder recorder;
  ASSERT_TRUE(device->GetLabel(recorder.callback()));
  ASSERT_EQ(SentCount(), 1u);

  const Message sent = Sent(0);
  EXPECT_TRUE(sent.header.res_required);
  EXPECT_FALSE(sent.header.ack_required);
  EXPECT_FALSE(sent.header.tagged);
  EXPECT_EQ(sent.header.target, kMac);
  EXPECT_EQ(sent.header.source, kSource);
  EXPECT_EQ(sent.header.sequence, 0);
  EXPECT_TRUE(std::holds_alternative<lanlight::GetLabel>(sent.payload));
  EXPECT_EQ(network.sent(kSessionTransport)[0].to, From("192.168.1.50"));
  EXPECT_EQ(device->pending_count(), 1u);

  Reply(0, lanlight::StateLabel{"Kitchen"});
  // Delivery is always deferred to the loop.
  EXPECT_EQ(recorder.calls, 0);
  loop.RunPending();
  ASSERT_EQ(recorder.calls, 1);
  ASSERT_TRUE(recorder.replies[0].has_value());
  EXPECT_EQ(std::get<lanlight::StateLabel>(recorder.replies[0]->payload).label, "Kitchen");
  EXPECT_EQ(device->pending_count(), 0u);
  ASSERT_TRUE(device->state().label.has_value());
  EXPECT_EQ(*device->state().label, "Kitchen");

  Reply(0, lanlight::StateLabel{"Kitchen"});
  loop.RunPending();
  EXPECT_EQ(recorder.calls, 1);
}

TEST_F(DeviceSessionTest, RetransmitsThenReportsNoResponse) {
  Recorder recorder;
  ASSERT_TRUE(device->GetPower(recorder.callback()));
  EXPECT_EQ(SentCount(), 1u);

  loop.Advance(std::chrono::milliseconds(500));
  EXPECT_EQ(SentCount(), 2u);
  loop.Advance(std::chrono::milliseconds(500));
  EXPECT_EQ(SentCount(), 3u);
  EXPECT_EQ(recorder.calls, 0);
  // Retransmissions resend the first frame unchanged.
  EXPECT_EQ(network.sent(kSessionTransport)[0].data,
            network.sent(kSessionTransport)[2].data);

  loop.Advance(std::chrono::milliseconds(500));
  EXPECT_EQ(SentCount(), 3u);
  ASSERT_EQ(recorder.calls, 1);
  EXPECT_FALSE(recorder.replies[0].has_value());
  EXPECT_EQ(device->pending_count(), 0u);
  EXPECT_EQ(discovery->GetMetrics().requests_expired, 1u);
  EXPECT_TRUE(std::any_of(logs.begin(), logs.end(), [](const std::string& line) {
    return line.find("GetPower seq 0") != std::string::npos &&
           line.find("no response") != std::string::npos;
  }));

  loop.Advance(std::chrono::milliseconds(5000));
  EXPECT_EQ(recorder.calls, 1);
}

TEST_F(DeviceSessionTest, PerRequestRetryOverride) {
  Recorder recorder;
  lanlight::RequestOptions options;
  options.max_retries = 0;
  options.timeout = std::chrono::milliseconds(100);
  ASSERT_TRUE(device->SendRequest(lanlight::LightGet{}, options, recorder.callback()));

  loop.Advance(std::chrono::milliseconds(100));
  EXPECT_EQ(SentCount(), 1u);
  ASSERT_EQ(recorder.calls, 1);
  EXPECT_FALSE(recorder.replies[0].has_value());
}

TEST_F(DeviceSessionTest, ReplyBeforeTimeoutStopsRetries) {
  Recorder recorder;
  ASSERT_TRUE(device->GetPower(recorder.callback()));
  loop.Advance(std::chrono::milliseconds(500));
  ASSERT_EQ(SentCount(), 2u);

  Reply(0, lanlight::StatePower{lanlight::kPowerOn});
  loop.Advance(std::chrono::milliseconds(5000));
  EXPECT_EQ(SentCount(), 2u);
  ASSERT_EQ(recorder.calls, 1);
  EXPECT_TRUE(recorder.replies[0].has_value());
}

TEST_F(DeviceSessionTest, FireAndForgetWaveformTracksNothing) {
  lanlight::LightSetWaveform waveform;
  waveform.transient = true;
  waveform.color = {0, 65535, 65535, 3500};
  waveform.period = 1000;
  waveform.cycles = 3.0f;
  waveform.waveform = lanlight::Waveform::kSine;
  ASSERT_TRUE(device->SetWaveform(waveform));

  ASSERT_EQ(SentCount(), 1u);
  const Message sent = Sent(0);
  EXPECT_FALSE(sent.header.ack_required);
  EXPECT_FALSE(sent.header.res_required);
  const auto& decoded = std::get<lanlight::LightSetWaveform>(sent.payload);
  EXPECT_FLOAT_EQ(decoded.cycles, 3.0f);
  EXPECT_EQ(decoded.waveform, lanlight::Waveform::kSine);
  EXPECT_EQ(device->pending_count(), 0u);
  EXPECT_TRUE(lanlight::test::PendingSequences(*device).empty());

  loop.Advance(std::chrono::milliseconds(5000));
  EXPECT_EQ(SentCount(), 1u);
}

TEST_F(DeviceSessionTest, SetWithCallbackWaitsForAck) {
  Recorder recorder;
  ASSERT_TRUE(device->SetPower(true, recorder.callback()));
  const Message sent = Sent(0);
  EXPECT_TRUE(sent.header.ack_required);
  EXPECT_FALSE(sent.header.res_required);
  EXPECT_EQ(std::get<lanlight::SetPower>(sent.payload).level, lanlight::kPowerOn);
  EXPECT_FALSE(device->state().power_level.has_value());

  Reply(0, lanlight::Acknowledgement{});
  loop.RunPending();
  ASSERT_EQ(recorder.calls, 1);
  ASSERT_TRUE(recorder.replies[0].has_value());
  EXPECT_TRUE(std::holds_alternative<lanlight::Acknowledgement>(recorder.replies[0]->payload));
  ASSERT_TRUE(device->state().power_level.has_value());
  EXPECT_EQ(*device->state().power_level, lanlight::kPowerOn);
}

TEST_F(DeviceSessionTest, PowerWithDurationUsesLightSetPower) {
  ASSERT_TRUE(device->SetPower(false, nullptr, 750));
  const Message sent = Sent(0);
  const auto& payload = std::get<lanlight::LightSetPower>(sent.payload);
  EXPECT_EQ(payload.level, lanlight::kPowerOff);
  EXPECT_EQ(payload.duration, 750u);
  EXPECT_FALSE(sent.header.ack_required);
  ASSERT_TRUE(device->state().power_level.has_value());
  EXPECT_EQ(*device->state().power_level, lanlight::kPowerOff);
}

TEST_F(DeviceSessionTest, AckDoesNotResolveResponseRequest) {
  Recorder recorder;
  lanlight::RequestOptions options;
  options.mode = lanlight::ReplyMode::kAckAndResponse;
  ASSERT_TRUE(device->SendRequest(lanlight::LightGet{}, options, recorder.callback()));
  const Message sent = Sent(0);
  EXPECT_TRUE(sent.header.ack_required);
  EXPECT_TRUE(sent.header.res_required);

  Reply(0, lanlight::Acknowledgement{});
  loop.RunPending();
  EXPECT_EQ(recorder.calls, 0);
  EXPECT_EQ(device->pending_count(), 1u);

  lanlight::LightState state;
  state.label = "Desk";
  Reply(0, state);
  loop.RunPending();
  ASSERT_EQ(recorder.calls, 1);
  EXPECT_TRUE(std::holds_alternative<lanlight::LightState>(recorder.replies[0]->payload));
}

TEST_F(DeviceSessionTest, MismatchedTypeIsUnsolicited) {
  std::vector<Message> unsolicited;
  device->SetUnsolicitedCallback(
      [&](Device&, const Message& message) { unsolicited.push_back(message); });
  Recorder recorder;
  ASSERT_TRUE(device->GetLabel(recorder.callback()));

  Reply(0, lanlight::StatePower{lanlight::kPowerOn});
  loop.RunPending();
  EXPECT_EQ(recorder.calls, 0);
  ASSERT_EQ(unsolicited.size(), 1u);
  EXPECT_TRUE(std::holds_alternative<lanlight::StatePower>(unsolicited[0].payload));
  EXPECT_EQ(device->pending_count(), 1u);

  Reply(0, lanlight::StateLabel{"Hall"});
  loop.RunPending();
  EXPECT_EQ(recorder.calls, 1);
  EXPECT_EQ(unsolicited.size(), 1u);
}

TEST_F(DeviceSessionTest, AcceptedTypesExtendDefaultResponse) {
  Recorder recorder;
  lanlight::RequestOptions options;
  options.accepted_types = {static_cast<uint16_t>(lanlight::MessageType::kStatePower)};
  ASSERT_TRUE(device->SendRequest(lanlight::GetLabel{}, options, recorder.callback()));

  Reply(0, lanlight::StatePower{lanlight::kPowerOn});
  loop.RunPending();
  EXPECT_EQ(recorder.calls, 1);
}

TEST_F(DeviceSessionTest, UnknownRequestAcceptsAnyReply) {
  Recorder recorder;
  lanlight::UnknownPayload custom;
  custom.type = 4000;
  lanlight::RequestOptions options;
  options.mode = lanlight::ReplyMode::kResponse;
  ASSERT_TRUE(device->SendRequest(custom, options, recorder.callback()));

  Reply(0, lanlight::Acknowledgement{});
  loop.RunPending();
  EXPECT_EQ(recorder.calls, 0);

  lanlight::UnknownPayload answer;
  answer.type = 4001;
  answer.bytes = {9};
  Reply(0, answer);
  loop.RunPending();
  ASSERT_EQ(recorder.calls, 1);
  EXPECT_EQ(recorder.replies[0]->type(), 4001);
}

TEST_F(DeviceSessionTest, ForeignSourceNeverMatches) {
  std::vector<Message> unsolicited;
  device->SetUnsolicitedCallback(
      [&](Device&, const Message& message) { unsolicited.push_back(message); });
  Recorder recorder;
  ASSERT_TRUE(device->GetLabel(recorder.callback()));

  Reply(0, lanlight::StateLabel{"Other"}, 0x9999);
  loop.RunPending();
  EXPECT_EQ(recorder.calls, 0);
  EXPECT_EQ(unsolicited.size(), 1u);
  EXPECT_EQ(device->pending_count(), 1u);
}

TEST_F(DeviceSessionTest, UnmatchedAckIsDropped) {
  std::vector<Message> unsolicited;
  device->SetUnsolicitedCallback(
      [&](Device&, const Message& message) { unsolicited.push_back(message); });
  Reply(42, lanlight::Acknowledgement{});
  loop.RunPending();
  EXPECT_TRUE(unsolicited.empty());
}

TEST_F(DeviceSessionTest, SequenceWrapExpiresOldestRequest) {
  Recorder oldest;
  ASSERT_TRUE(device->GetPower(oldest.callback()));
  for (int i = 1; i < 256; ++i) {
    ASSERT_TRUE(device->GetPower());
  }
  EXPECT_EQ(device->pending_count(), 256u);

  ASSERT_TRUE(device->GetPower());
  EXPECT_EQ(device->pending_count(), 256u);
  EXPECT_EQ(Sent(256).header.sequence, 0);
  EXPECT_EQ(discovery->GetMetrics().requests_expired, 1u);

  const auto sequences = lanlight::test::PendingSequences(*device);
  EXPECT_EQ(sequences.size(), 256u);

  loop.RunPending();
  ASSERT_EQ(oldest.calls, 1);
  EXPECT_FALSE(oldest.replies[0].has_value());
}

TEST_F(DeviceSessionTest, EncodingErrorConsumesNoSequence) {
  lanlight::Error error;
  Recorder recorder;
  EXPECT_FALSE(device->SendRequest(lanlight::SetLabel{std::string(40, 'x')}, {},
                                   recorder.callback(), &error));
  EXPECT_EQ(error.code, lanlight::ErrorCode::kEncoding);
  EXPECT_EQ(SentCount(), 0u);
  EXPECT_EQ(device->pending_count(), 0u);

  ASSERT_TRUE(device->GetLabel());
  EXPECT_EQ(Sent(0).header.sequence, 0);
  loop.RunPending();
  EXPECT_EQ(recorder.calls, 0);
}

TEST_F(DeviceSessionTest, SendFailureReportsTransportError) {
  network.set_fail_sends(true);
  lanlight::Error error;
  Recorder recorder;
  EXPECT_FALSE(device->SendRequest(lanlight::GetLabel{}, {}, recorder.callback(), &error));
  EXPECT_EQ(error.code, lanlight::ErrorCode::kTransport);
  EXPECT_EQ(device->pending_count(), 0u);
  EXPECT_TRUE(device->alive());
  EXPECT_EQ(discovery->GetMetrics().send_errors, 1u);

  network.set_fail_sends(false);
  ASSERT_TRUE(device->GetLabel());
  EXPECT_EQ(Sent(0).header.sequence, 0);
  loop.RunPending();
  EXPECT_EQ(recorder.calls, 0);
}

TEST_F(DeviceSessionTest, ModeNoneWithCallbackReportsNothing) {
  Recorder recorder;
  lanlight::RequestOptions options;
  options.mode = lanlight::ReplyMode::kNone;
  ASSERT_TRUE(device->SendRequest(lanlight::LightGet{}, options, recorder.callback()));
  const Message sent = Sent(0);
  EXPECT_FALSE(sent.header.ack_required);
  EXPECT_FALSE(sent.header.res_required);
  EXPECT_EQ(device->pending_count(), 0u);
  EXPECT_EQ(recorder.calls, 0);

  loop.RunPending();
  ASSERT_EQ(recorder.calls, 1);
  EXPECT_FALSE(recorder.replies[0].has_value());
}

TEST_F(DeviceSessionTest, CloseFailsPendingOnceAndIsIdempotent) {
  Recorder label;
  Recorder power;
  ASSERT_TRUE(device->GetLabel(label.callback()));
  ASSERT_TRUE(device->GetPower(power.callback()));

  device->Close();
  device->Close();
  EXPECT_FALSE(device->alive());
  EXPECT_FALSE(network.is_open(kSessionTransport));
  EXPECT_EQ(device->pending_count(), 0u);

  loop.Advance(std::chrono::milliseconds(5000));
  ASSERT_EQ(label.calls, 1);
  ASSERT_EQ(power.calls, 1);
  EXPECT_FALSE(label.replies[0].has_value());
  EXPECT_FALSE(power.replies[0].has_value());

  lanlight::Error error;
  EXPECT_FALSE(device->SendRequest(lanlight::GetLabel{}, {}, nullptr, &error));
  EXPECT_EQ(error.code, lanlight::ErrorCode::kTransport);
  EXPECT_FALSE(device->GetPower());
}

TEST_F(DeviceSessionTest, MalformedFrameLeavesPendingIntact) {
  Recorder recorder;
  ASSERT_TRUE(device->GetLabel(recorder.callback()));

  auto frame = lanlight::test::BuildDeviceFrame(kMac, kSource, 0,
                                                lanlight::StateLabel{"Kitchen"});
  frame.resize(frame.size() - 5);
  network.Deliver(kSessionTransport, frame, From("192.168.1.50"));
  loop.RunPending();
  EXPECT_EQ(recorder.calls, 0);
  EXPECT_EQ(device->pending_count(), 1u);
  EXPECT_EQ(discovery->GetMetrics().decode_errors, 1u);
  EXPECT_TRUE(std::any_of(logs.begin(), logs.end(), [](const std::string& line) {
    return line.find("dropping frame") != std::string::npos;
  }));

  Reply(0, lanlight::StateLabel{"Kitchen"});
  loop.RunPending();
  EXPECT_EQ(recorder.calls, 1);
}

TEST_F(DeviceSessionTest, CallbackExceptionIsContained) {
  ASSERT_TRUE(device->GetLabel([](Device&, const std::optional<Message>&) {
    throw std::runtime_error("boom");
  }));
  Reply(0, lanlight::StateLabel{"Kitchen"});
  EXPECT_NO_THROW(loop.RunPending());
  EXPECT_EQ(discovery->GetMetrics().callback_exceptions, 1u);
  EXPECT_TRUE(std::any_of(logs.begin(), logs.end(), [](const std::string& line) {
    return line.find("ResponseCallback") != std::string::npos &&
           line.find("boom") != std::string::npos;
  }));
  EXPECT_TRUE(device->alive());
}

TEST_F(DeviceSessionTest, UnsolicitedStateUpdatesCache) {
  int unsolicited = 0;
  device->SetUnsolicitedCallback([&](Device&, const Message&) { unsolicited++; });

  lanlight::LightState state;
  state.color = {1000, 2000, 3000, 4000};
  state.power_level = lanlight::kPowerOn;
  state.label = "Porch";
  Reply(200, state);
  loop.RunPending();

  EXPECT_EQ(unsolicited, 1);
  ASSERT_TRUE(device->state().color.has_value());
  EXPECT_EQ(*device->state().color, state.color);
  EXPECT_EQ(*device->state().label, "Porch");
  EXPECT_EQ(*device->state().power_level, lanlight::kPowerOn);
}

TEST_F(DeviceSessionTest, MultiZoneRepliesFillZoneCache) {
  lanlight::StateMultiZone zones;
  zones.count = 10;
  zones.index = 8;
  zones.colors[0] = {100, 0, 0, 3500};
  zones.colors[1] = {200, 0, 0, 3500};
  Reply(5, zones);

  ASSERT_EQ(device->state().zones.size(), 10u);
  EXPECT_EQ(device->state().zones[8].hue, 100);
  EXPECT_EQ(device->state().zones[9].hue, 200);

  const lanlight::Hsbk red = {0, 65535, 65535, 3500};
  ASSERT_TRUE(device->SetColorZones(0, 3, red));
  EXPECT_EQ(device->state().zones[3], red);
  EXPECT_EQ(device->state().zones[4].hue, 0);
}

TEST_F(DeviceSessionTest, ColorZonesQueryAcceptsEitherZoneReply) {
  Recorder recorder;
  ASSERT_TRUE(device->GetColorZones(0, 7, recorder.callback()));
  const auto& query = std::get<lanlight::GetColorZones>(Sent(0).payload);
  EXPECT_EQ(query.start_index, 0);
  EXPECT_EQ(query.end_index, 7);

  lanlight::StateZone zone;
  zone.count = 1;
  Reply(0, zone);
  loop.RunPending();
  EXPECT_EQ(recorder.calls, 1);
}

TEST_F(DeviceSessionTest, LabelIsTruncatedToThirtyTwoBytes) {
  ASSERT_TRUE(device->SetLabel(std::string(40, 'a')));
  EXPECT_EQ(std::get<lanlight::SetLabel>(Sent(0).payload).label, std::string(32, 'a'));
  EXPECT_EQ(*device->state().label, std::string(32, 'a'));
}

TEST_F(DeviceSessionTest, EchoReturnsPayload) {
  Recorder recorder;
  ASSERT_TRUE(device->Echo({1, 2, 3}, recorder.callback()));
  lanlight::EchoResponse response;
  response.data = {1, 2, 3};
  Reply(0, response);
  loop.RunPending();
  ASSERT_EQ(recorder.calls, 1);
  const auto& echoed = std::get<lanlight::EchoResponse>(recorder.replies[0]->payload);
  EXPECT_EQ(echoed.data[0], 1);
  EXPECT_EQ(echoed.data[2], 3);
}

TEST_F(DeviceSessionTest, TrafficUpdatesEndpointAndLastSeen) {
  loop.Advance(std::chrono::milliseconds(2000));
  Reply(9, lanlight::StatePower{lanlight::kPowerOff}, kSource, "192.168.1.77");
  EXPECT_EQ(device->endpoint().address, "192.168.1.77");
  EXPECT_EQ(device->last_seen(), loop.Now());

  ASSERT_TRUE(device->GetLabel());
  EXPECT_EQ(network.sent(kSessionTransport)[0].to.address, "192.168.1.77");
}

TEST_F(DeviceSessionTest, ForeignTargetDoesNotMoveEndpoint) {
  loop.Advance(std::chrono::milliseconds(2000));
  const auto seen = device->last_seen();
  const lanlight::MacAddress other = {0xd0, 0x73, 0xd5, 0x09, 0x09, 0x09};
  network.Deliver(kSessionTransport,
                  lanlight::test::BuildDeviceFrame(other, kSource, 9,
                                                   lanlight::StatePower{lanlight::kPowerOn}),
                  From("192.168.1.99"));
  EXPECT_EQ(device->endpoint().address, "192.168.1.50");
  EXPECT_EQ(device->last_seen(), seen);

  ASSERT_TRUE(device->GetLabel());
  EXPECT_EQ(network.sent(kSessionTransport)[0].to.address, "192.168.1.50");
}

TEST_F(DeviceSessionTest, LabelTruncationKeepsUtf8Intact) {
  const std::string label = std::string(31, 'a') + "\xc3\xa9" + "b";
  ASSERT_TRUE(device->SetLabel(label));
  EXPECT_EQ(std::get<lanlight::SetLabel>(Sent(0).payload).label, std::string(31, 'a'));
  EXPECT_EQ(*device->state().label, std::string(31, 'a'));

  const std::string fits = std::string(30, 'a') + "\xc3\xa9";
  ASSERT_TRUE(device->SetLabel(fits + "zz"));
  EXPECT_EQ(std::get<lanlight::SetLabel>(Sent(1).payload).label, fits);
}

TEST_F(DeviceSessionTest, UntrackedSetsDoNotConsumeSequences) {
  Recorder label;
  ASSERT_TRUE(device->GetLabel(label.callback()));
  for (int i = 0; i < 255; ++i) {
    ASSERT_TRUE(device->SetPower(true));
  }
  ASSERT_TRUE(device->GetPower());

  EXPECT_EQ(device->pending_count(), 2u);
  EXPECT_EQ(discovery->GetMetrics().requests_expired, 0u);
  ASSERT_EQ(SentCount(), 257u);
  EXPECT_EQ(Sent(0).header.sequence, 0);
  EXPECT_EQ(Sent(1).header.sequence, 1);
  EXPECT_EQ(Sent(255).header.sequence, 1);
  EXPECT_EQ(Sent(256).header.sequence, 1);
  EXPECT_TRUE(std::holds_alternative<lanlight::GetPower>(Sent(256).payload));

  loop.RunPending();
  EXPECT_EQ(label.calls, 0);

  Reply(0, lanlight::StateLabel{"Hall"});
  loop.RunPending();
  EXPECT_EQ(label.calls, 1);
}

TEST_F(DeviceSessionTest, AllocationSkipsOutstandingSequences) {
  Recorder label;
  ASSERT_TRUE(device->GetLabel(label.callback()));
  for (int i = 1; i < 256; ++i) {
    ASSERT_TRUE(device->GetPower());
    Reply(static_cast<uint8_t>(i), lanlight::StatePower{lanlight::kPowerOn});
  }
  EXPECT_EQ(device->pending_count(), 1u);

  // The counter has wrapped onto the label request, which is still waiting.
  ASSERT_TRUE(device->GetPower());
  EXPECT_EQ(Sent(256).header.sequence, 1);
  EXPECT_EQ(device->pending_count(), 2u);
  EXPECT_EQ(discovery->GetMetrics().requests_expired, 0u);
  loop.RunPending();
  EXPECT_EQ(label.calls, 0);
}

TEST_F(DeviceSessionTest, FireAndForgetRepeatsAtInterval) {
  lanlight::RequestOptions options;
  options.mode = lanlight::ReplyMode::kNone;
  options.repeats = 3;
  const auto sent_before = discovery->GetMetrics().packets_sent;
  ASSERT_TRUE(device->SendRequest(lanlight::LightSetColor{{100, 200, 300, 4000}, 0},
                                  options, nullptr));
  ASSERT_EQ(SentCount(), 1u);

  loop.Advance(std::chrono::milliseconds(49));
  EXPECT_EQ(SentCount(), 1u);
  loop.Advance(std::chrono::milliseconds(1));
  EXPECT_EQ(SentCount(), 2u);
  loop.Advance(std::chrono::milliseconds(50));
  EXPECT_EQ(SentCount(), 3u);
  loop.Advance(std::chrono::milliseconds(1000));
  ASSERT_EQ(SentCount(), 3u);

  const auto& sent = network.sent(kSessionTransport);
  EXPECT_EQ(sent[1].data, sent[0].data);
  EXPECT_EQ(sent[2].data, sent[0].data);
  EXPECT_EQ(device->pending_count(), 0u);
  EXPECT_EQ(discovery->GetMetrics().packets_sent, sent_before + 3);
}

TEST_F(DeviceSessionTest, DefaultFireAndForgetSendsOnce) {
  ASSERT_TRUE(device->SetColor({1, 2, 3, 3500}));
  loop.Advance(std::chrono::milliseconds(1000));
  EXPECT_EQ(SentCount(), 1u);
}

TEST_F(DeviceSessionTest, CloseCancelsPendingRepeats) {
  lanlight::RequestOptions options;
  options.mode = lanlight::ReplyMode::kNone;
  options.repeats = 4;
  ASSERT_TRUE(device->SendRequest(lanlight::SetPower{lanlight::kPowerOn}, options, nullptr));
  loop.Advance(std::chrono::milliseconds(50));
  ASSERT_EQ(SentCount(), 2u);

  device->Close();
  loop.Advance(std::chrono::milliseconds(1000));
  EXPECT_EQ(SentCount(), 2u);
}

TEST_F(DeviceSessionTest, AckStopsRetransmissionOfResponseRequest) {
  Recorder recorder;
  lanlight::RequestOptions options;
  options.mode = lanlight::ReplyMode::kAckAndResponse;
  ASSERT_TRUE(device->SendRequest(lanlight::GetLabel{}, options, recorder.callback()));
  loop.Advance(std::chrono::milliseconds(300));
  Reply(0, lanlight::Acknowledgement{});

  // The ack restarts the wait; nothing is resent after it.
  loop.Advance(std::chrono::milliseconds(499));
  EXPECT_EQ(SentCount(), 1u);
  EXPECT_EQ(recorder.calls, 0);
  loop.Advance(std::chrono::milliseconds(1));
  EXPECT_EQ(SentCount(), 1u);
  ASSERT_EQ(recorder.calls, 1);
  EXPECT_FALSE(recorder.replies[0].has_value());
  EXPECT_EQ(device->pending_count(), 0u);
  EXPECT_TRUE(std::any_of(logs.begin(), logs.end(), [](const std::string& line) {
    return line.find("acked, no response") != std::string::npos;
  }));
}

TEST_F(DeviceSessionTest, ResponseAfterAckStillResolves) {
  Recorder recorder;
  lanlight::RequestOptions options;
  options.mode = lanlight::ReplyMode::kAckAndResponse;
  ASSERT_TRUE(device->SendRequest(lanlight::GetLabel{}, options, recorder.callback()));
  Reply(0, lanlight::Acknowledgement{});
  Reply(0, lanlight::Acknowledgement{});
  loop.Advance(std::chrono::milliseconds(200));
  Reply(0, lanlight::StateLabel{"Hall"});
  loop.RunPending();
  ASSERT_EQ(recorder.calls, 1);
  EXPECT_TRUE(std::holds_alternative<lanlight::StateLabel>(recorder.replies[0]->payload));
  loop.Advance(std::chrono::milliseconds(2000));
  EXPECT_EQ(SentCount(), 1u);
}

TEST_F(DeviceSessionTest, RelayLevelsCachedFromAckAndState) {
  Recorder recorder;
  ASSERT_TRUE(device->SetRelayPower(2, true, recorder.callback()));
  const Message sent = Sent(0);
  EXPECT_TRUE(sent.header.ack_required);
  const auto& request = std::get<lanlight::SetRPower>(sent.payload);
  EXPECT_EQ(request.relay_index, 2);
  EXPECT_EQ(request.level, lanlight::kPowerOn);
  EXPECT_TRUE(device->state().relay_levels.empty());

  Reply(0, lanlight::Acknowledgement{});
  loop.RunPending();
  ASSERT_EQ(recorder.calls, 1);
  EXPECT_EQ(device->state().relay_levels.at(2), lanlight::kPowerOn);

  Recorder query;
  ASSERT_TRUE(device->GetRelayPower(1, query.callback()));
  EXPECT_TRUE(Sent(1).header.res_required);
  EXPECT_EQ(std::get<lanlight::GetRPower>(Sent(1).payload).relay_index, 1);
  Reply(Sent(1).header.sequence, lanlight::StateRPower{1, lanlight::kPowerOff});
  loop.RunPending();
  ASSERT_EQ(query.calls, 1);
  EXPECT_EQ(device->state().relay_levels.at(1), lanlight::kPowerOff);
  EXPECT_EQ(device->state().relay_levels.size(), 2u);
}

TEST_F(DeviceSessionTest, ExtendedZonesFillAndPatchZoneCache) {
  Recorder recorder;
  ASSERT_TRUE(device->GetExtendedColorZones(recorder.callback()));
  EXPECT_TRUE(std::holds_alternative<lanlight::GetExtendedColorZones>(Sent(0).payload));

  lanlight::StateExtendedColorZones zones;
  zones.count = 100;
  zones.index = 82;
  zones.colors.assign(18, lanlight::Hsbk{500, 0, 0, 3500});
  Reply(0, zones);
  loop.RunPending();
  ASSERT_EQ(recorder.calls, 1);
  ASSERT_EQ(device->state().zones.size(), 100u);
  EXPECT_EQ(device->state().zones[81].hue, 0);
  EXPECT_EQ(device->state().zones[82].hue, 500);
  EXPECT_EQ(device->state().zones[99].hue, 500);

  const std::vector<lanlight::Hsbk> patch = {{1, 1, 1, 2700}, {2, 2, 2, 2700}};
  ASSERT_TRUE(device->SetExtendedColorZones(98, patch));
  const auto& sent = std::get<lanlight::SetExtendedColorZones>(Sent(1).payload);
  EXPECT_EQ(sent.zone_index, 98);
  EXPECT_EQ(sent.apply, lanlight::ZoneApply::kApply);
  EXPECT_EQ(sent.colors, patch);
  EXPECT_EQ(device->state().zones[98], patch[0]);
  EXPECT_EQ(device->state().zones[99], patch[1]);
}

TEST_F(DeviceSessionTest, MultiZoneEffectCarriesDirection) {
  ASSERT_TRUE(device->SetMultiZoneEffect(lanlight::MultiZoneEffectType::kMove, 2000, 0, 1));
  const auto& effect = std::get<lanlight::SetMultiZoneEffect>(Sent(0).payload);
  EXPECT_EQ(effect.type, lanlight::MultiZoneEffectType::kMove);
  EXPECT_EQ(effect.speed, 2000u);
  EXPECT_EQ(effect.parameters[1], 1u);
  EXPECT_NE(effect.instance_id, 0u);

  Recorder recorder;
  ASSERT_TRUE(device->GetMultiZoneEffect(recorder.callback()));
  lanlight::StateMultiZoneEffect state;
  state.instance_id = effect.instance_id;
  state.type = lanlight::MultiZoneEffectType::kMove;
  Reply(Sent(1).header.sequence, state);
  loop.RunPending();
  ASSERT_EQ(recorder.calls, 1);
  ASSERT_TRUE(device->state().multizone_effect.has_value());
  EXPECT_EQ(device->state().multizone_effect->instance_id, effect.instance_id);
}

TEST_F(DeviceSessionTest, TileChainAndEffectFillCache) {
  Recorder chain_reply;
  ASSERT_TRUE(device->GetDeviceChain(chain_reply.callback()));
  lanlight::TileStateDeviceChain chain;
  chain.tiles.resize(3);
  chain.tiles[2].user_x = 2.0f;
  Reply(0, chain);
  loop.RunPending();
  ASSERT_EQ(chain_reply.calls, 1);
  ASSERT_EQ(device->state().tiles.size(), 3u);
  EXPECT_FLOAT_EQ(device->state().tiles[2].user_x, 2.0f);

  lanlight::TileSetEffect effect;
  effect.type = lanlight::TileEffectType::kMorph;
  effect.speed = 3000;
  effect.palette = {{0, 65535, 65535, 3500}, {21845, 65535, 65535, 3500}};
  ASSERT_TRUE(device->SetTileEffect(effect));
  const auto& sent = std::get<lanlight::TileSetEffect>(Sent(1).payload);
  EXPECT_NE(sent.instance_id, 0u);
  EXPECT_EQ(sent.palette, effect.palette);

  effect.instance_id = 77;
  ASSERT_TRUE(device->SetTileEffect(effect));
  EXPECT_EQ(std::get<lanlight::TileSetEffect>(Sent(2).payload).instance_id, 77u);

  lanlight::TileStateEffect state;
  state.instance_id = 77;
  state.type = lanlight::TileEffectType::kMorph;
  Reply(40, state);
  ASSERT_TRUE(device->state().tile_effect.has_value());
  EXPECT_EQ(device->state().tile_effect->instance_id, 77u);
}

TEST_F(DeviceSessionTest, TileColorsResolveOnFirstTile) {
  std::vector<Message> unsolicited;
  device->SetUnsolicitedCallback(
      [&](Device&, const Message& message) { unsolicited.push_back(message); });
  Recorder recorder;
  ASSERT_TRUE(device->GetTileColors(0, 2, recorder.callback()));
  const auto& query = std::get<lanlight::TileGet64>(Sent(0).payload);
  EXPECT_EQ(query.length, 2);
  EXPECT_EQ(query.width, 8);

  lanlight::TileState64 first;
  first.tile_index = 0;
  lanlight::TileState64 second;
  second.tile_index = 1;
  Reply(0, first);
  Reply(0, second);
  loop.RunPending();
  ASSERT_EQ(recorder.calls, 1);
  EXPECT_EQ(std::get<lanlight::TileState64>(recorder.replies[0]->payload).tile_index, 0);
  ASSERT_EQ(unsolicited.size(), 1u);
  EXPECT_EQ(std::get<lanlight::TileState64>(unsolicited[0].payload).tile_index, 1);
}

TEST_F(DeviceSessionTest, ButtonConfigConfirmedByAck) {
  const lanlight::Hsbk on = {0, 0, 65535, 4000};
  const lanlight::Hsbk off = {0, 0, 1000, 2700};
  Recorder recorder;
  ASSERT_TRUE(device->SetButtonConfig(150, on, off, recorder.callback()));
  EXPECT_FALSE(device->state().button_config.has_value());

  Reply(0, lanlight::Acknowledgement{});
  loop.RunPending();
  ASSERT_EQ(recorder.calls, 1);
  ASSERT_TRUE(device->state().button_config.has_value());
  EXPECT_EQ(device->state().button_config->haptic_duration_ms, 150);
  EXPECT_EQ(device->state().button_config->backlight_on_color, on);
  EXPECT_EQ(device->state().button_config->backlight_off_color, off);

  Recorder buttons;
  ASSERT_TRUE(device->GetButton(buttons.callback()));
  lanlight::StateButton state;
  state.buttons_count = 1;
  state.buttons[0].actions_count = 1;
  state.buttons[0].actions[0].gesture = lanlight::ButtonGesture::kPress;
  Reply(Sent(1).header.sequence, state);
  loop.RunPending();
  ASSERT_EQ(buttons.calls, 1);
  EXPECT_EQ(std::get<lanlight::StateButton>(buttons.replies[0]->payload)
                .buttons[0].actions[0].gesture,
            lanlight::ButtonGesture::kPress);
}
