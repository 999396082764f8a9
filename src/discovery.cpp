#include "device_impl.h"
#include "log.h"

#include <map>
#include <random>
#include <sstream>

#include <net/if.h>

namespace lanlight {
namespace {

uint32_t RandomSourceId() {
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<uint32_t> dist(1, 0xffffffffu);
  return dist(gen);
}

}  // namespace

struct Discovery::Impl {
  Impl(EventLoop& loop, DeviceRegistry& registry, Config config,
       TransportFactory factory)
      : loop(loop),
        registry(registry),
        config(std::make_shared<const Config>(std::move(config))),
        factory(factory ? std::move(factory) : MakeUdpTransportFactory()),
        metrics(std::make_shared<EngineMetrics>()) {
    source_id = this->config->source_id != 0 ? this->config->source_id
                                             : RandomSourceId();
  }

  ~Impl() {
    Stop();
    // Engine teardown: no registry calls.
    for (auto& entry : sessions) {
      SessionOf(*entry.second).Close(true);
    }
    sessions.clear();
  }

  void Log(const std::string& message) const {
    detail::LogError(message, config.get());
  }

  void RecordCallbackException(const char* name, const char* what) {
    metrics->callback_exceptions++;
    detail::LogCallbackError(name, what, config.get());
  }

  bool Start() {
    if (running) {
      return true;
    }
    last_error.clear();
    std::string error;
    if (!config->Validate(&error)) {
      last_error = "invalid config: " + error;
      Log(last_error);
      return false;
    }
    scope_id = 0;
    if (!config->ipv6_interface.empty()) {
      scope_id = ::if_nametoindex(config->ipv6_interface.c_str());
    }

    TransportOptions options;
    options.bind_address = config->bind_address;
    if (options.bind_address.find(':') != std::string::npos) {
      // Discovery broadcasts always go out over IPv4.
      options.bind_address = "0.0.0.0";
    }
    options.bind_port = config->bind_port;
    options.allow_broadcast = true;
    Error open_error;
    transport = factory(loop, options, &open_error);
    if (!transport) {
      last_error = "failed to open discovery socket: " + open_error.message;
      Log(last_error);
      return false;
    }
    transport->SetReceiveHandler(
        [this](const uint8_t* data, size_t length, const Endpoint& from) {
          OnDatagram(data, length, from);
        });

    running = true;
    state = DiscoveryState::kIdle;
    cycle_timer = loop.CallLater(std::chrono::milliseconds(0), [this]() { RunCycle(); });
    return true;
  }

  void Stop() {
    running = false;
    CancelTimers();
    state = DiscoveryState::kIdle;
    if (transport) {
      transport->Close();
      transport.reset();
    }
  }

  void CancelTimers() {
    if (cycle_timer != 0) {
      loop.CancelTimer(cycle_timer);
      cycle_timer = 0;
    }
    if (window_timer != 0) {
      loop.CancelTimer(window_timer);
      window_timer = 0;
    }
  }

  void DiscoverNow() {
    if (!running) {
      return;
    }
    if (cycle_timer != 0) {
      loop.CancelTimer(cycle_timer);
    }
    cycle_timer = loop.CallLater(std::chrono::milliseconds(0), [this]() { RunCycle(); });
  }

  // Idle -> Broadcasting -> AwaitingReplies, then Idle until the next tick.
  void RunCycle() {
    cycle_timer = 0;
    if (!running) {
      return;
    }
    if (window_timer != 0) {
      loop.CancelTimer(window_timer);
      window_timer = 0;
    }
    SweepLiveness();

    state = DiscoveryState::kBroadcasting;
    Broadcast();
    last_broadcast = loop.Now();

    state = DiscoveryState::kAwaitingReplies;
    window_timer = loop.CallLater(config->reply_window, [this]() {
      window_timer = 0;
      state = DiscoveryState::kIdle;
    });
    cycle_timer = loop.CallLater(config->discovery_interval, [this]() { RunCycle(); });
  }

  void Broadcast() {
    const MacAddress untargeted = {0, 0, 0, 0, 0, 0};
    std::vector<uint8_t> frame;
    Error error;
    if (!EncodeMessage(MakeHeader(untargeted, source_id, broadcast_sequence++,
                                  false, true),
                       GetService{}, &frame, &error)) {
      Log("failed to encode discovery broadcast: " + error.message);
      return;
    }
    Endpoint to;
    to.address = config->broadcast_address;
    to.port = config->port;
    if (!transport->Send(frame, to, &error)) {
      metrics->send_errors++;
      Log("discovery broadcast failed: " + error.message);
      return;
    }
    metrics->packets_sent++;
  }

  // A session not heard from since the previous broadcast missed a cycle.
  void SweepLiveness() {
    if (!last_broadcast) {
      return;
    }
    std::vector<MacAddress> stale;
    for (auto& entry : sessions) {
      Device::Impl& session = SessionOf(*entry.second);
      if (session.last_seen < *last_broadcast) {
        session.missed_cycles++;
        if (session.missed_cycles >= config->staleness_cycles) {
          stale.push_back(entry.first);
        }
      }
    }
    for (const auto& mac : stale) {
      Evict(mac, "missed " + std::to_string(config->staleness_cycles) +
                     " discovery cycles");
    }
  }

  void OnDatagram(const uint8_t* data, size_t length, const Endpoint& from) {
    metrics->packets_received++;
    Message message;
    Error error;
    if (!DecodeMessage(data, length, &message, &error)) {
      metrics->decode_errors++;
      Log("dropping discovery frame from " + from.ToString() + ": " + error.message);
      return;
    }
    const MacAddress& mac = message.header.target;
    if (IsZeroMac(mac)) {
      return;
    }
    uint32_t port = 0;
    if (const auto* service = std::get_if<StateService>(&message.payload)) {
      if (service->service != kServiceUdp) {
        return;
      }
      port = service->port;
    } else if (std::holds_alternative<LightState>(message.payload)) {
      port = config->port;
    } else {
      auto it = sessions.find(mac);
      if (it != sessions.end() && it->second->alive()) {
        SessionOf(*it->second).Touch(from);
      }
      return;
    }
    if (port == 0 || port > 0xffff) {
      port = config->port;
    }
    HandleReply(mac, from, static_cast<uint16_t>(port));
  }

  void HandleReply(const MacAddress& mac, const Endpoint& from, uint16_t port) {
    Endpoint endpoint;
    endpoint.port = port;
    const bool ipv6 = !config->ipv6_prefix.empty();
    if (ipv6) {
      if (!SynthesizeIpv6Address(config->ipv6_prefix, mac, &endpoint.address)) {
        Log("cannot synthesize IPv6 address for " + FormatMac(mac));
        return;
      }
      endpoint.scope_id = scope_id;
    } else {
      endpoint.address = from.address;
    }

    auto it = sessions.find(mac);
    if (it != sessions.end()) {
      if (it->second->alive()) {
        SessionOf(*it->second).Refresh(endpoint);
        return;
      }
      // Closed by the host; replace it.
      Evict(mac, "session closed");
    }

    TransportOptions options;
    options.bind_address = config->bind_address;
    options.ipv6 = ipv6;
    if (ipv6 && options.bind_address.find(':') == std::string::npos) {
      options.bind_address = "::";
    } else if (!ipv6 && options.bind_address.find(':') != std::string::npos) {
      options.bind_address = "0.0.0.0";
    }
    Error error;
    std::unique_ptr<Transport> session_transport = factory(loop, options, &error);
    if (!session_transport) {
      Log("failed to open socket for " + FormatMac(mac) + ": " + error.message);
      return;
    }

    auto impl = std::make_unique<Device::Impl>(loop, config, metrics,
                                               std::move(session_transport), mac,
                                               endpoint, source_id, ipv6);
    Device::Impl* raw = impl.get();
    std::shared_ptr<Device> device = MakeSession(std::move(impl));
    raw->owner = device.get();
    raw->transport->SetReceiveHandler(
        [raw](const uint8_t* data, size_t length, const Endpoint& source) {
          raw->OnDatagram(data, length, source);
        });
    sessions[mac] = device;
    metrics->devices_registered++;
    Log("registered " + FormatMac(mac) + " at " + endpoint.ToString());
    try {
      registry.Register(device);
    } catch (const std::exception& ex) {
      RecordCallbackException("DeviceRegistry::Register", ex.what());
    } catch (...) {
      RecordCallbackException("DeviceRegistry::Register", nullptr);
    }
  }

  void Evict(const MacAddress& mac, const std::string& reason) {
    auto it = sessions.find(mac);
    if (it == sessions.end()) {
      return;
    }
    std::shared_ptr<Device> device = it->second;
    sessions.erase(it);
    SessionOf(*device).Close(true);
    metrics->devices_unregistered++;
    Log("unregistered " + FormatMac(mac) + ": " + reason);
    try {
      registry.Unregister(device);
    } catch (const std::exception& ex) {
      RecordCallbackException("DeviceRegistry::Unregister", ex.what());
    } catch (...) {
      RecordCallbackException("DeviceRegistry::Unregister", nullptr);
    }
  }

  EventLoop& loop;
  DeviceRegistry& registry;
  std::shared_ptr<const Config> config;
  TransportFactory factory;
  std::shared_ptr<EngineMetrics> metrics;
  std::unique_ptr<Transport> transport;
  uint32_t source_id = 0;
  uint32_t scope_id = 0;
  uint8_t broadcast_sequence = 0;

  bool running = false;
  DiscoveryState state = DiscoveryState::kIdle;
  EventLoop::TimerId cycle_timer = 0;
  EventLoop::TimerId window_timer = 0;
  std::optional<std::chrono::steady_clock::time_point> last_broadcast;

  std::map<MacAddress, std::shared_ptr<Device>> sessions;
  std::string last_error;
};

std::shared_ptr<Device> Discovery::MakeSession(std::unique_ptr<Device::Impl> impl) {
  return std::shared_ptr<Device>(new Device(std::move(impl)));
}

Device::Impl& Discovery::SessionOf(Device& device) { return *device.impl_; }

Discovery::Discovery(EventLoop& loop, DeviceRegistry& registry, Config config,
                     TransportFactory factory)
    : impl_(std::make_unique<Impl>(loop, registry, std::move(config),
                                   std::move(factory))) {}

Discovery::~Discovery() = default;

bool Discovery::Start() { return impl_->Start(); }
void Discovery::Stop() { impl_->Stop(); }
void Discovery::DiscoverNow() { impl_->DiscoverNow(); }

bool Discovery::running() const { return impl_->running; }
DiscoveryState Discovery::state() const { return impl_->state; }
uint32_t Discovery::source_id() const { return impl_->source_id; }

std::vector<std::shared_ptr<Device>> Discovery::GetDevices() const {
  std::vector<std::shared_ptr<Device>> devices;
  devices.reserve(impl_->sessions.size());
  for (const auto& entry : impl_->sessions) {
    if (entry.second->alive()) {
      devices.push_back(entry.second);
    }
  }
  return devices;
}

std::shared_ptr<Device> Discovery::FindDevice(const MacAddress& mac) const {
  auto it = impl_->sessions.find(mac);
  if (it == impl_->sessions.end()) {
    return nullptr;
  }
  return it->second;
}

std::string Discovery::GetLastError() const { return impl_->last_error; }

EngineMetrics Discovery::GetMetrics() const { return *impl_->metrics; }

}  // namespace lanlight
