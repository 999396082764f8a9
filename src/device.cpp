#include "device_impl.h"
#include "log.h"

#include <algorithm>
#include <random>
#include <sstream>

namespace lanlight {
namespace {

constexpr uint16_t kAckType = static_cast<uint16_t>(MessageType::kAcknowledgement);

bool Accepts(const Device::Impl::PendingRequest& request, uint16_t type) {
  if (request.accepted_types.empty()) {
    return type != kAckType;
  }
  return std::find(request.accepted_types.begin(), request.accepted_types.end(),
                   type) != request.accepted_types.end();
}

uint32_t RandomInstanceId() {
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<uint32_t> dist(1, 0xffffffffu);
  return dist(gen);
}

// Cut to at most `limit` bytes without splitting a UTF-8 sequence.
std::string TruncateUtf8(const std::string& text, size_t limit) {
  if (text.size() <= limit) {
    return text;
  }
  size_t end = limit;
  while (end > 0 && (static_cast<unsigned char>(text[end]) & 0xc0) == 0x80) {
    --end;
  }
  return text.substr(0, end);
}

}  // namespace

Device::Impl::Impl(EventLoop& loop, std::shared_ptr<const Config> config,
                   std::shared_ptr<EngineMetrics> metrics,
                   std::unique_ptr<Transport> transport, const MacAddress& mac,
                   const Endpoint& endpoint, uint32_t source_id,
                   bool synthesized_address)
    : loop(loop),
      config(std::move(config)),
      metrics(std::move(metrics)),
      transport(std::move(transport)),
      mac(mac),
      endpoint(endpoint),
      source_id(source_id),
      synthesized_address(synthesized_address),
      last_seen(loop.Now()) {}

Device::Impl::~Impl() { Close(false); }

void Device::Impl::Log(const std::string& message) const {
  detail::LogError(message, config.get());
}

void Device::Impl::RecordCallbackException(const char* name, const char* what) {
  metrics->callback_exceptions++;
  detail::LogCallbackError(name, what, config.get());
}

bool Device::Impl::SendRequest(const Payload& payload,
                               const RequestOptions& options,
                               ResponseCallback callback, Error* error) {
  if (!alive || !transport || !transport->is_open()) {
    return Fail(error, ErrorCode::kTransport, "session closed for " + FormatMac(mac));
  }
  const uint16_t type = PayloadType(payload);
  bool ack = false;
  bool res = false;
  switch (options.mode) {
    case ReplyMode::kAuto:
      res = IsQuery(type);
      ack = !res && static_cast<bool>(callback);
      break;
    case ReplyMode::kNone:
      break;
    case ReplyMode::kAck:
      ack = true;
      break;
    case ReplyMode::kResponse:
      res = true;
      break;
    case ReplyMode::kAckAndResponse:
      ack = true;
      res = true;
      break;
  }

  // Nothing is consumed until the frame is encoded and handed to the socket.
  // Untracked frames carry the next sequence without claiming it.
  const bool tracked = ack || res;
  const uint8_t sequence = tracked ? NextFreeSequence() : next_sequence;
  std::vector<uint8_t> frame;
  if (!EncodeMessage(MakeHeader(mac, source_id, sequence, ack, res), payload,
                     &frame, error)) {
    return false;
  }
  Error send_error;
  if (!transport->Send(frame, endpoint, &send_error)) {
    metrics->send_errors++;
    Log("send " + MessageTypeName(type) + " to " + FormatMac(mac) +
        " failed: " + send_error.message);
    if (error) {
      *error = send_error;
    }
    return false;
  }
  metrics->packets_sent++;

  if (!tracked) {
    const int repeats = options.repeats.value_or(config->fire_and_forget_repeats);
    ScheduleRepeat(std::make_shared<const std::vector<uint8_t>>(std::move(frame)),
                   repeats - 1);
    if (callback) {
      PostResponse(std::move(callback), std::nullopt);
    }
    return true;
  }

  next_sequence = static_cast<uint8_t>(sequence + 1);
  auto occupied = pending.find(sequence);
  if (occupied != pending.end()) {
    ExpireRequest(occupied, "sequence space exhausted");
  }

  PendingRequest request;
  request.id = next_request_id++;
  request.request_type = type;
  request.frame = std::move(frame);
  request.callback = std::move(callback);
  if (res) {
    request.accepted_types = options.accepted_types;
    for (uint16_t response_type : ResponseTypesFor(type)) {
      request.accepted_types.push_back(response_type);
    }
  }
  request.ack_required = ack;
  request.res_required = res;
  request.max_retries = options.max_retries.value_or(config->max_retries);
  request.timeout = options.timeout.value_or(config->request_timeout);
  auto& entry = pending[sequence];
  entry = std::move(request);
  ScheduleRetry(sequence, entry);
  return true;
}

bool Device::Impl::SendSet(const Payload& payload, ResponseCallback callback,
                           std::function<void(DeviceState&)> apply) {
  Error error;
  if (!callback) {
    if (!SendRequest(payload, {}, nullptr, &error)) {
      Log(MessageTypeName(PayloadType(payload)) + " failed: " + error.message);
      return false;
    }
    if (apply) {
      apply(state);
    }
    return true;
  }
  ResponseCallback confirmed =
      [apply, callback](Device& device, const std::optional<Message>& message) {
        if (message && apply) {
          apply(device.impl_->state);
        }
        callback(device, message);
      };
  if (!SendRequest(payload, {}, std::move(confirmed), &error)) {
    Log(MessageTypeName(PayloadType(payload)) + " failed: " + error.message);
    return false;
  }
  return true;
}

bool Device::Impl::SendQuery(const Payload& payload, ResponseCallback callback) {
  Error error;
  if (!SendRequest(payload, {}, std::move(callback), &error)) {
    Log(MessageTypeName(PayloadType(payload)) + " failed: " + error.message);
    return false;
  }
  return true;
}

uint8_t Device::Impl::NextFreeSequence() const {
  for (int offset = 0; offset < 256; ++offset) {
    const uint8_t candidate = static_cast<uint8_t>(next_sequence + offset);
    if (pending.find(candidate) == pending.end()) {
      return candidate;
    }
  }
  auto oldest = std::min_element(
      pending.begin(), pending.end(),
      [](const std::pair<const uint8_t, PendingRequest>& a,
         const std::pair<const uint8_t, PendingRequest>& b) {
        return a.second.id < b.second.id;
      });
  return oldest->first;
}

void Device::Impl::ScheduleRepeat(std::shared_ptr<const std::vector<uint8_t>> frame,
                                  int remaining) {
  if (remaining <= 0) {
    return;
  }
  std::weak_ptr<Device> weak = owner->weak_from_this();
  const uint64_t key = next_repeat_key++;
  repeat_timers[key] =
      loop.CallLater(config->repeat_interval, [weak, key, frame, remaining]() {
        if (auto device = weak.lock()) {
          device->impl_->OnRepeat(key, frame, remaining);
        }
      });
}

void Device::Impl::OnRepeat(uint64_t key,
                            const std::shared_ptr<const std::vector<uint8_t>>& frame,
                            int remaining) {
  repeat_timers.erase(key);
  if (!alive) {
    return;
  }
  Error error;
  if (transport->Send(*frame, endpoint, &error)) {
    metrics->packets_sent++;
  } else {
    metrics->send_errors++;
    Log("repeat send to " + FormatMac(mac) + " failed: " + error.message);
  }
  ScheduleRepeat(frame, remaining - 1);
}

void Device::Impl::ScheduleRetry(uint8_t sequence, PendingRequest& request) {
  std::weak_ptr<Device> weak = owner->weak_from_this();
  const uint64_t id = request.id;
  request.timer = loop.CallLater(request.timeout, [weak, sequence, id]() {
    if (auto device = weak.lock()) {
      device->impl_->OnRequestTimeout(sequence, id);
    }
  });
}

void Device::Impl::OnRequestTimeout(uint8_t sequence, uint64_t id) {
  auto it = pending.find(sequence);
  if (it == pending.end() || it->second.id != id) {
    return;
  }
  PendingRequest& request = it->second;
  request.timer = 0;
  if (request.ack_seen) {
    ExpireRequest(it, "acked, no response");
    return;
  }
  if (request.retries >= request.max_retries) {
    ExpireRequest(it, "no response");
    return;
  }
  request.retries++;
  Error error;
  if (transport->Send(request.frame, endpoint, &error)) {
    metrics->packets_sent++;
  } else {
    metrics->send_errors++;
    Log("resend to " + FormatMac(mac) + " failed: " + error.message);
  }
  ScheduleRetry(sequence, request);
}

void Device::Impl::ExpireRequest(std::map<uint8_t, PendingRequest>::iterator it,
                                 const char* reason) {
  if (it->second.timer != 0) {
    loop.CancelTimer(it->second.timer);
  }
  ResponseCallback callback = std::move(it->second.callback);
  std::ostringstream oss;
  oss << MessageTypeName(it->second.request_type) << " seq "
      << static_cast<int>(it->first) << " to " << FormatMac(mac)
      << " expired: " << reason;
  pending.erase(it);
  metrics->requests_expired++;
  Log(oss.str());
  if (callback && config->report_no_response) {
    PostResponse(std::move(callback), std::nullopt);
  }
}

void Device::Impl::Resolve(std::map<uint8_t, PendingRequest>::iterator it,
                           std::optional<Message> message) {
  if (it->second.timer != 0) {
    loop.CancelTimer(it->second.timer);
  }
  ResponseCallback callback = std::move(it->second.callback);
  pending.erase(it);
  if (callback) {
    PostResponse(std::move(callback), std::move(message));
  }
}

void Device::Impl::OnDatagram(const uint8_t* data, size_t length,
                              const Endpoint& from) {
  metrics->packets_received++;
  Message message;
  Error error;
  if (!DecodeMessage(data, length, &message, &error)) {
    metrics->decode_errors++;
    Log("dropping frame from " + from.ToString() + ": " + error.message);
    return;
  }
  if (message.header.target == mac) {
    Touch(from);
  }
  UpdateState(message);
  Dispatch(message);
}

void Device::Impl::Touch(const Endpoint& from) {
  last_seen = loop.Now();
  missed_cycles = 0;
  if (!synthesized_address && !from.address.empty()) {
    endpoint.address = from.address;
  }
}

void Device::Impl::Refresh(const Endpoint& seen_at) {
  endpoint = seen_at;
  last_seen = loop.Now();
  missed_cycles = 0;
}

void Device::Impl::UpdateState(const Message& message) {
  const Payload& payload = message.payload;
  if (const auto* p = std::get_if<StateLabel>(&payload)) {
    state.label = p->label;
  } else if (const auto* p = std::get_if<StatePower>(&payload)) {
    state.power_level = p->level;
  } else if (const auto* p = std::get_if<LightStatePower>(&payload)) {
    state.power_level = p->level;
  } else if (const auto* p = std::get_if<LightState>(&payload)) {
    state.color = p->color;
    state.power_level = p->power_level;
    state.label = p->label;
  } else if (const auto* p = std::get_if<StateLocation>(&payload)) {
    state.location = p->label;
  } else if (const auto* p = std::get_if<StateGroup>(&payload)) {
    state.group = p->label;
  } else if (const auto* p = std::get_if<StateVersion>(&payload)) {
    state.version = *p;
  } else if (const auto* p = std::get_if<StateHostFirmware>(&payload)) {
    state.host_firmware = *p;
  } else if (const auto* p = std::get_if<StateWifiFirmware>(&payload)) {
    state.wifi_firmware = *p;
  } else if (const auto* p = std::get_if<StateWifiInfo>(&payload)) {
    state.wifi_info = *p;
  } else if (const auto* p = std::get_if<StateHostInfo>(&payload)) {
    state.host_info = *p;
  } else if (const auto* p = std::get_if<StateInfo>(&payload)) {
    state.uptime = p->uptime;
  } else if (const auto* p = std::get_if<LightStateInfrared>(&payload)) {
    state.infrared_brightness = p->brightness;
  } else if (const auto* p = std::get_if<StateHevCycle>(&payload)) {
    state.hev_cycle = *p;
  } else if (const auto* p = std::get_if<StateZone>(&payload)) {
    state.zones.resize(p->count);
    if (p->index < p->count) {
      state.zones[p->index] = p->color;
    }
  } else if (const auto* p = std::get_if<StateMultiZone>(&payload)) {
    state.zones.resize(p->count);
    for (size_t i = 0; i < kZonesPerMessage; ++i) {
      const size_t zone = p->index + i;
      if (zone < state.zones.size()) {
        state.zones[zone] = p->colors[i];
      }
    }
  } else if (const auto* p = std::get_if<StateExtendedColorZones>(&payload)) {
    state.zones.resize(p->count);
    for (size_t i = 0; i < p->colors.size(); ++i) {
      const size_t zone = p->index + i;
      if (zone < state.zones.size()) {
        state.zones[zone] = p->colors[i];
      }
    }
  } else if (const auto* p = std::get_if<StateMultiZoneEffect>(&payload)) {
    state.multizone_effect = *p;
  } else if (const auto* p = std::get_if<TileStateDeviceChain>(&payload)) {
    state.tiles.resize(std::max(state.tiles.size(), p->start_index + p->tiles.size()));
    std::copy(p->tiles.begin(), p->tiles.end(), state.tiles.begin() + p->start_index);
  } else if (const auto* p = std::get_if<TileStateEffect>(&payload)) {
    state.tile_effect = *p;
  } else if (const auto* p = std::get_if<StateRPower>(&payload)) {
    state.relay_levels[p->relay_index] = p->level;
  } else if (const auto* p = std::get_if<StateButtonConfig>(&payload)) {
    state.button_config = *p;
  }
}

// Sequence match first, then accepted type; everything else is unsolicited.
void Device::Impl::Dispatch(const Message& message) {
  const uint16_t type = message.type();
  auto it = pending.find(message.header.sequence);
  if (it != pending.end() && message.header.source == source_id) {
    PendingRequest& request = it->second;
    if (type == kAckType) {
      if (!request.ack_required) {
        return;
      }
      if (!request.res_required) {
        Resolve(it, message);
      } else if (!request.ack_seen) {
        // The device has the request; give the response one full timeout.
        request.ack_seen = true;
        if (request.timer != 0) {
          loop.CancelTimer(request.timer);
        }
        ScheduleRetry(it->first, request);
      }
      return;
    }
    if (request.res_required && Accepts(request, type)) {
      Resolve(it, message);
      return;
    }
  }
  if (type == kAckType) {
    return;
  }
  PostUnsolicited(message);
}

void Device::Impl::PostResponse(ResponseCallback callback,
                                std::optional<Message> message) {
  if (!owner) {
    return;
  }
  std::shared_ptr<Device> self = owner->shared_from_this();
  loop.Post([self, callback, message]() {
    try {
      callback(*self, message);
    } catch (const std::exception& ex) {
      self->impl_->RecordCallbackException("ResponseCallback", ex.what());
    } catch (...) {
      self->impl_->RecordCallbackException("ResponseCallback", nullptr);
    }
  });
}

void Device::Impl::PostUnsolicited(const Message& message) {
  if (!unsolicited_callback || !owner) {
    return;
  }
  std::shared_ptr<Device> self = owner->shared_from_this();
  MessageCallback callback = unsolicited_callback;
  loop.Post([self, callback, message]() {
    try {
      callback(*self, message);
    } catch (const std::exception& ex) {
      self->impl_->RecordCallbackException("UnsolicitedCallback", ex.what());
    } catch (...) {
      self->impl_->RecordCallbackException("UnsolicitedCallback", nullptr);
    }
  });
}

void Device::Impl::Close(bool notify) {
  if (!alive) {
    return;
  }
  alive = false;
  std::vector<ResponseCallback> callbacks;
  for (auto& entry : pending) {
    if (entry.second.timer != 0) {
      loop.CancelTimer(entry.second.timer);
    }
    if (entry.second.callback) {
      callbacks.push_back(std::move(entry.second.callback));
    }
  }
  pending.clear();
  for (auto& entry : repeat_timers) {
    loop.CancelTimer(entry.second);
  }
  repeat_timers.clear();
  if (transport) {
    transport->Close();
  }
  if (notify) {
    for (auto& callback : callbacks) {
      PostResponse(std::move(callback), std::nullopt);
    }
  }
}

Device::Device(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

Device::~Device() = default;

const MacAddress& Device::mac_address() const { return impl_->mac; }
std::string Device::mac_string() const { return FormatMac(impl_->mac); }
Endpoint Device::endpoint() const { return impl_->endpoint; }
uint32_t Device::source_id() const { return impl_->source_id; }
std::chrono::steady_clock::time_point Device::last_seen() const {
  return impl_->last_seen;
}
bool Device::alive() const { return impl_->alive; }
size_t Device::pending_count() const { return impl_->pending.size(); }
const DeviceState& Device::state() const { return impl_->state; }

bool Device::SendRequest(const Payload& payload, const RequestOptions& options,
                         ResponseCallback callback, Error* error) {
  return impl_->SendRequest(payload, options, std::move(callback), error);
}

void Device::SetUnsolicitedCallback(MessageCallback callback) {
  impl_->unsolicited_callback = std::move(callback);
}

void Device::Close() { impl_->Close(true); }

// Payload structs share names with the operations below, hence the
// lanlight:: qualification.
bool Device::GetLabel(ResponseCallback callback) {
  return impl_->SendQuery(lanlight::GetLabel{}, std::move(callback));
}

bool Device::SetLabel(const std::string& label, ResponseCallback callback) {
  const std::string truncated = TruncateUtf8(label, kLabelLength);
  return impl_->SendSet(lanlight::SetLabel{truncated}, std::move(callback),
                        [truncated](DeviceState& state) { state.label = truncated; });
}

bool Device::GetLocation(ResponseCallback callback) {
  return impl_->SendQuery(lanlight::GetLocation{}, std::move(callback));
}

bool Device::GetGroup(ResponseCallback callback) {
  return impl_->SendQuery(lanlight::GetGroup{}, std::move(callback));
}

bool Device::GetPower(ResponseCallback callback) {
  return impl_->SendQuery(lanlight::GetPower{}, std::move(callback));
}

bool Device::SetPower(bool on, ResponseCallback callback, uint32_t duration_ms) {
  const uint16_t level = on ? kPowerOn : kPowerOff;
  Payload payload = lanlight::SetPower{level};
  if (duration_ms > 0) {
    payload = LightSetPower{level, duration_ms};
  }
  return impl_->SendSet(payload, std::move(callback),
                        [level](DeviceState& state) { state.power_level = level; });
}

bool Device::GetColor(ResponseCallback callback) {
  return impl_->SendQuery(LightGet{}, std::move(callback));
}

bool Device::SetColor(const Hsbk& color, ResponseCallback callback,
                      uint32_t duration_ms) {
  return impl_->SendSet(LightSetColor{color, duration_ms}, std::move(callback),
                        [color](DeviceState& state) { state.color = color; });
}

bool Device::SetWaveform(const LightSetWaveform& waveform,
                         ResponseCallback callback) {
  return impl_->SendSet(waveform, std::move(callback), nullptr);
}

bool Device::SetWaveformOptional(const LightSetWaveformOptional& waveform,
                                 ResponseCallback callback) {
  return impl_->SendSet(waveform, std::move(callback), nullptr);
}

bool Device::GetInfrared(ResponseCallback callback) {
  return impl_->SendQuery(LightGetInfrared{}, std::move(callback));
}

bool Device::SetInfrared(uint16_t brightness, ResponseCallback callback) {
  return impl_->SendSet(LightSetInfrared{brightness}, std::move(callback),
                        [brightness](DeviceState& state) {
                          state.infrared_brightness = brightness;
                        });
}

bool Device::GetColorZones(uint8_t start_index, uint8_t end_index,
                           ResponseCallback callback) {
  return impl_->SendQuery(lanlight::GetColorZones{start_index, end_index},
                          std::move(callback));
}

bool Device::SetColorZones(uint8_t start_index, uint8_t end_index,
                           const Hsbk& color, ResponseCallback callback,
                           uint32_t duration_ms, ZoneApply apply) {
  lanlight::SetColorZones payload;
  payload.start_index = start_index;
  payload.end_index = end_index;
  payload.color = color;
  payload.duration = duration_ms;
  payload.apply = apply;
  return impl_->SendSet(payload, std::move(callback),
                        [start_index, end_index, color](DeviceState& state) {
                          for (size_t zone = start_index;
                               zone <= end_index && zone < state.zones.size();
                               ++zone) {
                            state.zones[zone] = color;
                          }
                        });
}

bool Device::GetExtendedColorZones(ResponseCallback callback) {
  return impl_->SendQuery(lanlight::GetExtendedColorZones{}, std::move(callback));
}

bool Device::SetExtendedColorZones(uint16_t zone_index,
                                   const std::vector<Hsbk>& colors,
                                   ResponseCallback callback, uint32_t duration_ms,
                                   ZoneApply apply) {
  lanlight::SetExtendedColorZones payload;
  payload.duration = duration_ms;
  payload.apply = apply;
  payload.zone_index = zone_index;
  payload.colors = colors;
  return impl_->SendSet(payload, std::move(callback),
                        [zone_index, colors](DeviceState& state) {
                          for (size_t i = 0; i < colors.size(); ++i) {
                            const size_t zone = zone_index + i;
                            if (zone < state.zones.size()) {
                              state.zones[zone] = colors[i];
                            }
                          }
                        });
}

bool Device::GetMultiZoneEffect(ResponseCallback callback) {
  return impl_->SendQuery(lanlight::GetMultiZoneEffect{}, std::move(callback));
}

bool Device::SetMultiZoneEffect(MultiZoneEffectType type, uint32_t speed_ms,
                                uint64_t duration_ns, uint32_t direction,
                                ResponseCallback callback) {
  lanlight::SetMultiZoneEffect payload;
  payload.instance_id = RandomInstanceId();
  payload.type = type;
  payload.speed = speed_ms;
  payload.duration = duration_ns;
  payload.parameters[1] = direction;
  return impl_->SendSet(payload, std::move(callback), nullptr);
}

bool Device::GetDeviceChain(ResponseCallback callback) {
  return impl_->SendQuery(TileGetDeviceChain{}, std::move(callback));
}

bool Device::GetTileColors(uint8_t tile_index, uint8_t length,
                           ResponseCallback callback, uint8_t width) {
  TileGet64 payload;
  payload.tile_index = tile_index;
  payload.length = length;
  payload.width = width;
  return impl_->SendQuery(payload, std::move(callback));
}

bool Device::SetTileColors(uint8_t tile_index,
                           const std::array<Hsbk, kTileColorCount>& colors,
                           ResponseCallback callback, uint32_t duration_ms,
                           uint8_t width) {
  TileSet64 payload;
  payload.tile_index = tile_index;
  payload.width = width;
  payload.duration = duration_ms;
  payload.colors = colors;
  return impl_->SendSet(payload, std::move(callback), nullptr);
}

bool Device::GetTileEffect(ResponseCallback callback) {
  return impl_->SendQuery(TileGetEffect{}, std::move(callback));
}

bool Device::SetTileEffect(const TileSetEffect& effect, ResponseCallback callback) {
  TileSetEffect payload = effect;
  if (payload.instance_id == 0) {
    payload.instance_id = RandomInstanceId();
  }
  return impl_->SendSet(payload, std::move(callback), nullptr);
}

bool Device::GetRelayPower(uint8_t relay_index, ResponseCallback callback) {
  return impl_->SendQuery(GetRPower{relay_index}, std::move(callback));
}

bool Device::SetRelayPower(uint8_t relay_index, bool on, ResponseCallback callback) {
  const uint16_t level = on ? kPowerOn : kPowerOff;
  return impl_->SendSet(SetRPower{relay_index, level}, std::move(callback),
                        [relay_index, level](DeviceState& state) {
                          state.relay_levels[relay_index] = level;
                        });
}

bool Device::GetButton(ResponseCallback callback) {
  return impl_->SendQuery(lanlight::GetButton{}, std::move(callback));
}

bool Device::GetButtonConfig(ResponseCallback callback) {
  return impl_->SendQuery(lanlight::GetButtonConfig{}, std::move(callback));
}

bool Device::SetButtonConfig(uint16_t haptic_duration_ms, const Hsbk& backlight_on,
                             const Hsbk& backlight_off, ResponseCallback callback) {
  lanlight::SetButtonConfig payload;
  payload.haptic_duration_ms = haptic_duration_ms;
  payload.backlight_on_color = backlight_on;
  payload.backlight_off_color = backlight_off;
  return impl_->SendSet(payload, std::move(callback),
                        [payload](DeviceState& state) {
                          StateButtonConfig confirmed;
                          confirmed.haptic_duration_ms = payload.haptic_duration_ms;
                          confirmed.backlight_on_color = payload.backlight_on_color;
                          confirmed.backlight_off_color = payload.backlight_off_color;
                          state.button_config = confirmed;
                        });
}

bool Device::GetHevCycle(ResponseCallback callback) {
  return impl_->SendQuery(lanlight::GetHevCycle{}, std::move(callback));
}

bool Device::SetHevCycle(bool enable, uint32_t duration_s,
                         ResponseCallback callback) {
  return impl_->SendSet(lanlight::SetHevCycle{enable, duration_s},
                        std::move(callback), nullptr);
}

bool Device::GetVersion(ResponseCallback callback) {
  return impl_->SendQuery(lanlight::GetVersion{}, std::move(callback));
}

bool Device::GetHostInfo(ResponseCallback callback) {
  return impl_->SendQuery(lanlight::GetHostInfo{}, std::move(callback));
}

bool Device::GetHostFirmware(ResponseCallback callback) {
  return impl_->SendQuery(lanlight::GetHostFirmware{}, std::move(callback));
}

bool Device::GetWifiInfo(ResponseCallback callback) {
  return impl_->SendQuery(lanlight::GetWifiInfo{}, std::move(callback));
}

bool Device::GetWifiFirmware(ResponseCallback callback) {
  return impl_->SendQuery(lanlight::GetWifiFirmware{}, std::move(callback));
}

bool Device::GetUptime(ResponseCallback callback) {
  return impl_->SendQuery(GetInfo{}, std::move(callback));
}

bool Device::Echo(const std::vector<uint8_t>& data, ResponseCallback callback) {
  return impl_->SendQuery(EchoRequest{data}, std::move(callback));
}

bool Device::Reboot(ResponseCallback callback) {
  return impl_->SendSet(SetReboot{}, std::move(callback), nullptr);
}

}  // namespace lanlight
