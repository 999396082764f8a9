#include "lanlight/messages.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <iterator>
#include <sstream>

namespace lanlight {
namespace {

constexpr size_t kOffsetSize = 0;
constexpr size_t kOffsetFlags = 2;
constexpr size_t kOffsetSource = 4;
constexpr size_t kOffsetTarget = 8;
constexpr size_t kOffsetSite = 16;
constexpr size_t kOffsetResponseFlags = 22;
constexpr size_t kOffsetSequence = 23;
constexpr size_t kOffsetTimestamp = 24;
constexpr size_t kOffsetType = 32;

constexpr uint16_t kProtocolMask = 0x0fff;
constexpr uint16_t kAddressableBit = 0x1000;
constexpr uint16_t kTaggedBit = 0x2000;
constexpr int kOriginShift = 14;
constexpr uint8_t kResRequiredBit = 0x01;
constexpr uint8_t kAckRequiredBit = 0x02;

constexpr size_t kHsbkSize = 8;
constexpr size_t kLocationIdSize = 16;
constexpr uint8_t kMaxWaveform = static_cast<uint8_t>(Waveform::kPulse);
constexpr uint8_t kMaxZoneApply = static_cast<uint8_t>(ZoneApply::kApplyOnly);
constexpr size_t kMaxFrameSize = 0xffff;
constexpr size_t kMultiZoneEffectSize = 59;
constexpr size_t kTileDeviceSize = 55;
constexpr size_t kTileEffectParametersSize = 32;
constexpr size_t kButtonActionSize = 4 + kButtonTargetSize;
constexpr size_t kButtonSize = 1 + kActionsPerButton * kButtonActionSize;
// Reserved bytes ahead of the instance id in Set/State tile effects.
constexpr size_t kTileSetEffectLead = 2;
constexpr size_t kTileStateEffectLead = 1;

// Type codes in Payload alternative order; UnknownPayload carries its own.
constexpr MessageType kTypeByIndex[] = {
    MessageType::kGetService,
    MessageType::kStateService,
    MessageType::kGetHostInfo,
    MessageType::kStateHostInfo,
    MessageType::kGetHostFirmware,
    MessageType::kStateHostFirmware,
    MessageType::kGetWifiInfo,
    MessageType::kStateWifiInfo,
    MessageType::kGetWifiFirmware,
    MessageType::kStateWifiFirmware,
    MessageType::kGetPower,
    MessageType::kSetPower,
    MessageType::kStatePower,
    MessageType::kGetLabel,
    MessageType::kSetLabel,
    MessageType::kStateLabel,
    MessageType::kGetVersion,
    MessageType::kStateVersion,
    MessageType::kGetInfo,
    MessageType::kStateInfo,
    MessageType::kSetReboot,
    MessageType::kAcknowledgement,
    MessageType::kGetLocation,
    MessageType::kStateLocation,
    MessageType::kGetGroup,
    MessageType::kStateGroup,
    MessageType::kEchoRequest,
    MessageType::kEchoResponse,
    MessageType::kLightGet,
    MessageType::kLightSetColor,
    MessageType::kLightSetWaveform,
    MessageType::kLightSetWaveformOptional,
    MessageType::kLightState,
    MessageType::kLightGetPower,
    MessageType::kLightSetPower,
    MessageType::kLightStatePower,
    MessageType::kLightGetInfrared,
    MessageType::kLightStateInfrared,
    MessageType::kLightSetInfrared,
    MessageType::kGetHevCycle,
    MessageType::kSetHevCycle,
    MessageType::kStateHevCycle,
    MessageType::kGetHevCycleConfiguration,
    MessageType::kSetHevCycleConfiguration,
    MessageType::kStateHevCycleConfiguration,
    MessageType::kGetLastHevCycleResult,
    MessageType::kStateLastHevCycleResult,
    MessageType::kSetColorZones,
    MessageType::kGetColorZones,
    MessageType::kStateZone,
    MessageType::kStateMultiZone,
    MessageType::kGetMultiZoneEffect,
    MessageType::kSetMultiZoneEffect,
    MessageType::kStateMultiZoneEffect,
    MessageType::kSetExtendedColorZones,
    MessageType::kGetExtendedColorZones,
    MessageType::kStateExtendedColorZones,
    MessageType::kTileGetDeviceChain,
    MessageType::kTileStateDeviceChain,
    MessageType::kTileGet64,
    MessageType::kTileState64,
    MessageType::kTileSet64,
    MessageType::kTileGetEffect,
    MessageType::kTileSetEffect,
    MessageType::kTileStateEffect,
    MessageType::kGetRPower,
    MessageType::kSetRPower,
    MessageType::kStateRPower,
    MessageType::kGetButton,
    MessageType::kStateButton,
    MessageType::kGetButtonConfig,
    MessageType::kSetButtonConfig,
    MessageType::kStateButtonConfig,
};

static_assert(sizeof(kTypeByIndex) / sizeof(kTypeByIndex[0]) ==
                  std::variant_size_v<Payload> - 1,
              "type table out of sync with Payload");

uint16_t Code(MessageType type) { return static_cast<uint16_t>(type); }

// Read little-endian integers from frame bytes.
uint16_t ReadLe16(const uint8_t* data, size_t offset) {
  return static_cast<uint16_t>(data[offset] | (data[offset + 1] << 8));
}

uint32_t ReadLe32(const uint8_t* data, size_t offset) {
  return static_cast<uint32_t>(data[offset]) |
         (static_cast<uint32_t>(data[offset + 1]) << 8) |
         (static_cast<uint32_t>(data[offset + 2]) << 16) |
         (static_cast<uint32_t>(data[offset + 3]) << 24);
}

uint64_t ReadLe64(const uint8_t* data, size_t offset) {
  return static_cast<uint64_t>(ReadLe32(data, offset)) |
         (static_cast<uint64_t>(ReadLe32(data, offset + 4)) << 32);
}

float ReadFloat(const uint8_t* data, size_t offset) {
  const uint32_t bits = ReadLe32(data, offset);
  float value = 0.0f;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

Hsbk ReadHsbk(const uint8_t* data, size_t offset) {
  Hsbk color;
  color.hue = ReadLe16(data, offset);
  color.saturation = ReadLe16(data, offset + 2);
  color.brightness = ReadLe16(data, offset + 4);
  color.kelvin = ReadLe16(data, offset + 6);
  return color;
}

// Fixed-width string field, cut at the first NUL.
std::string ReadLabel(const uint8_t* data, size_t offset) {
  std::string label(reinterpret_cast<const char*>(data + offset), kLabelLength);
  auto null_pos = label.find('\0');
  if (null_pos != std::string::npos) {
    label.resize(null_pos);
  }
  return label;
}

// Append little-endian integers to an outgoing frame.
void WriteLe16(std::vector<uint8_t>& out, uint32_t value) {
  out.push_back(static_cast<uint8_t>(value & 0xff));
  out.push_back(static_cast<uint8_t>((value >> 8) & 0xff));
}

void WriteLe32(std::vector<uint8_t>& out, uint32_t value) {
  WriteLe16(out, value & 0xffff);
  WriteLe16(out, (value >> 16) & 0xffff);
}

void WriteLe64(std::vector<uint8_t>& out, uint64_t value) {
  WriteLe32(out, static_cast<uint32_t>(value & 0xffffffffu));
  WriteLe32(out, static_cast<uint32_t>(value >> 32));
}

void WriteFloat(std::vector<uint8_t>& out, float value) {
  uint32_t bits = 0;
  std::memcpy(&bits, &value, sizeof(bits));
  WriteLe32(out, bits);
}

void WriteHsbk(std::vector<uint8_t>& out, const Hsbk& color) {
  WriteLe16(out, color.hue);
  WriteLe16(out, color.saturation);
  WriteLe16(out, color.brightness);
  WriteLe16(out, color.kelvin);
}

void WriteBytes(std::vector<uint8_t>& out, const uint8_t* data, size_t length) {
  out.insert(out.end(), data, data + length);
}

void WriteZeros(std::vector<uint8_t>& out, size_t count) {
  out.insert(out.end(), count, 0);
}

// Colours followed by zeroed slots up to `slots`.
void WriteHsbkList(std::vector<uint8_t>& out, const std::vector<Hsbk>& colors,
                   size_t slots) {
  for (const auto& color : colors) {
    WriteHsbk(out, color);
  }
  WriteZeros(out, (slots - colors.size()) * kHsbkSize);
}

std::vector<Hsbk> ReadHsbkList(const uint8_t* data, size_t offset, size_t count) {
  std::vector<Hsbk> colors;
  colors.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    colors.push_back(ReadHsbk(data, offset + i * kHsbkSize));
  }
  return colors;
}

bool CheckCount(size_t count, size_t limit, const char* what, Error* error) {
  if (count > limit) {
    return Fail(error, ErrorCode::kEncoding,
                std::string(what) + " exceeds " + std::to_string(limit) + " (" +
                    std::to_string(count) + ")");
  }
  return true;
}

bool CheckZoneApply(ZoneApply apply, Error* error) {
  if (static_cast<uint8_t>(apply) > kMaxZoneApply) {
    return Fail(error, ErrorCode::kEncoding,
                "zone apply out of range: " +
                    std::to_string(static_cast<unsigned>(apply)));
  }
  return true;
}

bool WriteLabel(std::vector<uint8_t>& out, const std::string& label,
                Error* error) {
  if (label.size() > kLabelLength) {
    return Fail(error, ErrorCode::kEncoding,
                "label exceeds 32 bytes (" + std::to_string(label.size()) + ")");
  }
  std::array<uint8_t, kLabelLength> bytes{};
  std::memcpy(bytes.data(), label.data(), label.size());
  WriteBytes(out, bytes.data(), bytes.size());
  return true;
}

bool WriteEcho(std::vector<uint8_t>& out, const std::vector<uint8_t>& data,
               Error* error) {
  if (data.size() > kEchoLength) {
    return Fail(error, ErrorCode::kEncoding, "echo payload exceeds 64 bytes");
  }
  std::array<uint8_t, kEchoLength> bytes{};
  std::copy(data.begin(), data.end(), bytes.begin());
  WriteBytes(out, bytes.data(), bytes.size());
  return true;
}

bool CheckWaveform(Waveform waveform, Error* error) {
  if (static_cast<uint8_t>(waveform) > kMaxWaveform) {
    return Fail(error, ErrorCode::kEncoding,
                "waveform out of range: " +
                    std::to_string(static_cast<unsigned>(waveform)));
  }
  return true;
}

bool CheckZoneRange(uint8_t start_index, uint8_t end_index, Error* error) {
  if (start_index > end_index) {
    return Fail(error, ErrorCode::kEncoding, "zone start_index exceeds end_index");
  }
  return true;
}

// Payload encoders. Empty messages fall through to the template.
template <typename T>
bool EncodePayload(const T&, std::vector<uint8_t>&, Error*) {
  return true;
}

bool EncodePayload(const StateService& p, std::vector<uint8_t>& out, Error*) {
  out.push_back(p.service);
  WriteLe32(out, p.port);
  return true;
}

template <typename Info>
void EncodeNetInfo(const Info& p, std::vector<uint8_t>& out) {
  WriteFloat(out, p.signal);
  WriteLe32(out, p.tx);
  WriteLe32(out, p.rx);
  WriteLe16(out, static_cast<uint16_t>(p.reserved));
}

template <typename Firmware>
void EncodeFirmware(const Firmware& p, std::vector<uint8_t>& out) {
  WriteLe64(out, p.build);
  WriteLe64(out, p.reserved);
  WriteLe32(out, p.version);
}

bool EncodePayload(const StateHostInfo& p, std::vector<uint8_t>& out, Error*) {
  EncodeNetInfo(p, out);
  return true;
}

bool EncodePayload(const StateWifiInfo& p, std::vector<uint8_t>& out, Error*) {
  EncodeNetInfo(p, out);
  return true;
}

bool EncodePayload(const StateHostFirmware& p, std::vector<uint8_t>& out, Error*) {
  EncodeFirmware(p, out);
  return true;
}

bool EncodePayload(const StateWifiFirmware& p, std::vector<uint8_t>& out, Error*) {
  EncodeFirmware(p, out);
  return true;
}

bool EncodePayload(const SetPower& p, std::vector<uint8_t>& out, Error*) {
  WriteLe16(out, p.level);
  return true;
}

bool EncodePayload(const StatePower& p, std::vector<uint8_t>& out, Error*) {
  WriteLe16(out, p.level);
  return true;
}

bool EncodePayload(const SetLabel& p, std::vector<uint8_t>& out, Error* error) {
  return WriteLabel(out, p.label, error);
}

bool EncodePayload(const StateLabel& p, std::vector<uint8_t>& out, Error* error) {
  return WriteLabel(out, p.label, error);
}

bool EncodePayload(const StateVersion& p, std::vector<uint8_t>& out, Error*) {
  WriteLe32(out, p.vendor);
  WriteLe32(out, p.product);
  WriteLe32(out, p.version);
  return true;
}

bool EncodePayload(const StateInfo& p, std::vector<uint8_t>& out, Error*) {
  WriteLe64(out, p.time);
  WriteLe64(out, p.uptime);
  WriteLe64(out, p.downtime);
  return true;
}

bool EncodePayload(const StateLocation& p, std::vector<uint8_t>& out, Error* error) {
  WriteBytes(out, p.location.data(), p.location.size());
  if (!WriteLabel(out, p.label, error)) {
    return false;
  }
  WriteLe64(out, p.updated_at);
  return true;
}

bool EncodePayload(const StateGroup& p, std::vector<uint8_t>& out, Error* error) {
  WriteBytes(out, p.group.data(), p.group.size());
  if (!WriteLabel(out, p.label, error)) {
    return false;
  }
  WriteLe64(out, p.updated_at);
  return true;
}

bool EncodePayload(const EchoRequest& p, std::vector<uint8_t>& out, Error* error) {
  return WriteEcho(out, p.data, error);
}

bool EncodePayload(const EchoResponse& p, std::vector<uint8_t>& out, Error* error) {
  return WriteEcho(out, p.data, error);
}

bool EncodePayload(const LightSetColor& p, std::vector<uint8_t>& out, Error*) {
  out.push_back(0);
  WriteHsbk(out, p.color);
  WriteLe32(out, p.duration);
  return true;
}

template <typename WaveformMessage>
bool EncodeWaveformFields(const WaveformMessage& p, std::vector<uint8_t>& out,
                          Error* error) {
  if (!CheckWaveform(p.waveform, error)) {
    return false;
  }
  out.push_back(0);
  out.push_back(p.transient ? 1 : 0);
  WriteHsbk(out, p.color);
  WriteLe32(out, p.period);
  WriteFloat(out, p.cycles);
  WriteLe16(out, static_cast<uint16_t>(p.skew_ratio));
  out.push_back(static_cast<uint8_t>(p.waveform));
  return true;
}

bool EncodePayload(const LightSetWaveform& p, std::vector<uint8_t>& out,
                   Error* error) {
  return EncodeWaveformFields(p, out, error);
}

bool EncodePayload(const LightSetWaveformOptional& p, std::vector<uint8_t>& out,
                   Error* error) {
  if (!EncodeWaveformFields(p, out, error)) {
    return false;
  }
  out.push_back(p.set_hue ? 1 : 0);
  out.push_back(p.set_saturation ? 1 : 0);
  out.push_back(p.set_brightness ? 1 : 0);
  out.push_back(p.set_kelvin ? 1 : 0);
  return true;
}

bool EncodePayload(const LightState& p, std::vector<uint8_t>& out, Error* error) {
  WriteHsbk(out, p.color);
  WriteLe16(out, static_cast<uint16_t>(p.reserved1));
  WriteLe16(out, p.power_level);
  if (!WriteLabel(out, p.label, error)) {
    return false;
  }
  WriteLe64(out, p.reserved2);
  return true;
}

bool EncodePayload(const LightSetPower& p, std::vector<uint8_t>& out, Error*) {
  WriteLe16(out, p.level);
  WriteLe32(out, p.duration);
  return true;
}

bool EncodePayload(const LightStatePower& p, std::vector<uint8_t>& out, Error*) {
  WriteLe16(out, p.level);
  return true;
}

bool EncodePayload(const LightStateInfrared& p, std::vector<uint8_t>& out, Error*) {
  WriteLe16(out, p.brightness);
  return true;
}

bool EncodePayload(const LightSetInfrared& p, std::vector<uint8_t>& out, Error*) {
  WriteLe16(out, p.brightness);
  return true;
}

bool EncodePayload(const SetHevCycle& p, std::vector<uint8_t>& out, Error*) {
  out.push_back(p.enable ? 1 : 0);
  WriteLe32(out, p.duration);
  return true;
}

bool EncodePayload(const StateHevCycle& p, std::vector<uint8_t>& out, Error*) {
  WriteLe32(out, p.duration);
  WriteLe32(out, p.remaining);
  out.push_back(p.last_power ? 1 : 0);
  return true;
}

bool EncodePayload(const SetHevCycleConfiguration& p, std::vector<uint8_t>& out,
                   Error*) {
  out.push_back(p.indication ? 1 : 0);
  WriteLe32(out, p.duration);
  return true;
}

bool EncodePayload(const StateHevCycleConfiguration& p, std::vector<uint8_t>& out,
                   Error*) {
  out.push_back(p.indication ? 1 : 0);
  WriteLe32(out, p.duration);
  return true;
}

bool EncodePayload(const StateLastHevCycleResult& p, std::vector<uint8_t>& out,
                   Error*) {
  out.push_back(p.result);
  return true;
}

bool EncodePayload(const SetColorZones& p, std::vector<uint8_t>& out, Error* error) {
  if (!CheckZoneRange(p.start_index, p.end_index, error) ||
      !CheckZoneApply(p.apply, error)) {
    return false;
  }
  out.push_back(p.start_index);
  out.push_back(p.end_index);
  WriteHsbk(out, p.color);
  WriteLe32(out, p.duration);
  out.push_back(static_cast<uint8_t>(p.apply));
  return true;
}

bool EncodePayload(const GetColorZones& p, std::vector<uint8_t>& out, Error* error) {
  if (!CheckZoneRange(p.start_index, p.end_index, error)) {
    return false;
  }
  out.push_back(p.start_index);
  out.push_back(p.end_index);
  return true;
}

bool EncodePayload(const StateZone& p, std::vector<uint8_t>& out, Error*) {
  out.push_back(p.count);
  out.push_back(p.index);
  WriteHsbk(out, p.color);
  return true;
}

bool EncodePayload(const StateMultiZone& p, std::vector<uint8_t>& out, Error*) {
  out.push_back(p.count);
  out.push_back(p.index);
  for (const auto& color : p.colors) {
    WriteHsbk(out, color);
  }
  return true;
}

template <typename Effect>
void EncodeMultiZoneEffect(const Effect& p, std::vector<uint8_t>& out) {
  WriteLe32(out, p.instance_id);
  out.push_back(static_cast<uint8_t>(p.type));
  WriteZeros(out, 2);
  WriteLe32(out, p.speed);
  WriteLe64(out, p.duration);
  WriteZeros(out, 8);
  for (uint32_t parameter : p.parameters) {
    WriteLe32(out, parameter);
  }
}

bool EncodePayload(const SetMultiZoneEffect& p, std::vector<uint8_t>& out, Error*) {
  EncodeMultiZoneEffect(p, out);
  return true;
}

bool EncodePayload(const StateMultiZoneEffect& p, std::vector<uint8_t>& out,
                   Error*) {
  EncodeMultiZoneEffect(p, out);
  return true;
}

bool EncodePayload(const SetExtendedColorZones& p, std::vector<uint8_t>& out,
                   Error* error) {
  if (!CheckCount(p.colors.size(), kExtendedZonesPerMessage, "extended zone colors",
                  error) ||
      !CheckZoneApply(p.apply, error)) {
    return false;
  }
  WriteLe32(out, p.duration);
  out.push_back(static_cast<uint8_t>(p.apply));
  WriteLe16(out, p.zone_index);
  out.push_back(static_cast<uint8_t>(p.colors.size()));
  WriteHsbkList(out, p.colors, kExtendedZonesPerMessage);
  return true;
}

bool EncodePayload(const StateExtendedColorZones& p, std::vector<uint8_t>& out,
                   Error* error) {
  if (!CheckCount(p.colors.size(), kExtendedZonesPerMessage, "extended zone colors",
                  error)) {
    return false;
  }
  WriteLe16(out, p.count);
  WriteLe16(out, p.index);
  out.push_back(static_cast<uint8_t>(p.colors.size()));
  WriteHsbkList(out, p.colors, kExtendedZonesPerMessage);
  return true;
}

void EncodeTileDevice(const TileDevice& tile, std::vector<uint8_t>& out) {
  WriteLe16(out, static_cast<uint16_t>(tile.accel_meas_x));
  WriteLe16(out, static_cast<uint16_t>(tile.accel_meas_y));
  WriteLe16(out, static_cast<uint16_t>(tile.accel_meas_z));
  WriteZeros(out, 2);
  WriteFloat(out, tile.user_x);
  WriteFloat(out, tile.user_y);
  out.push_back(tile.width);
  out.push_back(tile.height);
  WriteZeros(out, 1);
  WriteLe32(out, tile.vendor);
  WriteLe32(out, tile.product);
  WriteZeros(out, 4);
  WriteLe64(out, tile.firmware_build);
  WriteZeros(out, 8);
  WriteLe16(out, tile.firmware_version_minor);
  WriteLe16(out, tile.firmware_version_major);
  WriteZeros(out, 4);
}

bool EncodePayload(const TileStateDeviceChain& p, std::vector<uint8_t>& out,
                   Error* error) {
  if (!CheckCount(p.tiles.size(), kMaxTileDevices, "tile devices", error)) {
    return false;
  }
  out.push_back(p.start_index);
  for (const auto& tile : p.tiles) {
    EncodeTileDevice(tile, out);
  }
  WriteZeros(out, (kMaxTileDevices - p.tiles.size()) * kTileDeviceSize);
  out.push_back(static_cast<uint8_t>(p.tiles.size()));
  return true;
}

bool EncodePayload(const TileGet64& p, std::vector<uint8_t>& out, Error*) {
  out.push_back(p.tile_index);
  out.push_back(p.length);
  WriteZeros(out, 1);
  out.push_back(p.x);
  out.push_back(p.y);
  out.push_back(p.width);
  return true;
}

bool EncodePayload(const TileSet64& p, std::vector<uint8_t>& out, Error*) {
  out.push_back(p.tile_index);
  out.push_back(p.length);
  WriteZeros(out, 1);
  out.push_back(p.x);
  out.push_back(p.y);
  out.push_back(p.width);
  WriteLe32(out, p.duration);
  for (const auto& color : p.colors) {
    WriteHsbk(out, color);
  }
  return true;
}

bool EncodePayload(const TileState64& p, std::vector<uint8_t>& out, Error*) {
  out.push_back(p.tile_index);
  WriteZeros(out, 1);
  out.push_back(p.x);
  out.push_back(p.y);
  out.push_back(p.width);
  for (const auto& color : p.colors) {
    WriteHsbk(out, color);
  }
  return true;
}

template <typename Effect>
bool EncodeTileEffect(const Effect& p, size_t lead, std::vector<uint8_t>& out,
                      Error* error) {
  if (!CheckCount(p.palette.size(), kTilePaletteSize, "tile effect palette",
                  error)) {
    return false;
  }
  WriteZeros(out, lead);
  WriteLe32(out, p.instance_id);
  out.push_back(static_cast<uint8_t>(p.type));
  WriteLe32(out, p.speed);
  WriteLe64(out, p.duration);
  WriteZeros(out, 8);
  // Parameter block: sky type, then the cloud saturation bounds.
  out.push_back(static_cast<uint8_t>(p.sky_type));
  WriteZeros(out, 3);
  out.push_back(p.cloud_saturation_min);
  WriteZeros(out, 3);
  out.push_back(p.cloud_saturation_max);
  WriteZeros(out, 23);
  out.push_back(static_cast<uint8_t>(p.palette.size()));
  WriteHsbkList(out, p.palette, kTilePaletteSize);
  return true;
}

bool EncodePayload(const TileSetEffect& p, std::vector<uint8_t>& out, Error* error) {
  return EncodeTileEffect(p, kTileSetEffectLead, out, error);
}

bool EncodePayload(const TileStateEffect& p, std::vector<uint8_t>& out,
                   Error* error) {
  return EncodeTileEffect(p, kTileStateEffectLead, out, error);
}

bool EncodePayload(const GetRPower& p, std::vector<uint8_t>& out, Error*) {
  out.push_back(p.relay_index);
  return true;
}

bool EncodePayload(const SetRPower& p, std::vector<uint8_t>& out, Error*) {
  out.push_back(p.relay_index);
  WriteLe16(out, p.level);
  return true;
}

bool EncodePayload(const StateRPower& p, std::vector<uint8_t>& out, Error*) {
  out.push_back(p.relay_index);
  WriteLe16(out, p.level);
  return true;
}

bool EncodePayload(const StateButton& p, std::vector<uint8_t>& out, Error*) {
  out.push_back(p.count);
  out.push_back(p.index);
  out.push_back(p.buttons_count);
  for (const auto& button : p.buttons) {
    out.push_back(button.actions_count);
    for (const auto& action : button.actions) {
      WriteLe16(out, static_cast<uint16_t>(action.gesture));
      WriteLe16(out, static_cast<uint16_t>(action.target_type));
      WriteBytes(out, action.target.data(), action.target.size());
    }
  }
  return true;
}

template <typename ButtonConfig>
void EncodeButtonConfig(const ButtonConfig& p, std::vector<uint8_t>& out) {
  WriteLe16(out, p.haptic_duration_ms);
  WriteHsbk(out, p.backlight_on_color);
  WriteHsbk(out, p.backlight_off_color);
}

bool EncodePayload(const SetButtonConfig& p, std::vector<uint8_t>& out, Error*) {
  EncodeButtonConfig(p, out);
  return true;
}

bool EncodePayload(const StateButtonConfig& p, std::vector<uint8_t>& out, Error*) {
  EncodeButtonConfig(p, out);
  return true;
}

bool EncodePayload(const UnknownPayload& p, std::vector<uint8_t>& out, Error*) {
  WriteBytes(out, p.bytes.data(), p.bytes.size());
  return true;
}

// Minimum payload length for each known type code.
size_t PayloadSizeFor(MessageType type) {
  switch (type) {
    case MessageType::kStateService:
      return 5;
    case MessageType::kStateHostInfo:
    case MessageType::kStateWifiInfo:
      return 14;
    case MessageType::kStateHostFirmware:
    case MessageType::kStateWifiFirmware:
      return 20;
    case MessageType::kSetPower:
    case MessageType::kStatePower:
    case MessageType::kLightStatePower:
    case MessageType::kLightStateInfrared:
    case MessageType::kLightSetInfrared:
    case MessageType::kGetColorZones:
      return 2;
    case MessageType::kSetLabel:
    case MessageType::kStateLabel:
      return kLabelLength;
    case MessageType::kStateVersion:
      return 12;
    case MessageType::kStateInfo:
      return 24;
    case MessageType::kStateLocation:
    case MessageType::kStateGroup:
      return kLocationIdSize + kLabelLength + 8;
    case MessageType::kEchoRequest:
    case MessageType::kEchoResponse:
      return kEchoLength;
    case MessageType::kLightSetColor:
      return 1 + kHsbkSize + 4;
    case MessageType::kLightSetWaveform:
      return 21;
    case MessageType::kLightSetWaveformOptional:
      return 25;
    case MessageType::kLightState:
      return kHsbkSize + 4 + kLabelLength + 8;
    case MessageType::kLightSetPower:
      return 6;
    case MessageType::kSetHevCycle:
    case MessageType::kSetHevCycleConfiguration:
    case MessageType::kStateHevCycleConfiguration:
      return 5;
    case MessageType::kStateHevCycle:
      return 9;
    case MessageType::kStateLastHevCycleResult:
      return 1;
    case MessageType::kSetColorZones:
      return 2 + kHsbkSize + 4 + 1;
    case MessageType::kStateZone:
      return 2 + kHsbkSize;
    case MessageType::kStateMultiZone:
      return 2 + kHsbkSize * kZonesPerMessage;
    case MessageType::kSetMultiZoneEffect:
    case MessageType::kStateMultiZoneEffect:
      return kMultiZoneEffectSize;
    case MessageType::kSetExtendedColorZones:
      return 8 + kHsbkSize * kExtendedZonesPerMessage;
    case MessageType::kStateExtendedColorZones:
      return 5 + kHsbkSize * kExtendedZonesPerMessage;
    case MessageType::kTileStateDeviceChain:
      return 2 + kTileDeviceSize * kMaxTileDevices;
    case MessageType::kTileGet64:
      return 6;
    case MessageType::kTileSet64:
      return 10 + kHsbkSize * kTileColorCount;
    case MessageType::kTileState64:
      return 5 + kHsbkSize * kTileColorCount;
    case MessageType::kTileSetEffect:
      return kTileSetEffectLead + 25 + kTileEffectParametersSize + 1 +
             kHsbkSize * kTilePaletteSize;
    case MessageType::kTileStateEffect:
      return kTileStateEffectLead + 25 + kTileEffectParametersSize + 1 +
             kHsbkSize * kTilePaletteSize;
    case MessageType::kGetRPower:
      return 1;
    case MessageType::kSetRPower:
    case MessageType::kStateRPower:
      return 3;
    case MessageType::kStateButton:
      return 3 + kButtonSize * kButtonsPerMessage;
    case MessageType::kSetButtonConfig:
    case MessageType::kStateButtonConfig:
      return 2 + 2 * kHsbkSize;
    default:
      return 0;
  }
}

bool IsKnownType(uint16_t type) {
  return std::find(std::begin(kTypeByIndex), std::end(kTypeByIndex),
                   static_cast<MessageType>(type)) != std::end(kTypeByIndex);
}

template <typename Info>
Info DecodeNetInfo(const uint8_t* p) {
  Info info;
  info.signal = ReadFloat(p, 0);
  info.tx = ReadLe32(p, 4);
  info.rx = ReadLe32(p, 8);
  info.reserved = static_cast<int16_t>(ReadLe16(p, 12));
  return info;
}

template <typename Firmware>
Firmware DecodeFirmware(const uint8_t* p) {
  Firmware firmware;
  firmware.build = ReadLe64(p, 0);
  firmware.reserved = ReadLe64(p, 8);
  firmware.version = ReadLe32(p, 16);
  return firmware;
}

template <typename WaveformMessage>
void DecodeWaveformFields(const uint8_t* p, WaveformMessage* out) {
  out->transient = p[1] != 0;
  out->color = ReadHsbk(p, 2);
  out->period = ReadLe32(p, 10);
  out->cycles = ReadFloat(p, 14);
  out->skew_ratio = static_cast<int16_t>(ReadLe16(p, 18));
  out->waveform = static_cast<Waveform>(p[20]);
}

template <typename Effect>
Effect DecodeMultiZoneEffect(const uint8_t* p) {
  Effect effect;
  effect.instance_id = ReadLe32(p, 0);
  effect.type = static_cast<MultiZoneEffectType>(p[4]);
  effect.speed = ReadLe32(p, 7);
  effect.duration = ReadLe64(p, 11);
  for (size_t i = 0; i < kEffectParameterCount; ++i) {
    effect.parameters[i] = ReadLe32(p, 27 + i * 4);
  }
  return effect;
}

TileDevice DecodeTileDevice(const uint8_t* p) {
  TileDevice tile;
  tile.accel_meas_x = static_cast<int16_t>(ReadLe16(p, 0));
  tile.accel_meas_y = static_cast<int16_t>(ReadLe16(p, 2));
  tile.accel_meas_z = static_cast<int16_t>(ReadLe16(p, 4));
  tile.user_x = ReadFloat(p, 8);
  tile.user_y = ReadFloat(p, 12);
  tile.width = p[16];
  tile.height = p[17];
  tile.vendor = ReadLe32(p, 19);
  tile.product = ReadLe32(p, 23);
  tile.firmware_build = ReadLe64(p, 31);
  tile.firmware_version_minor = ReadLe16(p, 47);
  tile.firmware_version_major = ReadLe16(p, 49);
  return tile;
}

template <typename Effect>
Effect DecodeTileEffect(const uint8_t* data, size_t lead) {
  const uint8_t* p = data + lead;
  Effect effect;
  effect.instance_id = ReadLe32(p, 0);
  effect.type = static_cast<TileEffectType>(p[4]);
  effect.speed = ReadLe32(p, 5);
  effect.duration = ReadLe64(p, 9);
  effect.sky_type = static_cast<TileEffectSkyType>(p[25]);
  effect.cloud_saturation_min = p[29];
  effect.cloud_saturation_max = p[33];
  const size_t count = std::min<size_t>(p[57], kTilePaletteSize);
  effect.palette = ReadHsbkList(p, 58, count);
  return effect;
}

template <typename ButtonConfig>
ButtonConfig DecodeButtonConfig(const uint8_t* p) {
  ButtonConfig config;
  config.haptic_duration_ms = ReadLe16(p, 0);
  config.backlight_on_color = ReadHsbk(p, 2);
  config.backlight_off_color = ReadHsbk(p, 2 + kHsbkSize);
  return config;
}

StateButton DecodeStateButton(const uint8_t* p) {
  StateButton msg;
  msg.count = p[0];
  msg.index = p[1];
  msg.buttons_count = p[2];
  for (size_t b = 0; b < kButtonsPerMessage; ++b) {
    const uint8_t* button = p + 3 + b * kButtonSize;
    msg.buttons[b].actions_count = button[0];
    for (size_t a = 0; a < kActionsPerButton; ++a) {
      const uint8_t* action = button + 1 + a * kButtonActionSize;
      ButtonAction& out = msg.buttons[b].actions[a];
      out.gesture = static_cast<ButtonGesture>(ReadLe16(action, 0));
      out.target_type = static_cast<ButtonTargetType>(ReadLe16(action, 2));
      std::copy(action + 4, action + kButtonActionSize, out.target.begin());
    }
  }
  return msg;
}

// Decode a payload whose length has already been checked.
Payload DecodePayload(uint16_t type, const uint8_t* p, size_t length) {
  switch (static_cast<MessageType>(type)) {
    case MessageType::kGetService:
      return GetService{};
    case MessageType::kStateService: {
      StateService msg;
      msg.service = p[0];
      msg.port = ReadLe32(p, 1);
      return msg;
    }
    case MessageType::kGetHostInfo:
      return GetHostInfo{};
    case MessageType::kStateHostInfo:
      return DecodeNetInfo<StateHostInfo>(p);
    case MessageType::kGetHostFirmware:
      return GetHostFirmware{};
    case MessageType::kStateHostFirmware:
      return DecodeFirmware<StateHostFirmware>(p);
    case MessageType::kGetWifiInfo:
      return GetWifiInfo{};
    case MessageType::kStateWifiInfo:
      return DecodeNetInfo<StateWifiInfo>(p);
    case MessageType::kGetWifiFirmware:
      return GetWifiFirmware{};
    case MessageType::kStateWifiFirmware:
      return DecodeFirmware<StateWifiFirmware>(p);
    case MessageType::kGetPower:
      return GetPower{};
    case MessageType::kSetPower:
      return SetPower{ReadLe16(p, 0)};
    case MessageType::kStatePower:
      return StatePower{ReadLe16(p, 0)};
    case MessageType::kGetLabel:
      return GetLabel{};
    case MessageType::kSetLabel:
      return SetLabel{ReadLabel(p, 0)};
    case MessageType::kStateLabel:
      return StateLabel{ReadLabel(p, 0)};
    case MessageType::kGetVersion:
      return GetVersion{};
    case MessageType::kStateVersion:
      return StateVersion{ReadLe32(p, 0), ReadLe32(p, 4), ReadLe32(p, 8)};
    case MessageType::kGetInfo:
      return GetInfo{};
    case MessageType::kStateInfo:
      return StateInfo{ReadLe64(p, 0), ReadLe64(p, 8), ReadLe64(p, 16)};
    case MessageType::kSetReboot:
      return SetReboot{};
    case MessageType::kAcknowledgement:
      return Acknowledgement{};
    case MessageType::kGetLocation:
      return GetLocation{};
    case MessageType::kStateLocation: {
      StateLocation msg;
      std::copy(p, p + kLocationIdSize, msg.location.begin());
      msg.label = ReadLabel(p, kLocationIdSize);
      msg.updated_at = ReadLe64(p, kLocationIdSize + kLabelLength);
      return msg;
    }
    case MessageType::kGetGroup:
      return GetGroup{};
    case MessageType::kStateGroup: {
      StateGroup msg;
      std::copy(p, p + kLocationIdSize, msg.group.begin());
      msg.label = ReadLabel(p, kLocationIdSize);
      msg.updated_at = ReadLe64(p, kLocationIdSize + kLabelLength);
      return msg;
    }
    case MessageType::kEchoRequest:
      return EchoRequest{std::vector<uint8_t>(p, p + kEchoLength)};
    case MessageType::kEchoResponse:
      return EchoResponse{std::vector<uint8_t>(p, p + kEchoLength)};
    case MessageType::kLightGet:
      return LightGet{};
    case MessageType::kLightSetColor: {
      LightSetColor msg;
      msg.color = ReadHsbk(p, 1);
      msg.duration = ReadLe32(p, 9);
      return msg;
    }
    case MessageType::kLightSetWaveform: {
      LightSetWaveform msg;
      DecodeWaveformFields(p, &msg);
      return msg;
    }
    case MessageType::kLightSetWaveformOptional: {
      LightSetWaveformOptional msg;
      DecodeWaveformFields(p, &msg);
      msg.set_hue = p[21] != 0;
      msg.set_saturation = p[22] != 0;
      msg.set_brightness = p[23] != 0;
      msg.set_kelvin = p[24] != 0;
      return msg;
    }
    case MessageType::kLightState: {
      LightState msg;
      msg.color = ReadHsbk(p, 0);
      msg.reserved1 = static_cast<int16_t>(ReadLe16(p, 8));
      msg.power_level = ReadLe16(p, 10);
      msg.label = ReadLabel(p, 12);
      msg.reserved2 = ReadLe64(p, 12 + kLabelLength);
      return msg;
    }
    case MessageType::kLightGetPower:
      return LightGetPower{};
    case MessageType::kLightSetPower:
      return LightSetPower{ReadLe16(p, 0), ReadLe32(p, 2)};
    case MessageType::kLightStatePower:
      return LightStatePower{ReadLe16(p, 0)};
    case MessageType::kLightGetInfrared:
      return LightGetInfrared{};
    case MessageType::kLightStateInfrared:
      return LightStateInfrared{ReadLe16(p, 0)};
    case MessageType::kLightSetInfrared:
      return LightSetInfrared{ReadLe16(p, 0)};
    case MessageType::kGetHevCycle:
      return GetHevCycle{};
    case MessageType::kSetHevCycle:
      return SetHevCycle{p[0] != 0, ReadLe32(p, 1)};
    case MessageType::kStateHevCycle:
      return StateHevCycle{ReadLe32(p, 0), ReadLe32(p, 4), p[8] != 0};
    case MessageType::kGetHevCycleConfiguration:
      return GetHevCycleConfiguration{};
    case MessageType::kSetHevCycleConfiguration:
      return SetHevCycleConfiguration{p[0] != 0, ReadLe32(p, 1)};
    case MessageType::kStateHevCycleConfiguration:
      return StateHevCycleConfiguration{p[0] != 0, ReadLe32(p, 1)};
    case MessageType::kGetLastHevCycleResult:
      return GetLastHevCycleResult{};
    case MessageType::kStateLastHevCycleResult:
      return StateLastHevCycleResult{p[0]};
    case MessageType::kSetColorZones: {
      SetColorZones msg;
      msg.start_index = p[0];
      msg.end_index = p[1];
      msg.color = ReadHsbk(p, 2);
      msg.duration = ReadLe32(p, 10);
      msg.apply = static_cast<ZoneApply>(p[14]);
      return msg;
    }
    case MessageType::kGetColorZones:
      return GetColorZones{p[0], p[1]};
    case MessageType::kStateZone:
      return StateZone{p[0], p[1], ReadHsbk(p, 2)};
    case MessageType::kStateMultiZone: {
      StateMultiZone msg;
      msg.count = p[0];
      msg.index = p[1];
      for (size_t i = 0; i < kZonesPerMessage; ++i) {
        msg.colors[i] = ReadHsbk(p, 2 + i * kHsbkSize);
      }
      return msg;
    }
    case MessageType::kGetMultiZoneEffect:
      return GetMultiZoneEffect{};
    case MessageType::kSetMultiZoneEffect:
      return DecodeMultiZoneEffect<SetMultiZoneEffect>(p);
    case MessageType::kStateMultiZoneEffect:
      return DecodeMultiZoneEffect<StateMultiZoneEffect>(p);
    case MessageType::kSetExtendedColorZones: {
      SetExtendedColorZones msg;
      msg.duration = ReadLe32(p, 0);
      msg.apply = static_cast<ZoneApply>(p[4]);
      msg.zone_index = ReadLe16(p, 5);
      msg.colors =
          ReadHsbkList(p, 8, std::min<size_t>(p[7], kExtendedZonesPerMessage));
      return msg;
    }
    case MessageType::kGetExtendedColorZones:
      return GetExtendedColorZones{};
    case MessageType::kStateExtendedColorZones: {
      StateExtendedColorZones msg;
      msg.count = ReadLe16(p, 0);
      msg.index = ReadLe16(p, 2);
      msg.colors =
          ReadHsbkList(p, 5, std::min<size_t>(p[4], kExtendedZonesPerMessage));
      return msg;
    }
    case MessageType::kTileGetDeviceChain:
      return TileGetDeviceChain{};
    case MessageType::kTileStateDeviceChain: {
      TileStateDeviceChain msg;
      msg.start_index = p[0];
      const size_t count =
          std::min<size_t>(p[1 + kTileDeviceSize * kMaxTileDevices], kMaxTileDevices);
      for (size_t i = 0; i < count; ++i) {
        msg.tiles.push_back(DecodeTileDevice(p + 1 + i * kTileDeviceSize));
      }
      return msg;
    }
    case MessageType::kTileGet64: {
      TileGet64 msg;
      msg.tile_index = p[0];
      msg.length = p[1];
      msg.x = p[3];
      msg.y = p[4];
      msg.width = p[5];
      return msg;
    }
    case MessageType::kTileState64: {
      TileState64 msg;
      msg.tile_index = p[0];
      msg.x = p[2];
      msg.y = p[3];
      msg.width = p[4];
      for (size_t i = 0; i < kTileColorCount; ++i) {
        msg.colors[i] = ReadHsbk(p, 5 + i * kHsbkSize);
      }
      return msg;
    }
    case MessageType::kTileSet64: {
      TileSet64 msg;
      msg.tile_index = p[0];
      msg.length = p[1];
      msg.x = p[3];
      msg.y = p[4];
      msg.width = p[5];
      msg.duration = ReadLe32(p, 6);
      for (size_t i = 0; i < kTileColorCount; ++i) {
        msg.colors[i] = ReadHsbk(p, 10 + i * kHsbkSize);
      }
      return msg;
    }
    case MessageType::kTileGetEffect:
      return TileGetEffect{};
    case MessageType::kTileSetEffect:
      return DecodeTileEffect<TileSetEffect>(p, kTileSetEffectLead);
    case MessageType::kTileStateEffect:
      return DecodeTileEffect<TileStateEffect>(p, kTileStateEffectLead);
    case MessageType::kGetRPower:
      return GetRPower{p[0]};
    case MessageType::kSetRPower:
      return SetRPower{p[0], ReadLe16(p, 1)};
    case MessageType::kStateRPower:
      return StateRPower{p[0], ReadLe16(p, 1)};
    case MessageType::kGetButton:
      return GetButton{};
    case MessageType::kStateButton:
      return DecodeStateButton(p);
    case MessageType::kGetButtonConfig:
      return GetButtonConfig{};
    case MessageType::kSetButtonConfig:
      return DecodeButtonConfig<SetButtonConfig>(p);
    case MessageType::kStateButtonConfig:
      return DecodeButtonConfig<StateButtonConfig>(p);
  }
  return UnknownPayload{type, std::vector<uint8_t>(p, p + length)};
}

}  // namespace

bool operator==(const Hsbk& a, const Hsbk& b) {
  return a.hue == b.hue && a.saturation == b.saturation &&
         a.brightness == b.brightness && a.kelvin == b.kelvin;
}

bool operator!=(const Hsbk& a, const Hsbk& b) { return !(a == b); }

uint16_t PayloadType(const Payload& payload) {
  if (const auto* unknown = std::get_if<UnknownPayload>(&payload)) {
    return unknown->type;
  }
  return Code(kTypeByIndex[payload.index()]);
}

uint16_t Message::type() const { return PayloadType(payload); }

std::string MessageTypeName(uint16_t type) {
  switch (static_cast<MessageType>(type)) {
    case MessageType::kGetService: return "GetService";
    case MessageType::kStateService: return "StateService";
    case MessageType::kGetHostInfo: return "GetHostInfo";
    case MessageType::kStateHostInfo: return "StateHostInfo";
    case MessageType::kGetHostFirmware: return "GetHostFirmware";
    case MessageType::kStateHostFirmware: return "StateHostFirmware";
    case MessageType::kGetWifiInfo: return "GetWifiInfo";
    case MessageType::kStateWifiInfo: return "StateWifiInfo";
    case MessageType::kGetWifiFirmware: return "GetWifiFirmware";
    case MessageType::kStateWifiFirmware: return "StateWifiFirmware";
    case MessageType::kGetPower: return "GetPower";
    case MessageType::kSetPower: return "SetPower";
    case MessageType::kStatePower: return "StatePower";
    case MessageType::kGetLabel: return "GetLabel";
    case MessageType::kSetLabel: return "SetLabel";
    case MessageType::kStateLabel: return "StateLabel";
    case MessageType::kGetVersion: return "GetVersion";
    case MessageType::kStateVersion: return "StateVersion";
    case MessageType::kGetInfo: return "GetInfo";
    case MessageType::kStateInfo: return "StateInfo";
    case MessageType::kSetReboot: return "SetReboot";
    case MessageType::kAcknowledgement: return "Acknowledgement";
    case MessageType::kGetLocation: return "GetLocation";
    case MessageType::kStateLocation: return "StateLocation";
    case MessageType::kGetGroup: return "GetGroup";
    case MessageType::kStateGroup: return "StateGroup";
    case MessageType::kEchoRequest: return "EchoRequest";
    case MessageType::kEchoResponse: return "EchoResponse";
    case MessageType::kLightGet: return "LightGet";
    case MessageType::kLightSetColor: return "LightSetColor";
    case MessageType::kLightSetWaveform: return "LightSetWaveform";
    case MessageType::kLightState: return "LightState";
    case MessageType::kLightGetPower: return "LightGetPower";
    case MessageType::kLightSetPower: return "LightSetPower";
    case MessageType::kLightStatePower: return "LightStatePower";
    case MessageType::kLightSetWaveformOptional: return "LightSetWaveformOptional";
    case MessageType::kLightGetInfrared: return "LightGetInfrared";
    case MessageType::kLightStateInfrared: return "LightStateInfrared";
    case MessageType::kLightSetInfrared: return "LightSetInfrared";
    case MessageType::kGetHevCycle: return "GetHevCycle";
    case MessageType::kSetHevCycle: return "SetHevCycle";
    case MessageType::kStateHevCycle: return "StateHevCycle";
    case MessageType::kGetHevCycleConfiguration: return "GetHevCycleConfiguration";
    case MessageType::kSetHevCycleConfiguration: return "SetHevCycleConfiguration";
    case MessageType::kStateHevCycleConfiguration: return "StateHevCycleConfiguration";
    case MessageType::kGetLastHevCycleResult: return "GetLastHevCycleResult";
    case MessageType::kStateLastHevCycleResult: return "StateLastHevCycleResult";
    case MessageType::kSetColorZones: return "SetColorZones";
    case MessageType::kGetColorZones: return "GetColorZones";
    case MessageType::kStateZone: return "StateZone";
    case MessageType::kStateMultiZone: return "StateMultiZone";
    case MessageType::kGetMultiZoneEffect: return "GetMultiZoneEffect";
    case MessageType::kSetMultiZoneEffect: return "SetMultiZoneEffect";
    case MessageType::kStateMultiZoneEffect: return "StateMultiZoneEffect";
    case MessageType::kSetExtendedColorZones: return "SetExtendedColorZones";
    case MessageType::kGetExtendedColorZones: return "GetExtendedColorZones";
    case MessageType::kStateExtendedColorZones: return "StateExtendedColorZones";
    case MessageType::kTileGetDeviceChain: return "TileGetDeviceChain";
    case MessageType::kTileStateDeviceChain: return "TileStateDeviceChain";
    case MessageType::kTileGet64: return "TileGet64";
    case MessageType::kTileState64: return "TileState64";
    case MessageType::kTileSet64: return "TileSet64";
    case MessageType::kTileGetEffect: return "TileGetEffect";
    case MessageType::kTileSetEffect: return "TileSetEffect";
    case MessageType::kTileStateEffect: return "TileStateEffect";
    case MessageType::kGetRPower: return "GetRPower";
    case MessageType::kSetRPower: return "SetRPower";
    case MessageType::kStateRPower: return "StateRPower";
    case MessageType::kGetButton: return "GetButton";
    case MessageType::kStateButton: return "StateButton";
    case MessageType::kGetButtonConfig: return "GetButtonConfig";
    case MessageType::kSetButtonConfig: return "SetButtonConfig";
    case MessageType::kStateButtonConfig: return "StateButtonConfig";
  }
  return "Unknown(" + std::to_string(type) + ")";
}

bool IsQuery(uint16_t type) {
  switch (static_cast<MessageType>(type)) {
    case MessageType::kGetService:
    case MessageType::kGetHostInfo:
    case MessageType::kGetHostFirmware:
    case MessageType::kGetWifiInfo:
    case MessageType::kGetWifiFirmware:
    case MessageType::kGetPower:
    case MessageType::kGetLabel:
    case MessageType::kGetVersion:
    case MessageType::kGetInfo:
    case MessageType::kGetLocation:
    case MessageType::kGetGroup:
    case MessageType::kEchoRequest:
    case MessageType::kLightGet:
    case MessageType::kLightGetPower:
    case MessageType::kLightGetInfrared:
    case MessageType::kGetHevCycle:
    case MessageType::kGetHevCycleConfiguration:
    case MessageType::kGetLastHevCycleResult:
    case MessageType::kGetColorZones:
    case MessageType::kGetMultiZoneEffect:
    case MessageType::kGetExtendedColorZones:
    case MessageType::kTileGetDeviceChain:
    case MessageType::kTileGet64:
    case MessageType::kTileGetEffect:
    case MessageType::kGetRPower:
    case MessageType::kGetButton:
    case MessageType::kGetButtonConfig:
      return true;
    default:
      return false;
  }
}

std::vector<uint16_t> ResponseTypesFor(uint16_t request_type) {
  switch (static_cast<MessageType>(request_type)) {
    case MessageType::kGetService:
      return {Code(MessageType::kStateService)};
    case MessageType::kGetHostInfo:
      return {Code(MessageType::kStateHostInfo)};
    case MessageType::kGetHostFirmware:
      return {Code(MessageType::kStateHostFirmware)};
    case MessageType::kGetWifiInfo:
      return {Code(MessageType::kStateWifiInfo)};
    case MessageType::kGetWifiFirmware:
      return {Code(MessageType::kStateWifiFirmware)};
    case MessageType::kGetPower:
    case MessageType::kSetPower:
      return {Code(MessageType::kStatePower)};
    case MessageType::kGetLabel:
    case MessageType::kSetLabel:
      return {Code(MessageType::kStateLabel)};
    case MessageType::kGetVersion:
      return {Code(MessageType::kStateVersion)};
    case MessageType::kGetInfo:
      return {Code(MessageType::kStateInfo)};
    case MessageType::kGetLocation:
      return {Code(MessageType::kStateLocation)};
    case MessageType::kGetGroup:
      return {Code(MessageType::kStateGroup)};
    case MessageType::kEchoRequest:
      return {Code(MessageType::kEchoResponse)};
    case MessageType::kLightGet:
    case MessageType::kLightSetColor:
    case MessageType::kLightSetWaveform:
    case MessageType::kLightSetWaveformOptional:
      return {Code(MessageType::kLightState)};
    case MessageType::kLightGetPower:
    case MessageType::kLightSetPower:
      return {Code(MessageType::kLightStatePower)};
    case MessageType::kLightGetInfrared:
    case MessageType::kLightSetInfrared:
      return {Code(MessageType::kLightStateInfrared)};
    case MessageType::kGetHevCycle:
    case MessageType::kSetHevCycle:
      return {Code(MessageType::kStateHevCycle)};
    case MessageType::kGetHevCycleConfiguration:
    case MessageType::kSetHevCycleConfiguration:
      return {Code(MessageType::kStateHevCycleConfiguration)};
    case MessageType::kGetLastHevCycleResult:
      return {Code(MessageType::kStateLastHevCycleResult)};
    case MessageType::kGetColorZones:
    case MessageType::kSetColorZones:
      return {Code(MessageType::kStateZone), Code(MessageType::kStateMultiZone)};
    case MessageType::kGetMultiZoneEffect:
    case MessageType::kSetMultiZoneEffect:
      return {Code(MessageType::kStateMultiZoneEffect)};
    case MessageType::kGetExtendedColorZones:
    case MessageType::kSetExtendedColorZones:
      return {Code(MessageType::kStateExtendedColorZones)};
    case MessageType::kTileGetDeviceChain:
      return {Code(MessageType::kTileStateDeviceChain)};
    case MessageType::kTileGet64:
    case MessageType::kTileSet64:
      return {Code(MessageType::kTileState64)};
    case MessageType::kTileGetEffect:
    case MessageType::kTileSetEffect:
      return {Code(MessageType::kTileStateEffect)};
    case MessageType::kGetRPower:
    case MessageType::kSetRPower:
      return {Code(MessageType::kStateRPower)};
    case MessageType::kGetButton:
      return {Code(MessageType::kStateButton)};
    case MessageType::kGetButtonConfig:
    case MessageType::kSetButtonConfig:
      return {Code(MessageType::kStateButtonConfig)};
    default:
      return {};
  }
}

Header MakeHeader(const MacAddress& target, uint32_t source, uint8_t sequence,
                  bool ack_required, bool res_required) {
  Header header;
  header.target = target;
  header.tagged = IsZeroMac(target);
  header.source = source;
  header.sequence = sequence;
  header.ack_required = ack_required;
  header.res_required = res_required;
  return header;
}

bool EncodeMessage(const Header& header, const Payload& payload,
                   std::vector<uint8_t>* out, Error* error) {
  if (!out) {
    return Fail(error, ErrorCode::kEncoding, "output buffer is null");
  }
  if (header.protocol > kProtocolMask) {
    return Fail(error, ErrorCode::kEncoding,
                "protocol exceeds 12 bits: " + std::to_string(header.protocol));
  }
  if (header.origin > 3) {
    return Fail(error, ErrorCode::kEncoding,
                "origin exceeds 2 bits: " + std::to_string(header.origin));
  }
  if (const auto* unknown = std::get_if<UnknownPayload>(&payload)) {
    if (IsKnownType(unknown->type)) {
      return Fail(error, ErrorCode::kEncoding,
                  "raw payload for modelled type " + MessageTypeName(unknown->type));
    }
  }

  std::vector<uint8_t> body;
  const bool encoded = std::visit(
      [&](const auto& p) { return EncodePayload(p, body, error); }, payload);
  if (!encoded) {
    return false;
  }
  const size_t total = kHeaderSize + body.size();
  if (total > kMaxFrameSize) {
    return Fail(error, ErrorCode::kEncoding,
                "frame exceeds 65535 bytes: " + std::to_string(total));
  }

  std::vector<uint8_t> frame;
  frame.reserve(total);
  WriteLe16(frame, static_cast<uint32_t>(total));
  uint16_t flags = header.protocol & kProtocolMask;
  if (header.addressable) {
    flags |= kAddressableBit;
  }
  if (header.tagged) {
    flags |= kTaggedBit;
  }
  flags |= static_cast<uint16_t>(header.origin << kOriginShift);
  WriteLe16(frame, flags);
  WriteLe32(frame, header.source);
  WriteBytes(frame, header.target.data(), header.target.size());
  WriteLe16(frame, 0);
  WriteBytes(frame, header.site.data(), header.site.size());
  uint8_t response_flags = 0;
  if (header.res_required) {
    response_flags |= kResRequiredBit;
  }
  if (header.ack_required) {
    response_flags |= kAckRequiredBit;
  }
  frame.push_back(response_flags);
  frame.push_back(header.sequence);
  WriteLe64(frame, header.timestamp);
  WriteLe16(frame, PayloadType(payload));
  WriteLe16(frame, 0);
  frame.insert(frame.end(), body.begin(), body.end());

  *out = std::move(frame);
  return true;
}

bool DecodeMessage(const uint8_t* data, size_t length, Message* out,
                   Error* error) {
  if (!data || !out) {
    return Fail(error, ErrorCode::kDecoding, "null frame or output");
  }
  if (length < kHeaderSize) {
    return Fail(error, ErrorCode::kDecoding,
                "frame shorter than header: " + std::to_string(length) + " bytes");
  }
  const uint16_t size = ReadLe16(data, kOffsetSize);
  if (size < kHeaderSize) {
    return Fail(error, ErrorCode::kDecoding,
                "declared size below header size: " + std::to_string(size));
  }
  if (length < size) {
    std::ostringstream oss;
    oss << "truncated frame: declared " << size << " bytes, got " << length;
    return Fail(error, ErrorCode::kDecoding, oss.str());
  }

  Header header;
  header.size = size;
  const uint16_t flags = ReadLe16(data, kOffsetFlags);
  header.protocol = flags & kProtocolMask;
  header.addressable = (flags & kAddressableBit) != 0;
  header.tagged = (flags & kTaggedBit) != 0;
  header.origin = static_cast<uint8_t>(flags >> kOriginShift);
  header.source = ReadLe32(data, kOffsetSource);
  std::copy(data + kOffsetTarget, data + kOffsetTarget + header.target.size(),
            header.target.begin());
  std::copy(data + kOffsetSite, data + kOffsetSite + header.site.size(),
            header.site.begin());
  const uint8_t response_flags = data[kOffsetResponseFlags];
  header.res_required = (response_flags & kResRequiredBit) != 0;
  header.ack_required = (response_flags & kAckRequiredBit) != 0;
  header.sequence = data[kOffsetSequence];
  header.timestamp = ReadLe64(data, kOffsetTimestamp);
  header.type = ReadLe16(data, kOffsetType);

  const uint8_t* payload = data + kHeaderSize;
  const size_t payload_length = size - kHeaderSize;
  if (!IsKnownType(header.type)) {
    out->header = header;
    out->payload = UnknownPayload{
        header.type, std::vector<uint8_t>(payload, payload + payload_length)};
    return true;
  }
  const size_t required = PayloadSizeFor(static_cast<MessageType>(header.type));
  if (payload_length < required) {
    std::ostringstream oss;
    oss << MessageTypeName(header.type) << " payload too short: need " << required
        << " bytes, got " << payload_length;
    return Fail(error, ErrorCode::kDecoding, oss.str());
  }
  out->header = header;
  out->payload = DecodePayload(header.type, payload, payload_length);
  return true;
}

bool DecodeMessage(const std::vector<uint8_t>& data, Message* out, Error* error) {
  return DecodeMessage(data.data(), data.size(), out, error);
}

std::string FormatMac(const MacAddress& mac) {
  char buffer[18] = {0};
  std::snprintf(buffer, sizeof(buffer), "%02x:%02x:%02x:%02x:%02x:%02x", mac[0],
                mac[1], mac[2], mac[3], mac[4], mac[5]);
  return buffer;
}

bool ParseMac(const std::string& text, MacAddress* out) {
  if (!out || text.size() != 17) {
    return false;
  }
  MacAddress mac{};
  for (size_t i = 0; i < mac.size(); ++i) {
    const size_t pos = i * 3;
    if (i > 0 && text[pos - 1] != ':' && text[pos - 1] != '-') {
      return false;
    }
    const char hi = text[pos];
    const char lo = text[pos + 1];
    if (!std::isxdigit(static_cast<unsigned char>(hi)) ||
        !std::isxdigit(static_cast<unsigned char>(lo))) {
      return false;
    }
    mac[i] = static_cast<uint8_t>(std::stoi(text.substr(pos, 2), nullptr, 16));
  }
  *out = mac;
  return true;
}

bool IsZeroMac(const MacAddress& mac) {
  return std::all_of(mac.begin(), mac.end(), [](uint8_t b) { return b == 0; });
}

}  // namespace lanlight
