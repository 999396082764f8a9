#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "lanlight/error.h"

namespace lanlight {

/**
 * Wire constants for the LAN protocol.
 */
constexpr uint16_t kDefaultPort = 56700;
constexpr uint16_t kProtocolNumber = 1024;
constexpr size_t kHeaderSize = 36;
constexpr size_t kLabelLength = 32;
constexpr size_t kEchoLength = 64;
constexpr size_t kZonesPerMessage = 8;
constexpr size_t kExtendedZonesPerMessage = 82;
constexpr size_t kEffectParameterCount = 8;
constexpr size_t kTileColorCount = 64;
constexpr size_t kMaxTileDevices = 16;
constexpr size_t kTilePaletteSize = 16;
constexpr size_t kButtonsPerMessage = 8;
constexpr size_t kActionsPerButton = 5;
constexpr size_t kButtonTargetSize = 16;
constexpr uint16_t kPowerOn = 0xffff;
constexpr uint16_t kPowerOff = 0x0000;
/// StateService service code for the UDP transport.
constexpr uint8_t kServiceUdp = 1;

/// 48-bit device hardware address in wire order.
using MacAddress = std::array<uint8_t, 6>;

/**
 * Message type codes carried in the header.
 */
enum class MessageType : uint16_t {
  kGetService = 2,
  kStateService = 3,
  kGetHostInfo = 12,
  kStateHostInfo = 13,
  kGetHostFirmware = 14,
  kStateHostFirmware = 15,
  kGetWifiInfo = 16,
  kStateWifiInfo = 17,
  kGetWifiFirmware = 18,
  kStateWifiFirmware = 19,
  kGetPower = 20,
  kSetPower = 21,
  kStatePower = 22,
  kGetLabel = 23,
  kSetLabel = 24,
  kStateLabel = 25,
  kGetVersion = 32,
  kStateVersion = 33,
  kGetInfo = 34,
  kStateInfo = 35,
  kSetReboot = 38,
  kAcknowledgement = 45,
  kGetLocation = 48,
  kStateLocation = 50,
  kGetGroup = 51,
  kStateGroup = 53,
  kEchoRequest = 58,
  kEchoResponse = 59,
  kLightGet = 101,
  kLightSetColor = 102,
  kLightSetWaveform = 103,
  kLightState = 107,
  kLightGetPower = 116,
  kLightSetPower = 117,
  kLightStatePower = 118,
  kLightSetWaveformOptional = 119,
  kLightGetInfrared = 120,
  kLightStateInfrared = 121,
  kLightSetInfrared = 122,
  kGetHevCycle = 142,
  kSetHevCycle = 143,
  kStateHevCycle = 144,
  kGetHevCycleConfiguration = 145,
  kSetHevCycleConfiguration = 146,
  kStateHevCycleConfiguration = 147,
  kGetLastHevCycleResult = 148,
  kStateLastHevCycleResult = 149,
  kSetColorZones = 501,
  kGetColorZones = 502,
  kStateZone = 503,
  kStateMultiZone = 506,
  kGetMultiZoneEffect = 507,
  kSetMultiZoneEffect = 508,
  kStateMultiZoneEffect = 509,
  kSetExtendedColorZones = 510,
  kGetExtendedColorZones = 511,
  kStateExtendedColorZones = 512,
  kTileGetDeviceChain = 701,
  kTileStateDeviceChain = 702,
  kTileGet64 = 707,
  kTileState64 = 711,
  kTileSet64 = 715,
  kTileGetEffect = 718,
  kTileSetEffect = 719,
  kTileStateEffect = 720,
  kGetRPower = 816,
  kSetRPower = 817,
  kStateRPower = 818,
  kGetButton = 905,
  kStateButton = 907,
  kGetButtonConfig = 909,
  kSetButtonConfig = 910,
  kStateButtonConfig = 911,
};

/**
 * Waveform shapes accepted by SetWaveform.
 */
enum class Waveform : uint8_t {
  kSaw = 0,
  kSine = 1,
  kHalfSine = 2,
  kTriangle = 3,
  kPulse = 4,
};

/**
 * Zone update behaviour for SetColorZones.
 */
enum class ZoneApply : uint8_t {
  kNoApply = 0,
  kApply = 1,
  kApplyOnly = 2,
};

/**
 * Firmware effects on multizone strips.
 */
enum class MultiZoneEffectType : uint8_t {
  kOff = 0,
  kMove = 1,
};

/**
 * Firmware effects on tiles and matrix lights.
 */
enum class TileEffectType : uint8_t {
  kOff = 0,
  kMorph = 2,
  kFlame = 3,
  kSky = 5,
};

enum class TileEffectSkyType : uint8_t {
  kSunrise = 0,
  kSunset = 1,
  kClouds = 2,
};

enum class ButtonGesture : uint16_t {
  kNone = 0,
  kPress = 1,
  kHold = 2,
  kPressPress = 3,
  kPressHold = 4,
  kHoldHold = 5,
};

enum class ButtonTargetType : uint16_t {
  kNone = 0,
  kRelays = 2,
  kDevice = 3,
  kLocation = 4,
  kGroup = 5,
  kScene = 6,
  kDeviceRelays = 7,
};

/**
 * Hue, saturation, brightness and kelvin as sent on the wire.
 */
struct Hsbk {
  uint16_t hue = 0;
  uint16_t saturation = 0;
  uint16_t brightness = 0;
  uint16_t kelvin = 3500;
};

bool operator==(const Hsbk& a, const Hsbk& b);
bool operator!=(const Hsbk& a, const Hsbk& b);

/**
 * Decoded 36-byte frame header.
 */
struct Header {
  /// Total frame size, filled in by the encoder.
  uint16_t size = 0;
  /// Protocol number (12 bits).
  uint16_t protocol = kProtocolNumber;
  bool addressable = true;
  /// Set for untargeted (discovery) frames.
  bool tagged = false;
  /// Origin indicator (2 bits, must be zero on send).
  uint8_t origin = 0;
  /// Client-chosen identifier echoed back by devices.
  uint32_t source = 0;
  /// Target hardware address, all zero when untargeted.
  MacAddress target = {0, 0, 0, 0, 0, 0};
  /// Reserved / site bytes.
  std::array<uint8_t, 6> site = {0, 0, 0, 0, 0, 0};
  bool ack_required = false;
  bool res_required = false;
  uint8_t sequence = 0;
  /// Echoed timestamp, not clock-authoritative.
  uint64_t timestamp = 0;
  /// Message type, filled in from the payload by the encoder.
  uint16_t type = 0;
};

// Device messages.
struct GetService {};
struct StateService {
  uint8_t service = kServiceUdp;
  uint32_t port = kDefaultPort;
};
struct GetHostInfo {};
struct StateHostInfo {
  /// Signal in mW.
  float signal = 0.0f;
  uint32_t tx = 0;
  uint32_t rx = 0;
  int16_t reserved = 0;
};
struct GetHostFirmware {};
struct StateHostFirmware {
  uint64_t build = 0;
  uint64_t reserved = 0;
  uint32_t version = 0;
};
struct GetWifiInfo {};
struct StateWifiInfo {
  float signal = 0.0f;
  uint32_t tx = 0;
  uint32_t rx = 0;
  int16_t reserved = 0;
};
struct GetWifiFirmware {};
struct StateWifiFirmware {
  uint64_t build = 0;
  uint64_t reserved = 0;
  uint32_t version = 0;
};
struct GetPower {};
struct SetPower {
  uint16_t level = kPowerOff;
};
struct StatePower {
  uint16_t level = kPowerOff;
};
struct GetLabel {};
struct SetLabel {
  std::string label;
};
struct StateLabel {
  std::string label;
};
struct GetVersion {};
struct StateVersion {
  uint32_t vendor = 0;
  uint32_t product = 0;
  uint32_t version = 0;
};
struct GetInfo {};
/// Device clock, uptime and last downtime, all in nanoseconds.
struct StateInfo {
  uint64_t time = 0;
  uint64_t uptime = 0;
  uint64_t downtime = 0;
};
struct SetReboot {};
struct Acknowledgement {};
struct GetLocation {};
struct StateLocation {
  std::array<uint8_t, 16> location = {};
  std::string label;
  uint64_t updated_at = 0;
};
struct GetGroup {};
struct StateGroup {
  std::array<uint8_t, 16> group = {};
  std::string label;
  uint64_t updated_at = 0;
};
/// Echo data travels in a fixed 64-byte field: shorter data is zero padded
/// on encode and always decodes as 64 bytes.
struct EchoRequest {
  std::vector<uint8_t> data;
};
struct EchoResponse {
  std::vector<uint8_t> data;
};

// Light messages.
struct LightGet {};
struct LightSetColor {
  Hsbk color;
  /// Transition time in ms.
  uint32_t duration = 0;
};
struct LightSetWaveform {
  bool transient = false;
  Hsbk color;
  /// Cycle period in ms.
  uint32_t period = 1000;
  float cycles = 1.0f;
  int16_t skew_ratio = 0;
  Waveform waveform = Waveform::kSaw;
};
struct LightSetWaveformOptional {
  bool transient = false;
  Hsbk color;
  uint32_t period = 1000;
  float cycles = 1.0f;
  int16_t skew_ratio = 0;
  Waveform waveform = Waveform::kSaw;
  bool set_hue = true;
  bool set_saturation = true;
  bool set_brightness = true;
  bool set_kelvin = true;
};
struct LightState {
  Hsbk color;
  int16_t reserved1 = 0;
  uint16_t power_level = kPowerOff;
  std::string label;
  uint64_t reserved2 = 0;
};
struct LightGetPower {};
struct LightSetPower {
  uint16_t level = kPowerOff;
  uint32_t duration = 0;
};
struct LightStatePower {
  uint16_t level = kPowerOff;
};
struct LightGetInfrared {};
struct LightStateInfrared {
  uint16_t brightness = 0;
};
struct LightSetInfrared {
  uint16_t brightness = 0;
};

// HEV cycle messages.
struct GetHevCycle {};
struct SetHevCycle {
  bool enable = false;
  /// Cycle length in seconds, 0 for the configured default.
  uint32_t duration = 0;
};
struct StateHevCycle {
  uint32_t duration = 0;
  uint32_t remaining = 0;
  bool last_power = false;
};
struct GetHevCycleConfiguration {};
struct SetHevCycleConfiguration {
  bool indication = false;
  uint32_t duration = 0;
};
struct StateHevCycleConfiguration {
  bool indication = false;
  uint32_t duration = 0;
};
struct GetLastHevCycleResult {};
struct StateLastHevCycleResult {
  uint8_t result = 0;
};

// Multizone messages.
struct SetColorZones {
  uint8_t start_index = 0;
  uint8_t end_index = 0;
  Hsbk color;
  uint32_t duration = 0;
  ZoneApply apply = ZoneApply::kApply;
};
struct GetColorZones {
  uint8_t start_index = 0;
  uint8_t end_index = 255;
};
struct StateZone {
  uint8_t count = 0;
  uint8_t index = 0;
  Hsbk color;
};
struct StateMultiZone {
  uint8_t count = 0;
  uint8_t index = 0;
  std::array<Hsbk, kZonesPerMessage> colors = {};
};

// Multizone effect and extended zone messages.
struct GetMultiZoneEffect {};
struct SetMultiZoneEffect {
  uint32_t instance_id = 0;
  MultiZoneEffectType type = MultiZoneEffectType::kOff;
  /// Time for one cycle in ms.
  uint32_t speed = 0;
  /// Run time in ns, 0 runs until replaced.
  uint64_t duration = 0;
  /// Effect specific; parameters[1] is the direction of a move effect.
  std::array<uint32_t, kEffectParameterCount> parameters = {};
};
struct StateMultiZoneEffect {
  uint32_t instance_id = 0;
  MultiZoneEffectType type = MultiZoneEffectType::kOff;
  uint32_t speed = 0;
  uint64_t duration = 0;
  std::array<uint32_t, kEffectParameterCount> parameters = {};
};
struct SetExtendedColorZones {
  uint32_t duration = 0;
  ZoneApply apply = ZoneApply::kApply;
  uint16_t zone_index = 0;
  /// Up to 82 colours starting at zone_index.
  std::vector<Hsbk> colors;
};
struct GetExtendedColorZones {};
struct StateExtendedColorZones {
  /// Total zones on the device.
  uint16_t count = 0;
  uint16_t index = 0;
  std::vector<Hsbk> colors;
};

// Tile messages.
struct TileDevice {
  int16_t accel_meas_x = 0;
  int16_t accel_meas_y = 0;
  int16_t accel_meas_z = 0;
  float user_x = 0.0f;
  float user_y = 0.0f;
  uint8_t width = 8;
  uint8_t height = 8;
  uint32_t vendor = 0;
  uint32_t product = 0;
  uint64_t firmware_build = 0;
  uint16_t firmware_version_minor = 0;
  uint16_t firmware_version_major = 0;
};
struct TileGetDeviceChain {};
struct TileStateDeviceChain {
  uint8_t start_index = 0;
  /// Up to 16 tiles; the wire always carries 16 slots plus a count.
  std::vector<TileDevice> tiles;
};
struct TileGet64 {
  uint8_t tile_index = 0;
  /// Number of consecutive tiles to report.
  uint8_t length = 1;
  uint8_t x = 0;
  uint8_t y = 0;
  uint8_t width = 8;
};
struct TileSet64 {
  uint8_t tile_index = 0;
  uint8_t length = 1;
  uint8_t x = 0;
  uint8_t y = 0;
  uint8_t width = 8;
  uint32_t duration = 0;
  std::array<Hsbk, kTileColorCount> colors = {};
};
struct TileState64 {
  uint8_t tile_index = 0;
  uint8_t x = 0;
  uint8_t y = 0;
  uint8_t width = 8;
  std::array<Hsbk, kTileColorCount> colors = {};
};
struct TileGetEffect {};
struct TileSetEffect {
  uint32_t instance_id = 0;
  TileEffectType type = TileEffectType::kOff;
  uint32_t speed = 0;
  uint64_t duration = 0;
  TileEffectSkyType sky_type = TileEffectSkyType::kSunrise;
  uint8_t cloud_saturation_min = 0;
  uint8_t cloud_saturation_max = 0;
  /// Up to 16 colours.
  std::vector<Hsbk> palette;
};
struct TileStateEffect {
  uint32_t instance_id = 0;
  TileEffectType type = TileEffectType::kOff;
  uint32_t speed = 0;
  uint64_t duration = 0;
  TileEffectSkyType sky_type = TileEffectSkyType::kSunrise;
  uint8_t cloud_saturation_min = 0;
  uint8_t cloud_saturation_max = 0;
  std::vector<Hsbk> palette;
};

// Relay (switch) messages.
struct GetRPower {
  uint8_t relay_index = 0;
};
struct SetRPower {
  uint8_t relay_index = 0;
  uint16_t level = kPowerOff;
};
struct StateRPower {
  uint8_t relay_index = 0;
  uint16_t level = kPowerOff;
};

// Switch button messages.
struct ButtonAction {
  ButtonGesture gesture = ButtonGesture::kNone;
  ButtonTargetType target_type = ButtonTargetType::kNone;
  /// Target record, laid out according to target_type.
  std::array<uint8_t, kButtonTargetSize> target = {};
};
struct Button {
  uint8_t actions_count = 0;
  std::array<ButtonAction, kActionsPerButton> actions = {};
};
struct GetButton {};
struct StateButton {
  uint8_t count = 0;
  uint8_t index = 0;
  uint8_t buttons_count = 0;
  std::array<Button, kButtonsPerMessage> buttons = {};
};
struct GetButtonConfig {};
struct SetButtonConfig {
  uint16_t haptic_duration_ms = 0;
  Hsbk backlight_on_color;
  Hsbk backlight_off_color;
};
struct StateButtonConfig {
  uint16_t haptic_duration_ms = 0;
  Hsbk backlight_on_color;
  Hsbk backlight_off_color;
};

/// Payload of a type this library does not model, kept as raw bytes.
struct UnknownPayload {
  uint16_t type = 0;
  std::vector<uint8_t> bytes;
};

using Payload = std::variant<
    GetService, StateService, GetHostInfo, StateHostInfo, GetHostFirmware,
    StateHostFirmware, GetWifiInfo, StateWifiInfo, GetWifiFirmware,
    StateWifiFirmware, GetPower, SetPower, StatePower, GetLabel, SetLabel,
    StateLabel, GetVersion, StateVersion, GetInfo, StateInfo, SetReboot,
    Acknowledgement, GetLocation, StateLocation, GetGroup, StateGroup,
    EchoRequest, EchoResponse, LightGet, LightSetColor, LightSetWaveform,
    LightSetWaveformOptional, LightState, LightGetPower, LightSetPower,
    LightStatePower, LightGetInfrared, LightStateInfrared, LightSetInfrared,
    GetHevCycle, SetHevCycle, StateHevCycle, GetHevCycleConfiguration,
    SetHevCycleConfiguration, StateHevCycleConfiguration, GetLastHevCycleResult,
    StateLastHevCycleResult, SetColorZones, GetColorZones, StateZone,
    StateMultiZone, GetMultiZoneEffect, SetMultiZoneEffect, StateMultiZoneEffect,
    SetExtendedColorZones, GetExtendedColorZones, StateExtendedColorZones,
    TileGetDeviceChain, TileStateDeviceChain, TileGet64, TileState64, TileSet64,
    TileGetEffect, TileSetEffect, TileStateEffect, GetRPower, SetRPower,
    StateRPower, GetButton, StateButton, GetButtonConfig, SetButtonConfig,
    StateButtonConfig, UnknownPayload>;

/**
 * A decoded frame: header plus typed payload.
 */
struct Message {
  Header header;
  Payload payload;

  /// Message type code of the payload.
  uint16_t type() const;
};

/// Message type code of a payload alternative.
uint16_t PayloadType(const Payload& payload);

/// Human readable type name for logs ("LightState", "Unknown(1234)").
std::string MessageTypeName(uint16_t type);

/// True for request types whose purpose is the eventual State* response.
bool IsQuery(uint16_t type);

/// State types a device answers `request_type` with (empty if none is known).
std::vector<uint16_t> ResponseTypesFor(uint16_t request_type);

/**
 * Build a header for a frame addressed to `target` (all zero for discovery).
 * Sets `tagged` when the target is all zero.
 */
Header MakeHeader(const MacAddress& target, uint32_t source, uint8_t sequence,
                  bool ack_required, bool res_required);

/**
 * Encode header and payload into a frame.
 *
 * The header's size and type fields are computed from the payload.
 *
 * @param out Receives the encoded frame.
 * @param error Optional output, set to kEncoding on out-of-range fields and
 *              on an UnknownPayload carrying a type code this library models.
 * @return true on success; `out` is untouched on failure.
 */
bool EncodeMessage(const Header& header, const Payload& payload,
                   std::vector<uint8_t>* out, Error* error = nullptr);

/**
 * Decode a frame.
 *
 * Frames shorter than the header, shorter than their declared size, or with a
 * known type whose payload is too short fail with kDecoding. Unknown types
 * decode to UnknownPayload.
 */
bool DecodeMessage(const uint8_t* data, size_t length, Message* out,
                   Error* error = nullptr);
bool DecodeMessage(const std::vector<uint8_t>& data, Message* out,
                   Error* error = nullptr);

/// Format as lower-case "aa:bb:cc:dd:ee:ff".
std::string FormatMac(const MacAddress& mac);

/// Parse "aa:bb:cc:dd:ee:ff" (':' or '-' separators, any case).
bool ParseMac(const std::string& text, MacAddress* out);

/// True if every byte is zero (untargeted / broadcast address).
bool IsZeroMac(const MacAddress& mac);

}  // namespace lanlight
