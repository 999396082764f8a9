#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "lanlight/error.h"
#include "lanlight/event_loop.h"
#include "lanlight/messages.h"
#include "lanlight/transport.h"

namespace lanlight {

class Device;
class Discovery;

#ifdef LANLIGHT_TESTING
namespace test {
std::vector<uint8_t> PendingSequences(const Device& device);
int MissedCycles(const Device& device);
}  // namespace test
#endif

/**
 * Engine configuration, passed at construction.
 */
struct Config {
  using LogCallback = std::function<void(const std::string&)>;

  /// Local bind address for all sockets ("0.0.0.0" for any interface).
  std::string bind_address = "0.0.0.0";
  /// Local port for the discovery socket (0 picks an ephemeral port).
  uint16_t bind_port = 0;
  /// IPv4 broadcast address discovery broadcasts are sent to.
  std::string broadcast_address = "255.255.255.255";
  /// Device UDP port.
  uint16_t port = kDefaultPort;
  /// Source identifier stamped on outgoing frames (0 picks a random one).
  uint32_t source_id = 0;

  /// Time between discovery broadcasts.
  std::chrono::milliseconds discovery_interval{180000};
  /// How long a cycle stays in AwaitingReplies after broadcasting.
  std::chrono::milliseconds reply_window{1000};
  /// Time to wait for an ack/response before retransmitting.
  std::chrono::milliseconds request_timeout{500};
  /// Retransmissions after the first send before giving up.
  int max_retries = 2;
  /// Consecutive missed discovery cycles before a device is unregistered.
  int staleness_cycles = 3;
  /// Times a frame that asks for no reply is sent.
  int fire_and_forget_repeats = 1;
  /// Gap between those sends. Devices handle about 20 messages a second.
  std::chrono::milliseconds repeat_interval{50};

  /// IPv6 network prefix (e.g. "fe80::" or "2001:db8:0:1"). Empty for IPv4.
  std::string ipv6_prefix;
  /// Interface used as scope for link-local IPv6 destinations.
  std::string ipv6_interface;

  /// Invoke callbacks with std::nullopt when retries are exhausted.
  bool report_no_response = true;

  /// Optional log callback (defaults to stderr).
  LogCallback log_callback;

  /**
   * Validate configuration values.
   *
   * @param error Optional output string describing the first validation error.
   * @return true if the configuration is valid.
   */
  bool Validate(std::string* error = nullptr) const;
};

/**
 * Synthesize a device IPv6 address from a network prefix and hardware address
 * using modified EUI-64.
 *
 * @return false if the prefix does not expand to a valid 16-byte address.
 */
bool SynthesizeIpv6Address(const std::string& prefix, const MacAddress& mac,
                           std::string* out);

/**
 * Counters for packet flow and error reporting.
 */
struct EngineMetrics {
  uint64_t packets_received = 0;
  uint64_t packets_sent = 0;
  uint64_t decode_errors = 0;
  uint64_t send_errors = 0;
  uint64_t callback_exceptions = 0;
  uint64_t requests_expired = 0;
  uint64_t devices_registered = 0;
  uint64_t devices_unregistered = 0;
};

/**
 * Host-supplied sink for device lifecycle.
 *
 * Register() is called once per newly discovered hardware address and
 * Unregister() once when that device is declared unreachable, with the same
 * object.
 */
class DeviceRegistry {
 public:
  virtual ~DeviceRegistry() = default;
  virtual void Register(const std::shared_ptr<Device>& device) = 0;
  virtual void Unregister(const std::shared_ptr<Device>& device) = 0;
};

/**
 * Which replies a request asks the device for.
 */
enum class ReplyMode {
  /// Queries ask for a response; sets ask for an ack only if a callback is given.
  kAuto,
  kNone,
  kAck,
  kResponse,
  kAckAndResponse,
};

struct RequestOptions {
  ReplyMode mode = ReplyMode::kAuto;
  /// Response types that resolve the request, on top of the default for the
  /// request type. Empty with no default accepts any non-ack reply.
  std::vector<uint16_t> accepted_types;
  /// Per-request override of Config::request_timeout.
  std::optional<std::chrono::milliseconds> timeout;
  /// Per-request override of Config::max_retries.
  std::optional<int> max_retries;
  /// Per-request override of Config::fire_and_forget_repeats. Only used when
  /// no reply is requested.
  std::optional<int> repeats;
};

/**
 * Last known values reported by (or confirmed to) a device.
 */
struct DeviceState {
  std::optional<std::string> label;
  std::optional<uint16_t> power_level;
  std::optional<Hsbk> color;
  std::optional<std::string> location;
  std::optional<std::string> group;
  std::optional<StateVersion> version;
  std::optional<StateHostFirmware> host_firmware;
  std::optional<StateWifiFirmware> wifi_firmware;
  std::optional<StateWifiInfo> wifi_info;
  std::optional<StateHostInfo> host_info;
  /// Uptime in nanoseconds from the last StateInfo.
  std::optional<uint64_t> uptime;
  std::optional<uint16_t> infrared_brightness;
  std::optional<StateHevCycle> hev_cycle;
  /// Multizone colours, sized by the zone count the device reports.
  std::vector<Hsbk> zones;
  std::optional<StateMultiZoneEffect> multizone_effect;
  /// Tiles in chain order.
  std::vector<TileDevice> tiles;
  std::optional<TileStateEffect> tile_effect;
  /// Relay power level by relay index.
  std::map<uint8_t, uint16_t> relay_levels;
  std::optional<StateButtonConfig> button_config;
};

/**
 * Session with one discovered device over unicast UDP.
 *
 * Created by Discovery only. All methods must be called on the loop thread.
 */
class Device : public std::enable_shared_from_this<Device> {
 public:
  /// Called once per request with the decoded reply, or std::nullopt when
  /// retries were exhausted or the session closed.
  using ResponseCallback =
      std::function<void(Device& device, const std::optional<Message>& message)>;
  /// Called for traffic not tied to a pending request.
  using MessageCallback = std::function<void(Device& device, const Message& message)>;

  struct Impl;

  ~Device();

  Device(const Device&) = delete;
  Device& operator=(const Device&) = delete;

  /// Hardware address (immutable identity).
  const MacAddress& mac_address() const;
  /// Hardware address formatted as "aa:bb:cc:dd:ee:ff".
  std::string mac_string() const;
  /// Current unicast destination.
  Endpoint endpoint() const;
  /// Source identifier used on this session.
  uint32_t source_id() const;
  /// Loop time of the last datagram from this device.
  std::chrono::steady_clock::time_point last_seen() const;
  /// False once the session is closed or the device declared unreachable.
  bool alive() const;
  /// Number of requests awaiting an ack or response.
  size_t pending_count() const;
  /// Cached device state.
  const DeviceState& state() const;

  /**
   * Send a request to the device.
   *
   * Encodes first (out-of-range fields fail with kEncoding before any I/O),
   * then sends and, when a reply was requested, tracks the request until a
   * correlated reply arrives or retries run out. `callback` is always invoked
   * from the loop, never from within this call.
   *
   * @return false on encoding or local transport errors.
   */
  bool SendRequest(const Payload& payload, const RequestOptions& options = {},
                   ResponseCallback callback = nullptr, Error* error = nullptr);

  /// Set callback for traffic not tied to a pending request. Posted like
  /// response callbacks.
  void SetUnsolicitedCallback(MessageCallback callback);

  /// Fail pending requests, cancel timers and close the socket. Idempotent.
  void Close();

  // Convenience operations. Queries always ask for a response. Sets ask for
  // an ack when a callback is given and are fire-and-forget otherwise.
  bool GetLabel(ResponseCallback callback = nullptr);
  /// Labels longer than 32 bytes are truncated at a UTF-8 character boundary.
  bool SetLabel(const std::string& label, ResponseCallback callback = nullptr);
  bool GetLocation(ResponseCallback callback = nullptr);
  bool GetGroup(ResponseCallback callback = nullptr);
  bool GetPower(ResponseCallback callback = nullptr);
  /// Set light power, with an optional transition in ms.
  bool SetPower(bool on, ResponseCallback callback = nullptr,
                uint32_t duration_ms = 0);
  bool GetColor(ResponseCallback callback = nullptr);
  bool SetColor(const Hsbk& color, ResponseCallback callback = nullptr,
                uint32_t duration_ms = 0);
  bool SetWaveform(const LightSetWaveform& waveform,
                   ResponseCallback callback = nullptr);
  bool SetWaveformOptional(const LightSetWaveformOptional& waveform,
                           ResponseCallback callback = nullptr);
  bool GetInfrared(ResponseCallback callback = nullptr);
  bool SetInfrared(uint16_t brightness, ResponseCallback callback = nullptr);
  bool GetColorZones(uint8_t start_index, uint8_t end_index,
                     ResponseCallback callback = nullptr);
  bool SetColorZones(uint8_t start_index, uint8_t end_index, const Hsbk& color,
                     ResponseCallback callback = nullptr, uint32_t duration_ms = 0,
                     ZoneApply apply = ZoneApply::kApply);
  /// Extended zone messages carry up to 82 zones per frame.
  bool GetExtendedColorZones(ResponseCallback callback = nullptr);
  bool SetExtendedColorZones(uint16_t zone_index, const std::vector<Hsbk>& colors,
                             ResponseCallback callback = nullptr,
                             uint32_t duration_ms = 0,
                             ZoneApply apply = ZoneApply::kApply);
  bool GetMultiZoneEffect(ResponseCallback callback = nullptr);
  /// Start a firmware effect on a strip; `duration_ns` 0 runs until replaced.
  bool SetMultiZoneEffect(MultiZoneEffectType type, uint32_t speed_ms,
                          uint64_t duration_ns = 0, uint32_t direction = 0,
                          ResponseCallback callback = nullptr);
  bool GetDeviceChain(ResponseCallback callback = nullptr);
  /// Request the 64 colours of `length` tiles starting at `tile_index`. The
  /// first TileState64 resolves the callback; the rest arrive unsolicited.
  bool GetTileColors(uint8_t tile_index, uint8_t length = 1,
                     ResponseCallback callback = nullptr, uint8_t width = 8);
  bool SetTileColors(uint8_t tile_index,
                     const std::array<Hsbk, kTileColorCount>& colors,
                     ResponseCallback callback = nullptr, uint32_t duration_ms = 0,
                     uint8_t width = 8);
  bool GetTileEffect(ResponseCallback callback = nullptr);
  /// A zero instance_id is replaced with a random one.
  bool SetTileEffect(const TileSetEffect& effect,
                     ResponseCallback callback = nullptr);
  bool GetRelayPower(uint8_t relay_index, ResponseCallback callback = nullptr);
  bool SetRelayPower(uint8_t relay_index, bool on,
                     ResponseCallback callback = nullptr);
  bool GetButton(ResponseCallback callback = nullptr);
  bool GetButtonConfig(ResponseCallback callback = nullptr);
  bool SetButtonConfig(uint16_t haptic_duration_ms, const Hsbk& backlight_on,
                       const Hsbk& backlight_off,
                       ResponseCallback callback = nullptr);
  bool GetHevCycle(ResponseCallback callback = nullptr);
  bool SetHevCycle(bool enable, uint32_t duration_s,
                   ResponseCallback callback = nullptr);
  bool GetVersion(ResponseCallback callback = nullptr);
  bool GetHostInfo(ResponseCallback callback = nullptr);
  bool GetHostFirmware(ResponseCallback callback = nullptr);
  bool GetWifiInfo(ResponseCallback callback = nullptr);
  bool GetWifiFirmware(ResponseCallback callback = nullptr);
  /// Request StateInfo (device time, uptime, downtime).
  bool GetUptime(ResponseCallback callback = nullptr);
  bool Echo(const std::vector<uint8_t>& data, ResponseCallback callback = nullptr);
  bool Reboot(ResponseCallback callback = nullptr);

 private:
  friend class Discovery;
#ifdef LANLIGHT_TESTING
  friend std::vector<uint8_t> test::PendingSequences(const Device& device);
  friend int test::MissedCycles(const Device& device);
#endif

  explicit Device(std::unique_ptr<Impl> impl);

  std::unique_ptr<Impl> impl_;
};

/**
 * Discovery cycle state.
 */
enum class DiscoveryState {
  kIdle,
  kBroadcasting,
  kAwaitingReplies,
};

/**
 * Broadcast discovery and ownership of device sessions.
 */
class Discovery {
 public:
  /**
   * @param loop Host event loop; must outlive this object.
   * @param registry Host registry; must outlive this object.
   * @param factory Transport factory (UDP sockets when empty).
   */
  Discovery(EventLoop& loop, DeviceRegistry& registry, Config config,
            TransportFactory factory = nullptr);
  /// Stop broadcasting and close all sessions without registry calls.
  ~Discovery();

  Discovery(const Discovery&) = delete;
  Discovery& operator=(const Discovery&) = delete;

  /// Validate config, open the broadcast socket and schedule the first cycle.
  bool Start();
  /// Cancel future broadcasts. Registered sessions stay open.
  void Stop();
  /// Run a discovery cycle on the next loop iteration.
  void DiscoverNow();

  bool running() const;
  DiscoveryState state() const;
  /// Source identifier used for discovery and new sessions.
  uint32_t source_id() const;

  /// Known live devices.
  std::vector<std::shared_ptr<Device>> GetDevices() const;
  std::shared_ptr<Device> FindDevice(const MacAddress& mac) const;
  /// Return the last Start() error message, if any.
  std::string GetLastError() const;
  EngineMetrics GetMetrics() const;

 private:
  struct Impl;

  static std::shared_ptr<Device> MakeSession(std::unique_ptr<Device::Impl> impl);
  static Device::Impl& SessionOf(Device& device);

  std::unique_ptr<Impl> impl_;
};

}  // namespace lanlight
