#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "lanlight/lanlight.h"

namespace lanlight {

struct Device::Impl {
  struct PendingRequest {
    uint64_t id = 0;
    uint16_t request_type = 0;
    std::vector<uint8_t> frame;
    ResponseCallback callback;
    /// Reply types that resolve the request; empty accepts any non-ack.
    std::vector<uint16_t> accepted_types;
    bool ack_required = false;
    bool res_required = false;
    /// Acked while still awaiting the response; retransmission stops.
    bool ack_seen = false;
    int retries = 0;
    int max_retries = 0;
    std::chrono::milliseconds timeout{0};
    EventLoop::TimerId timer = 0;
  };

  Impl(EventLoop& loop, std::shared_ptr<const Config> config,
       std::shared_ptr<EngineMetrics> metrics,
       std::unique_ptr<Transport> transport, const MacAddress& mac,
       const Endpoint& endpoint, uint32_t source_id, bool synthesized_address);
  ~Impl();

  bool SendRequest(const Payload& payload, const RequestOptions& options,
                   ResponseCallback callback, Error* error);
  // Send a set whose requested value lands in `state` once confirmed.
  bool SendSet(const Payload& payload, ResponseCallback callback,
               std::function<void(DeviceState&)> apply);
  bool SendQuery(const Payload& payload, ResponseCallback callback);

  void OnDatagram(const uint8_t* data, size_t length, const Endpoint& from);
  // Discovery saw the device at `endpoint`.
  void Refresh(const Endpoint& endpoint);
  void Touch(const Endpoint& from);
  void UpdateState(const Message& message);
  void Dispatch(const Message& message);
  void Resolve(std::map<uint8_t, PendingRequest>::iterator it,
               std::optional<Message> message);
  void OnRequestTimeout(uint8_t sequence, uint64_t id);
  void ExpireRequest(std::map<uint8_t, PendingRequest>::iterator it,
                     const char* reason);
  void ScheduleRetry(uint8_t sequence, PendingRequest& request);
  // First sequence at or after next_sequence with no pending request; the
  // oldest request's sequence when all 256 are outstanding.
  uint8_t NextFreeSequence() const;
  // Send `frame` `remaining` more times, repeat_interval apart.
  void ScheduleRepeat(std::shared_ptr<const std::vector<uint8_t>> frame,
                      int remaining);
  void OnRepeat(uint64_t key, const std::shared_ptr<const std::vector<uint8_t>>& frame,
                int remaining);

  // Fail pending requests and close the socket. Posts callbacks unless
  // `notify` is false (teardown without an owning shared_ptr).
  void Close(bool notify);

  void PostResponse(ResponseCallback callback, std::optional<Message> message);
  void PostUnsolicited(const Message& message);
  void RecordCallbackException(const char* name, const char* what);
  void Log(const std::string& message) const;

  EventLoop& loop;
  std::shared_ptr<const Config> config;
  std::shared_ptr<EngineMetrics> metrics;
  std::unique_ptr<Transport> transport;
  Device* owner = nullptr;

  const MacAddress mac;
  Endpoint endpoint;
  const uint32_t source_id;
  // IPv6 destinations come from the prefix, not from packet sources.
  const bool synthesized_address;

  uint8_t next_sequence = 0;
  uint64_t next_request_id = 1;
  std::map<uint8_t, PendingRequest> pending;
  uint64_t next_repeat_key = 1;
  std::map<uint64_t, EventLoop::TimerId> repeat_timers;
  std::chrono::steady_clock::time_point last_seen;
  int missed_cycles = 0;
  bool alive = true;
  DeviceState state;
  MessageCallback unsolicited_callback;
};

}  // namespace lanlight
