#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "lanlight/error.h"
#include "lanlight/messages.h"

namespace lanlight {

class EventLoop;

/**
 * UDP peer address. IPv6 literals are recognised by the presence of ':'.
 */
struct Endpoint {
  std::string address;
  uint16_t port = kDefaultPort;
  /// Interface index for link-local IPv6 destinations (0 if unused).
  uint32_t scope_id = 0;

  bool is_ipv6() const;
  std::string ToString() const;
};

bool operator==(const Endpoint& a, const Endpoint& b);
bool operator!=(const Endpoint& a, const Endpoint& b);

/**
 * Options for opening one transport.
 */
struct TransportOptions {
  /// Local bind address ("0.0.0.0", "::", or an interface address).
  std::string bind_address = "0.0.0.0";
  uint16_t bind_port = 0;
  /// Open an AF_INET6 socket.
  bool ipv6 = false;
  /// Enable SO_BROADCAST (discovery socket).
  bool allow_broadcast = false;
};

/**
 * One datagram endpoint. Receive delivery happens on the owning EventLoop.
 */
class Transport {
 public:
  using ReceiveHandler =
      std::function<void(const uint8_t* data, size_t length, const Endpoint& from)>;

  virtual ~Transport() = default;

  /**
   * Send one datagram. Best-effort: remote loss is never reported.
   *
   * @return false with kTransport on a local socket fault.
   */
  virtual bool Send(const std::vector<uint8_t>& data, const Endpoint& to,
                    Error* error = nullptr) = 0;
  virtual void SetReceiveHandler(ReceiveHandler handler) = 0;
  /// Close the socket and stop receive delivery. Idempotent.
  virtual void Close() = 0;
  virtual bool is_open() const = 0;
};

/// Creates transports. Returns nullptr and fills `error` on failure.
using TransportFactory = std::function<std::unique_ptr<Transport>(
    EventLoop& loop, const TransportOptions& options, Error* error)>;

/**
 * Non-blocking POSIX UDP transport registered with an EventLoop.
 */
class UdpTransport : public Transport {
 public:
  explicit UdpTransport(EventLoop& loop);
  ~UdpTransport() override;

  UdpTransport(const UdpTransport&) = delete;
  UdpTransport& operator=(const UdpTransport&) = delete;

  /// Create, configure and bind the socket, then watch it on the loop.
  bool Open(const TransportOptions& options, Error* error = nullptr);

  bool Send(const std::vector<uint8_t>& data, const Endpoint& to,
            Error* error = nullptr) override;
  void SetReceiveHandler(ReceiveHandler handler) override;
  void Close() override;
  bool is_open() const override { return fd_ >= 0; }

  int fd() const { return fd_; }
  /// Locally bound port, useful when binding to port 0.
  uint16_t local_port() const;

 private:
  void OnReadable();

  EventLoop& loop_;
  int fd_ = -1;
  bool ipv6_ = false;
  ReceiveHandler handler_;
};

/// Factory producing UdpTransport instances.
TransportFactory MakeUdpTransportFactory();

}  // namespace lanlight
