#include "lanlight/transport.h"
#include "lanlight/event_loop.h"

#include <array>
#include <cerrno>
#include <cstring>
#include <sstream>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace lanlight {
namespace {

constexpr size_t kReceiveBufferSize = 2048;

std::string Errno(const char* call) {
  return std::string(call) + " failed: " + std::strerror(errno);
}

// Convert an endpoint into a socket address for the given family.
bool MakeSockaddr(const std::string& address, uint16_t port, uint32_t scope_id,
                  bool ipv6, sockaddr_storage* storage, socklen_t* length) {
  std::memset(storage, 0, sizeof(*storage));
  if (ipv6) {
    auto* addr = reinterpret_cast<sockaddr_in6*>(storage);
    addr->sin6_family = AF_INET6;
    addr->sin6_port = htons(port);
    addr->sin6_scope_id = scope_id;
    if (address.empty() || address == "::" || address == "0.0.0.0") {
      addr->sin6_addr = in6addr_any;
    } else if (inet_pton(AF_INET6, address.c_str(), &addr->sin6_addr) != 1) {
      return false;
    }
    *length = sizeof(sockaddr_in6);
    return true;
  }
  auto* addr = reinterpret_cast<sockaddr_in*>(storage);
  addr->sin_family = AF_INET;
  addr->sin_port = htons(port);
  if (address.empty() || address == "0.0.0.0") {
    addr->sin_addr.s_addr = htonl(INADDR_ANY);
  } else if (inet_pton(AF_INET, address.c_str(), &addr->sin_addr) != 1) {
    return false;
  }
  *length = sizeof(sockaddr_in);
  return true;
}

Endpoint EndpointFromSockaddr(const sockaddr_storage& storage) {
  Endpoint endpoint;
  char buffer[INET6_ADDRSTRLEN] = {0};
  if (storage.ss_family == AF_INET6) {
    const auto& addr = reinterpret_cast<const sockaddr_in6&>(storage);
    if (inet_ntop(AF_INET6, &addr.sin6_addr, buffer, sizeof(buffer)) != nullptr) {
      endpoint.address = buffer;
    }
    endpoint.port = ntohs(addr.sin6_port);
    endpoint.scope_id = addr.sin6_scope_id;
  } else {
    const auto& addr = reinterpret_cast<const sockaddr_in&>(storage);
    if (inet_ntop(AF_INET, &addr.sin_addr, buffer, sizeof(buffer)) != nullptr) {
      endpoint.address = buffer;
    }
    endpoint.port = ntohs(addr.sin_port);
  }
  return endpoint;
}

}  // namespace

bool Endpoint::is_ipv6() const {
  return address.find(':') != std::string::npos;
}

std::string Endpoint::ToString() const {
  std::ostringstream oss;
  if (is_ipv6()) {
    oss << "[" << address;
    if (scope_id != 0) {
      oss << "%" << scope_id;
    }
    oss << "]:" << port;
  } else {
    oss << address << ":" << port;
  }
  return oss.str();
}

bool operator==(const Endpoint& a, const Endpoint& b) {
  return a.address == b.address && a.port == b.port && a.scope_id == b.scope_id;
}

bool operator!=(const Endpoint& a, const Endpoint& b) { return !(a == b); }

UdpTransport::UdpTransport(EventLoop& loop) : loop_(loop) {}

UdpTransport::~UdpTransport() { Close(); }

bool UdpTransport::Open(const TransportOptions& options, Error* error) {
  if (fd_ >= 0) {
    return true;
  }
  ipv6_ = options.ipv6;
  fd_ = ::socket(ipv6_ ? AF_INET6 : AF_INET, SOCK_DGRAM, 0);
  if (fd_ < 0) {
    return Fail(error, ErrorCode::kTransport, Errno("socket()"));
  }
  auto fail = [&](const std::string& message) {
    Close();
    return Fail(error, ErrorCode::kTransport, message);
  };
  const int flags = ::fcntl(fd_, F_GETFL, 0);
  if (flags < 0 || ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
    return fail(Errno("fcntl(O_NONBLOCK)"));
  }
  int reuse = 1;
  if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
    return fail(Errno("setsockopt(SO_REUSEADDR)"));
  }
  if (options.allow_broadcast) {
    int broadcast = 1;
    if (::setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &broadcast, sizeof(broadcast)) < 0) {
      return fail(Errno("setsockopt(SO_BROADCAST)"));
    }
  }
  sockaddr_storage addr{};
  socklen_t addr_len = 0;
  if (!MakeSockaddr(options.bind_address, options.bind_port, 0, ipv6_, &addr,
                    &addr_len)) {
    return fail("invalid bind address: " + options.bind_address);
  }
  if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), addr_len) < 0) {
    std::ostringstream oss;
    oss << "bind(" << options.bind_address << ":" << options.bind_port
        << ") failed: " << std::strerror(errno);
    return fail(oss.str());
  }
  if (!loop_.WatchReadable(fd_, [this]() { OnReadable(); })) {
    return fail("event loop refused socket " + std::to_string(fd_));
  }
  return true;
}

bool UdpTransport::Send(const std::vector<uint8_t>& data, const Endpoint& to,
                        Error* error) {
  if (fd_ < 0) {
    return Fail(error, ErrorCode::kTransport, "send on closed socket");
  }
  if (to.is_ipv6() != ipv6_) {
    return Fail(error, ErrorCode::kTransport,
                "address family mismatch for " + to.ToString());
  }
  sockaddr_storage addr{};
  socklen_t addr_len = 0;
  if (!MakeSockaddr(to.address, to.port, to.scope_id, ipv6_, &addr, &addr_len)) {
    return Fail(error, ErrorCode::kTransport, "invalid destination " + to.ToString());
  }
  const ssize_t result = ::sendto(fd_, data.data(), data.size(), 0,
                                  reinterpret_cast<const sockaddr*>(&addr), addr_len);
  if (result < 0) {
    return Fail(error, ErrorCode::kTransport,
                "sendto(" + to.ToString() + ") failed: " + std::strerror(errno));
  }
  if (static_cast<size_t>(result) != data.size()) {
    std::ostringstream oss;
    oss << "partial send to " << to.ToString() << ": " << result << " of "
        << data.size() << " bytes";
    return Fail(error, ErrorCode::kTransport, oss.str());
  }
  return true;
}

void UdpTransport::SetReceiveHandler(ReceiveHandler handler) {
  handler_ = std::move(handler);
}

void UdpTransport::Close() {
  if (fd_ >= 0) {
    loop_.Unwatch(fd_);
    ::close(fd_);
    fd_ = -1;
  }
}

uint16_t UdpTransport::local_port() const {
  if (fd_ < 0) {
    return 0;
  }
  sockaddr_storage addr{};
  socklen_t addr_len = sizeof(addr);
  if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &addr_len) < 0) {
    return 0;
  }
  return EndpointFromSockaddr(addr).port;
}

// Drain every queued datagram for this readiness event.
void UdpTransport::OnReadable() {
  std::array<uint8_t, kReceiveBufferSize> buffer{};
  while (fd_ >= 0) {
    sockaddr_storage addr{};
    socklen_t addr_len = sizeof(addr);
    const ssize_t bytes = ::recvfrom(fd_, buffer.data(), buffer.size(), 0,
                                     reinterpret_cast<sockaddr*>(&addr), &addr_len);
    if (bytes < 0) {
      return;
    }
    if (handler_) {
      handler_(buffer.data(), static_cast<size_t>(bytes), EndpointFromSockaddr(addr));
    }
  }
}

TransportFactory MakeUdpTransportFactory() {
  return [](EventLoop& loop, const TransportOptions& options,
            Error* error) -> std::unique_ptr<Transport> {
    auto transport = std::make_unique<UdpTransport>(loop);
    if (!transport->Open(options, error)) {
      return nullptr;
    }
    return transport;
  };
}

}  // namespace lanlight
