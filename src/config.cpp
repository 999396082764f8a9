#include "lanlight/lanlight.h"

#include <cstdio>

#include <arpa/inet.h>
#include <net/if.h>
#include <netinet/in.h>

namespace lanlight {

bool SynthesizeIpv6Address(const std::string& prefix, const MacAddress& mac,
                           std::string* out) {
  if (prefix.empty()) {
    return false;
  }
  // Modified EUI-64: flip the universal/local bit and insert ff:fe.
  char suffix[24] = {0};
  std::snprintf(suffix, sizeof(suffix), "%04x:%02xff:fe%02x:%04x",
                ((mac[0] << 8) | mac[1]) ^ 0x0200, mac[2], mac[3],
                (mac[4] << 8) | mac[5]);

  std::string joined;
  if (prefix.size() >= 2 && prefix.compare(prefix.size() - 2, 2, "::") == 0) {
    joined = prefix + suffix;
  } else if (prefix.back() == ':') {
    joined = prefix + suffix;
  } else {
    joined = prefix + ":" + suffix;
  }

  in6_addr parsed{};
  if (inet_pton(AF_INET6, joined.c_str(), &parsed) != 1) {
    return false;
  }
  char buffer[INET6_ADDRSTRLEN] = {0};
  if (inet_ntop(AF_INET6, &parsed, buffer, sizeof(buffer)) == nullptr) {
    return false;
  }
  if (out) {
    *out = buffer;
  }
  return true;
}

bool Config::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  auto is_valid_ipv4 = [](const std::string& addr) {
    if (addr.empty()) {
      return false;
    }
    in_addr parsed{};
    return inet_pton(AF_INET, addr.c_str(), &parsed) == 1;
  };
  auto is_valid_ipv6 = [](const std::string& addr) {
    in6_addr parsed{};
    return inet_pton(AF_INET6, addr.c_str(), &parsed) == 1;
  };
  if (!bind_address.empty() && !is_valid_ipv4(bind_address) &&
      !is_valid_ipv6(bind_address)) {
    return fail("bind_address must be a valid IPv4 or IPv6 address");
  }
  if (!is_valid_ipv4(broadcast_address)) {
    return fail("broadcast_address must be a valid IPv4 address");
  }
  if (port == 0) {
    return fail("port must be non-zero");
  }
  if (discovery_interval.count() <= 0 || reply_window.count() <= 0) {
    return fail("discovery_interval and reply_window must be positive");
  }
  if (reply_window > discovery_interval) {
    return fail("reply_window must be <= discovery_interval");
  }
  if (request_timeout.count() <= 0) {
    return fail("request_timeout must be positive");
  }
  if (max_retries < 0) {
    return fail("max_retries must be >= 0");
  }
  if (staleness_cycles < 1) {
    return fail("staleness_cycles must be >= 1");
  }
  if (fire_and_forget_repeats < 1) {
    return fail("fire_and_forget_repeats must be >= 1");
  }
  if (repeat_interval.count() <= 0) {
    return fail("repeat_interval must be positive");
  }
  if (!ipv6_prefix.empty()) {
    const MacAddress zero_mac = {0, 0, 0, 0, 0, 0};
    if (!SynthesizeIpv6Address(ipv6_prefix, zero_mac, nullptr)) {
      return fail("ipv6_prefix '" + ipv6_prefix +
                  "' does not expand to a 16-byte address");
    }
  }
  if (!ipv6_interface.empty() && ::if_nametoindex(ipv6_interface.c_str()) == 0) {
    return fail("ipv6_interface not found: " + ipv6_interface);
  }
  return true;
}

}  // namespace lanlight
