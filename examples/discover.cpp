// Example: discover lights on the local network and print what they report.
#include "lanlight/lanlight.h"

#include <chrono>
#include <iostream>
#include <string>

namespace {

class PrintingRegistry : public lanlight::DeviceRegistry {
 public:
  void Register(const std::shared_ptr<lanlight::Device>& device) override {
    std::cout << "registered " << device->mac_string() << " at "
              << device->endpoint().ToString() << std::endl;
    device->GetLabel([](lanlight::Device& d, const std::optional<lanlight::Message>& reply) {
      if (reply && d.state().label) {
        std::cout << "  " << d.mac_string() << " label=" << *d.state().label << std::endl;
      }
    });
    device->GetVersion([](lanlight::Device& d, const std::optional<lanlight::Message>& reply) {
      if (reply && d.state().version) {
        std::cout << "  " << d.mac_string() << " vendor=" << d.state().version->vendor
                  << " product=" << d.state().version->product << std::endl;
      }
    });
    device->GetColor([](lanlight::Device& d, const std::optional<lanlight::Message>& reply) {
      if (!reply) {
        std::cout << "  " << d.mac_string() << " did not answer LightGet" << std::endl;
        return;
      }
      if (d.state().color) {
        const auto& color = *d.state().color;
        std::cout << "  " << d.mac_string() << " hue=" << color.hue
                  << " sat=" << color.saturation << " bri=" << color.brightness
                  << " kelvin=" << color.kelvin << " power="
                  << (d.state().power_level.value_or(0) ? "on" : "off") << std::endl;
      }
    });
  }

  void Unregister(const std::shared_ptr<lanlight::Device>& device) override {
    std::cout << "unregistered " << device->mac_string() << std::endl;
  }
};

}  // namespace

int main(int argc, char** argv) {
  lanlight::Config config;
  config.discovery_interval = std::chrono::milliseconds(5000);
  if (argc > 1) {
    config.broadcast_address = argv[1];
  }
  if (argc > 2) {
    config.ipv6_prefix = argv[2];
  }

  lanlight::SelectLoop loop;
  PrintingRegistry registry;
  lanlight::Discovery discovery(loop, registry, config);
  if (!discovery.Start()) {
    std::cerr << "Failed to start discovery: " << discovery.GetLastError() << std::endl;
    return 1;
  }

  std::cout << "Discovering for 15s on " << config.broadcast_address << "..."
            << std::endl;
  loop.CallLater(std::chrono::seconds(15), [&loop]() { loop.Stop(); });
  loop.Run();

  const auto metrics = discovery.GetMetrics();
  std::cout << "devices=" << discovery.GetDevices().size()
            << " sent=" << metrics.packets_sent
            << " received=" << metrics.packets_received
            << " decode_errors=" << metrics.decode_errors << std::endl;
  return 0;
}
