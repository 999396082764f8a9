// Example: find one light by hardware address and run a short control sequence.
#include "lanlight/lanlight.h"

#include <chrono>
#include <iostream>
#include <string>

namespace {

class TargetRegistry : public lanlight::DeviceRegistry {
 public:
  TargetRegistry(lanlight::SelectLoop& loop, const lanlight::MacAddress& target)
      : loop_(loop), target_(target) {}

  void Register(const std::shared_ptr<lanlight::Device>& device) override {
    if (device->mac_address() != target_ || device_) {
      return;
    }
    device_ = device;
    std::cout << "found " << device->mac_string() << " at "
              << device->endpoint().ToString() << std::endl;
    Run();
  }

  void Unregister(const std::shared_ptr<lanlight::Device>& device) override {
    if (device == device_) {
      std::cout << "lost " << device->mac_string() << std::endl;
      device_.reset();
      loop_.Stop();
    }
  }

 private:
  static void Report(const char* step, const std::optional<lanlight::Message>& reply) {
    std::cout << step << ": "
              << (reply ? lanlight::MessageTypeName(reply->type()) : "no response")
              << std::endl;
  }

  void Run() {
    device_->SetPower(true, [](lanlight::Device&, const std::optional<lanlight::Message>& reply) {
      Report("power on", reply);
    });

    const lanlight::Hsbk blue = {43690, 65535, 65535, 3500};
    device_->SetColor(blue, [](lanlight::Device&, const std::optional<lanlight::Message>& reply) {
      Report("set color", reply);
    }, 1000);

    loop_.CallLater(std::chrono::seconds(2), [this]() {
      if (!device_) {
        return;
      }
      lanlight::LightSetWaveform pulse;
      pulse.transient = true;
      pulse.color = {0, 65535, 65535, 3500};
      pulse.period = 500;
      pulse.cycles = 4.0f;
      pulse.waveform = lanlight::Waveform::kPulse;
      device_->SetWaveform(pulse);
    });

    loop_.CallLater(std::chrono::seconds(5), [this]() {
      if (!device_) {
        return;
      }
      device_->GetPower([this](lanlight::Device& d,
                               const std::optional<lanlight::Message>& reply) {
        Report("get power", reply);
        if (d.state().power_level) {
          std::cout << "power level " << *d.state().power_level << std::endl;
        }
        loop_.Stop();
      });
    });
  }

  lanlight::SelectLoop& loop_;
  lanlight::MacAddress target_;
  std::shared_ptr<lanlight::Device> device_;
};

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "usage: " << argv[0] << " <mac> [broadcast-address]" << std::endl;
    return 2;
  }
  lanlight::MacAddress target{};
  if (!lanlight::ParseMac(argv[1], &target)) {
    std::cerr << "invalid hardware address: " << argv[1] << std::endl;
    return 2;
  }

  lanlight::Config config;
  config.discovery_interval = std::chrono::milliseconds(3000);
  if (argc > 2) {
    config.broadcast_address = argv[2];
  }

  lanlight::SelectLoop loop;
  TargetRegistry registry(loop, target);
  lanlight::Discovery discovery(loop, registry, config);
  if (!discovery.Start()) {
    std::cerr << "Failed to start discovery: " << discovery.GetLastError() << std::endl;
    return 1;
  }
  loop.CallLater(std::chrono::seconds(30), [&loop]() {
    std::cerr << "timed out" << std::endl;
    loop.Stop();
  });
  loop.Run();
  return 0;
}
