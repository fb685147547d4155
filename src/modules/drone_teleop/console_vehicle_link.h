#pragma once
#include <atomic>
#include <cstdint>
#include <string>

#include "vehicle_link.h"

// Vehicle sink that prints commands instead of transmitting them. Used when
// no radio link is attached; prints one line per `print_every` commands, and
// always prints one-shot commands.
class ConsoleVehicleLink : public VehicleLink {
 public:
  ConsoleVehicleLink(std::string vehicle_id, int print_every);

  void connect() override;
  void disconnect() override;
  bool connected() const override { return connected_.load(std::memory_order_acquire); }
  void send(const MotionCommand& cmd) override;

 private:
  std::string id_;
  int print_every_;
  std::atomic<bool> connected_{false};
  std::uint64_t count_{0};
};
