#include "console_vehicle_link.h"

#include <cstdio>
#include <iostream>

#include "errors.h"

ConsoleVehicleLink::ConsoleVehicleLink(std::string vehicle_id, int print_every)
    : id_(std::move(vehicle_id)), print_every_(print_every > 0 ? print_every : 1) {}

void ConsoleVehicleLink::connect() {
  if (id_.empty()) throw DeviceError("empty vehicle id");
  connected_.store(true, std::memory_order_release);
  std::cout << "[Vehicle] " << id_ << " connected (console sink)\n";
}

void ConsoleVehicleLink::disconnect() {
  if (!connected_.exchange(false)) return;
  std::cout << "[Vehicle] " << id_ << " disconnected after " << count_ << " commands\n";
}

void ConsoleVehicleLink::send(const MotionCommand& cmd) {
  if (!connected()) throw DeviceError("vehicle " + id_ + " not connected");
  ++count_;
  const bool one_shot = cmd.kind == MotionKind::TakeOff || cmd.kind == MotionKind::Land ||
                        cmd.kind == MotionKind::Stop || cmd.kind == MotionKind::EnableProtection;
  if (one_shot || (count_ % print_every_) == 0) {
    std::printf("[Vehicle] #%llu %s\n", static_cast<unsigned long long>(count_),
                to_string(cmd).c_str());
  }
}
