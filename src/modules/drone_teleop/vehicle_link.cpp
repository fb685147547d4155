#include "vehicle_link.h"

#include <iostream>

#include "errors.h"

void CommandChannel::close() {
  std::lock_guard<std::mutex> lk(mu_);
  open_.store(false, std::memory_order_release);
}

bool CommandChannel::send(const MotionCommand& cmd) {
  std::string fault;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!open_.load(std::memory_order_acquire)) return false;
    try {
      link_.send(cmd);
      sent_.fetch_add(1, std::memory_order_relaxed);
      return true;
    } catch (const DeviceError& e) {
      open_.store(false, std::memory_order_release);
      fault = e.what();
    }
  }
  // Reported outside the lock: the handler may close() the channel.
  std::cerr << "[Vehicle] link lost: " << fault << "\n";
  if (on_fault_) on_fault_(fault);
  return false;
}
