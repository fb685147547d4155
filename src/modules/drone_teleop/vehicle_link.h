#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

#include "types.h"

// Vehicle command sink. send() is fire-and-forget; a lost link is reported
// by throwing DeviceError from send() or by connected() turning false.
class VehicleLink {
 public:
  virtual ~VehicleLink() = default;

  virtual void connect() = 0;
  virtual void disconnect() = 0;
  virtual bool connected() const = 0;
  virtual void send(const MotionCommand& cmd) = 0;
};

// Single logical command channel shared by the input handler and both
// emitters. Calls into the link never interleave. After close() returns no
// further command reaches the link.
//
// The lock is held across VehicleLink::send(). A send that hangs therefore
// stalls both emitters, and the controller thread as soon as it handles a
// button press; events queued behind that press wait too. Axis events
// themselves never take the lock. A link must bound its own send time (the
// console sink never blocks) and report a dead radio with DeviceError.
class CommandChannel {
 public:
  using FaultHandler = std::function<void(const std::string&)>;

  explicit CommandChannel(VehicleLink& link) : link_(link) {}

  void setFaultHandler(FaultHandler cb) { on_fault_ = std::move(cb); }

  void open() { open_.store(true, std::memory_order_release); }
  void close();
  bool isOpen() const { return open_.load(std::memory_order_acquire); }

  // Returns false when the command was dropped (channel closed or link failed).
  bool send(const MotionCommand& cmd);

  std::uint64_t sent() const { return sent_.load(std::memory_order_relaxed); }

 private:
  VehicleLink& link_;
  FaultHandler on_fault_;
  std::mutex mu_;
  std::atomic<bool> open_{false};
  std::atomic<std::uint64_t> sent_{0};
};
