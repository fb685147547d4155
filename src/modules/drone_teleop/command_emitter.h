#pragma once
#include <chrono>
#include <cstdint>

#include "axis_state.h"
#include "periodic_task.h"
#include "stick_translator.h"
#include "vehicle_link.h"

// Level-triggered stick emitter: every period it reads the current stick
// from AxisState and sends one command pair, whether or not the stick moved.
class CommandEmitter {
 public:
  CommandEmitter(const StickMapping& mapping, const SpeedScale& scale, const AxisState& axes,
                 CommandChannel& vehicle, std::chrono::microseconds period);

  void start() { task_.start(); }
  void stop() { task_.stop(); }

  // One tick's worth of work; exposed so tests can drive it synchronously.
  CommandPair emitOnce();

  std::uint64_t ticks() const { return task_.ticks(); }

 private:
  StickMapping mapping_;
  SpeedScale scale_;
  const AxisState& axes_;
  CommandChannel& vehicle_;
  PeriodicTask task_;
};
