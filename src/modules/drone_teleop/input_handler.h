#pragma once
#include "axis_state.h"
#include "types.h"
#include "vehicle_link.h"

// Handles controller events in arrival order on the controller's delivery
// thread. Axis events only update AxisState; button presses send one-shot
// commands straight to the vehicle.
class InputHandler {
 public:
  InputHandler(AxisState& axes, CommandChannel& vehicle) : axes_(axes), vehicle_(vehicle) {}

  void operator()(const ControllerEvent& e);

  void onAxis(const AxisChanged& e);
  void onButton(const ButtonPressed& e);

 private:
  AxisState& axes_;
  CommandChannel& vehicle_;
};
