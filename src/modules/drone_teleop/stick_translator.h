#pragma once
#include "axis_state.h"
#include "teleop_settings.h"
#include "types.h"

// Raw axis magnitude -> vehicle speed [0, 100].
struct SpeedScale {
  double full_scale = Config::axis_full_scale;
  double min_fraction = Config::min_speed_fraction;

  // f = |raw| / full_scale; f < min_fraction -> 0, f > 1 -> 100, else floor(100 f).
  int normalize(double raw) const;
};

// One axis of a stick: which command a negative / positive deflection maps
// to, and what is sent while the stick sits inside the dead zone.
struct AxisRule {
  double deadzone;          // strict: |v| == deadzone is neutral
  MotionKind on_negative;
  MotionKind on_positive;
  MotionKind neutral;       // sent with speed 0
};

MotionCommand translate_axis(const AxisRule& rule, double value, const SpeedScale& scale);

// A stick drives two commands per tick: y first, then x.
struct StickMapping {
  const char* name;
  Axis x_axis;
  Axis y_axis;
  AxisRule y_rule;
  AxisRule x_rule;
};

struct CommandPair {
  MotionCommand primary;    // from y
  MotionCommand secondary;  // from x
};

CommandPair translate_stick(const StickMapping& m, const AxisState& axes, const SpeedScale& scale);

// Right stick: forward/backward + left/right. Stick up (negative y) is forward.
StickMapping translation_mapping(const TeleopSettings& s);
// Left stick: up/down + clockwise/counter-clockwise.
StickMapping altitude_yaw_mapping(const TeleopSettings& s);

SpeedScale speed_scale(const TeleopSettings& s);
