#include "stick_translator.h"

#include <cmath>

int SpeedScale::normalize(double raw) const {
  const double f = std::fabs(raw) / full_scale;
  if (!(f >= min_fraction)) return 0;  // also catches NaN
  if (f > 1.0) return Config::max_speed;
  return static_cast<int>(std::floor(f * Config::max_speed));
}

MotionCommand translate_axis(const AxisRule& rule, double value, const SpeedScale& scale) {
  if (value < -rule.deadzone) return MotionCommand::move(rule.on_negative, scale.normalize(value));
  if (value > rule.deadzone) return MotionCommand::move(rule.on_positive, scale.normalize(value));
  return MotionCommand::move(rule.neutral, 0);
}

CommandPair translate_stick(const StickMapping& m, const AxisState& axes, const SpeedScale& scale) {
  const double y = axes.get(m.y_axis);
  const double x = axes.get(m.x_axis);
  return CommandPair{translate_axis(m.y_rule, y, scale), translate_axis(m.x_rule, x, scale)};
}

StickMapping translation_mapping(const TeleopSettings& s) {
  return StickMapping{
      .name = "translate",
      .x_axis = Axis::RightX,
      .y_axis = Axis::RightY,
      .y_rule = {s.deadzone_forward, MotionKind::Forward, MotionKind::Backward, MotionKind::Forward},
      .x_rule = {s.deadzone_lateral, MotionKind::Left, MotionKind::Right, MotionKind::Right},
  };
}

StickMapping altitude_yaw_mapping(const TeleopSettings& s) {
  return StickMapping{
      .name = "altitude_yaw",
      .x_axis = Axis::LeftX,
      .y_axis = Axis::LeftY,
      .y_rule = {s.deadzone_vertical, MotionKind::Up, MotionKind::Down, MotionKind::Up},
      .x_rule = {s.deadzone_rotate, MotionKind::CounterClockwise, MotionKind::Clockwise,
                 MotionKind::Clockwise},
  };
}

SpeedScale speed_scale(const TeleopSettings& s) {
  return SpeedScale{s.axis_full_scale, s.min_speed_fraction};
}
