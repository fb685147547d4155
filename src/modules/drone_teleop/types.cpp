#include "types.h"

const char* to_string(Axis a) {
  switch (a) {
    case Axis::LeftX: return "left_x";
    case Axis::LeftY: return "left_y";
    case Axis::RightX: return "right_x";
    case Axis::RightY: return "right_y";
  }
  return "?";
}

const char* to_string(Button b) {
  switch (b) {
    case Button::Square: return "square";
    case Button::Triangle: return "triangle";
    case Button::Cross: return "cross";
    case Button::Circle: return "circle";
    case Button::L1: return "l1";
    case Button::R1: return "r1";
    case Button::Select: return "select";
    case Button::Start: return "start";
  }
  return "?";
}

const char* to_string(MotionKind k) {
  switch (k) {
    case MotionKind::Forward: return "Forward";
    case MotionKind::Backward: return "Backward";
    case MotionKind::Left: return "Left";
    case MotionKind::Right: return "Right";
    case MotionKind::Up: return "Up";
    case MotionKind::Down: return "Down";
    case MotionKind::Clockwise: return "Clockwise";
    case MotionKind::CounterClockwise: return "CounterClockwise";
    case MotionKind::TakeOff: return "TakeOff";
    case MotionKind::Land: return "Land";
    case MotionKind::Stop: return "Stop";
    case MotionKind::EnableProtection: return "EnableProtection";
  }
  return "?";
}

std::string to_string(const MotionCommand& c) {
  switch (c.kind) {
    case MotionKind::TakeOff:
    case MotionKind::Land:
    case MotionKind::Stop:
    case MotionKind::EnableProtection:
      return to_string(c.kind);
    default:
      return std::string(to_string(c.kind)) + "(" + std::to_string(c.speed) + ")";
  }
}
