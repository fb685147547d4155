#pragma once
#include <opencv2/core.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>

// ---- Controller axes and buttons (logical names, mapped by the profile) ----
enum class Axis : std::uint8_t { LeftX = 0, LeftY, RightX, RightY };
inline constexpr int kAxisCount = 4;

enum class Button : std::uint8_t { Square, Triangle, Cross, Circle, L1, R1, Select, Start };

const char* to_string(Axis a);
const char* to_string(Button b);

// ---- Controller events (consumed immediately, never stored) ----
struct AxisChanged {
  Axis axis;
  double value;  // raw device value, e.g. [-32767, 32767]
};

struct ButtonPressed {
  Button button;
};

using ControllerEvent = std::variant<AxisChanged, ButtonPressed>;

// ---- Vehicle motion commands ----
enum class MotionKind : std::uint8_t {
  Forward,
  Backward,
  Left,
  Right,
  Up,
  Down,
  Clockwise,
  CounterClockwise,
  TakeOff,
  Land,
  Stop,
  EnableProtection,
};

struct MotionCommand {
  MotionKind kind;
  int speed = 0;  // [0, 100]; always 0 for the one-shot kinds

  static MotionCommand move(MotionKind k, int speed) { return MotionCommand{k, speed}; }
  static MotionCommand oneShot(MotionKind k) { return MotionCommand{k, 0}; }

  bool operator==(const MotionCommand&) const = default;
};

const char* to_string(MotionKind k);
std::string to_string(const MotionCommand& c);

// ---- Camera frame (moved producer -> classifier -> display) ----
struct Frame {
  cv::Mat image;
  std::chrono::steady_clock::time_point t{};
};

// ---- Classification of one frame ----
struct ClassificationResult {
  std::string label;
  float confidence = 0.0f;
  int index = -1;
};
