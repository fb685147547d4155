#pragma once
#include <atomic>
#include <chrono>
#include <csignal>

struct Config {
  // ========= Command emitters =========
  static constexpr int    emit_period_ms      = 10;       // both stick emitters
  static constexpr double axis_full_scale     = 32767.0;  // raw joystick range is ±32767
  static constexpr double min_speed_fraction  = 0.1;      // below 10% of full scale -> speed 0

  // Dead zones in raw device units. Rotation needs a larger deflection.
  static constexpr double deadzone_forward    = 10.0;
  static constexpr double deadzone_lateral    = 10.0;
  static constexpr double deadzone_vertical   = 10.0;
  static constexpr double deadzone_rotate     = 20.0;

  static constexpr int    max_speed           = 100;

  // ========= Console output =========
  static constexpr int    print_every         = 100;      // vehicle commands per log line

  // ========= Camera / classifier =========
  static constexpr int    max_missed_frames   = 30;       // consecutive failed reads -> disconnect
  static constexpr int    blob_width          = 224;
  static constexpr int    blob_height         = 224;
  static constexpr const char* input_layer    = "input";
  static constexpr const char* output_layer   = "softmax2";
  static constexpr const char* unknown_label  = "Unknown";
  static constexpr const char* window_name    = "drone_teleop";
  static constexpr int    overlay_x           = 10;
  static constexpr int    overlay_y           = 20;
  static constexpr double overlay_font_scale  = 1.2;
  static constexpr int    overlay_thickness   = 2;

  // ========= Orchestrator =========
  static constexpr int    supervise_poll_ms   = 50;       // stop flag / vehicle link check
  static constexpr int    gamepad_wait_ms     = 20;       // SDL event wait slice
};

static_assert(Config::deadzone_rotate >= Config::deadzone_lateral,
              "rotation dead zone should not be tighter than translation");
static_assert(Config::emit_period_ms > 0, "emitter period must be positive");

// ---------------------------------------------------------------------------

inline std::atomic<bool> g_stop{false};
inline void on_signal(int) { g_stop.store(true, std::memory_order_relaxed); }
