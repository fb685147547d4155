#pragma once
#include <string>

#include "config.h"

// ---- Runtime tuning ----
// Values loaded from teleop.conf. Defaults come from Config and are used for
// any key the file does not set.
struct TeleopSettings {
  double emit_period_ms     = Config::emit_period_ms;
  double axis_full_scale    = Config::axis_full_scale;
  double min_speed_fraction = Config::min_speed_fraction;

  double deadzone_forward   = Config::deadzone_forward;
  double deadzone_lateral   = Config::deadzone_lateral;
  double deadzone_vertical  = Config::deadzone_vertical;
  double deadzone_rotate    = Config::deadzone_rotate;

  double print_every        = Config::print_every;
  double max_missed_frames  = Config::max_missed_frames;
};

// Replaces every non-finite or out-of-range value with its default and
// reports it on std::cerr. Counts end up in [1, INT_MAX], the emitter
// period in [1, 60000] ms.
TeleopSettings validate_settings(TeleopSettings s);

// Missing file: write defaults to `path` and return them. Loaded values pass
// through validate_settings().
TeleopSettings load_settings(const std::string& path);
void save_settings(const TeleopSettings& s, const std::string& path);
