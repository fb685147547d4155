#pragma once
#include <optional>
#include <string>
#include <unordered_map>

#include "types.h"

// Maps device axis/button numbers to logical names. Device ids pass through
// unchanged; anything not listed is ignored.
struct ControllerProfile {
  std::string name;
  int device_index = 0;
  std::unordered_map<int, Axis> axes;
  std::unordered_map<int, Button> buttons;

  std::optional<Axis> axisFor(int device_axis) const;
  std::optional<Button> buttonFor(int device_button) const;
};

// Throws ConfigError on a missing file, a bad id, a device id mapped twice,
// or a missing stick axis.
ControllerProfile load_profile(const std::string& path);
