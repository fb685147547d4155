#include <climits>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "teleop_settings.h"

static void write_param(std::ofstream& f, const std::string& name, double value) {
  f << std::left << std::setw(20) << name << " = " << value << "\n";
}

static std::unordered_map<std::string, double*> param_map(TeleopSettings& s) {
  return {{"emit_period_ms", &s.emit_period_ms},
          {"axis_full_scale", &s.axis_full_scale},
          {"min_speed_fraction", &s.min_speed_fraction},
          {"deadzone_forward", &s.deadzone_forward},
          {"deadzone_lateral", &s.deadzone_lateral},
          {"deadzone_vertical", &s.deadzone_vertical},
          {"deadzone_rotate", &s.deadzone_rotate},
          {"print_every", &s.print_every},
          {"max_missed_frames", &s.max_missed_frames}};
}

static void check_range(const char* name, double& value, double lo, double hi, double def) {
  if (std::isfinite(value) && value >= lo && value <= hi) return;
  std::cerr << "[Config] " << name << " = " << value << " out of range [" << lo << ", " << hi
            << "], using " << def << "\n";
  value = def;
}

TeleopSettings validate_settings(TeleopSettings s) {
  check_range("emit_period_ms", s.emit_period_ms, 1.0, 60000.0, Config::emit_period_ms);
  check_range("axis_full_scale", s.axis_full_scale, 1.0, 1e9, Config::axis_full_scale);
  check_range("min_speed_fraction", s.min_speed_fraction, 0.0, 1.0, Config::min_speed_fraction);

  check_range("deadzone_forward", s.deadzone_forward, 0.0, s.axis_full_scale, Config::deadzone_forward);
  check_range("deadzone_lateral", s.deadzone_lateral, 0.0, s.axis_full_scale, Config::deadzone_lateral);
  check_range("deadzone_vertical", s.deadzone_vertical, 0.0, s.axis_full_scale,
              Config::deadzone_vertical);
  check_range("deadzone_rotate", s.deadzone_rotate, 0.0, s.axis_full_scale, Config::deadzone_rotate);

  check_range("print_every", s.print_every, 1.0, INT_MAX, Config::print_every);
  check_range("max_missed_frames", s.max_missed_frames, 1.0, INT_MAX, Config::max_missed_frames);
  return s;
}

TeleopSettings load_settings(const std::string& path) {
  namespace fs = std::filesystem;
  TeleopSettings s{};
  if (!fs::exists(path)) {
    std::cout << "[Config] File '" << path << "' not found. Creating defaults.\n";
    fs::path p(path);
    if (p.has_parent_path()) {
      fs::create_directories(p.parent_path());
    }
    save_settings(s, path);
    return s;
  }

  std::ifstream f(path);
  if (!f.is_open()) {
    std::cerr << "[Config] Failed to open existing file: " << path << "\n";
    return s;
  }

  auto params = param_map(s);

  std::cout << "[Config] Loading from " << path << "...\n";
  std::string line;
  while (std::getline(f, line)) {
    size_t comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line = line.substr(0, comment_pos);
    }

    line.erase(0, line.find_first_not_of(" \t\r\n"));
    if (line.empty()) continue;

    std::stringstream ss(line);
    std::string key, val_str;

    if (std::getline(ss, key, '=') && std::getline(ss, val_str)) {
      key.erase(0, key.find_first_not_of(" \t"));
      key.erase(key.find_last_not_of(" \t") + 1);
      val_str.erase(0, val_str.find_first_not_of(" \t"));
      val_str.erase(val_str.find_last_not_of(" \t\r\n") + 1);

      auto it = params.find(key);
      if (it == params.end()) {
        std::cerr << "[Config] Unknown key: " << key << "\n";
        continue;
      }
      try {
        *it->second = std::stod(val_str);
        std::cout << "Loaded " << key << " = " << *it->second << "\n";
      } catch (const std::logic_error&) {
        std::cerr << "[Config] Error parsing value for " << key << ": '" << val_str << "'\n";
      }
    }
  }

  return validate_settings(s);
}

void save_settings(const TeleopSettings& s, const std::string& path) {
  std::ofstream f(path);
  if (f.is_open()) {
    f << "# Drone Teleop Configuration\n";
    f << "# Modifying this file requires application restart\n\n";

    f << "# --- Command emitters ---\n";
    write_param(f, "emit_period_ms", s.emit_period_ms);
    write_param(f, "axis_full_scale", s.axis_full_scale);
    write_param(f, "min_speed_fraction", s.min_speed_fraction);
    f << "\n";

    f << "# --- Dead zones (raw axis units) ---\n";
    write_param(f, "deadzone_forward", s.deadzone_forward);
    write_param(f, "deadzone_lateral", s.deadzone_lateral);
    write_param(f, "deadzone_vertical", s.deadzone_vertical);
    write_param(f, "deadzone_rotate", s.deadzone_rotate);
    f << "\n";

    f << "# --- Diagnostics / camera ---\n";
    write_param(f, "print_every", s.print_every);
    write_param(f, "max_missed_frames", s.max_missed_frames);

    std::cout << "[Config] Saved defaults to " << path << "\n";
  } else {
    std::cerr << "[Config] Failed to save " << path << "\n";
  }
}
