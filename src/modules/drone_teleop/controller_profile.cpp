#include "controller_profile.h"

#include <fstream>
#include <iostream>
#include <sstream>

#include "errors.h"

namespace {
const std::unordered_map<std::string, Axis> kAxisKeys = {
    {"axis.left_x", Axis::LeftX},
    {"axis.left_y", Axis::LeftY},
    {"axis.right_x", Axis::RightX},
    {"axis.right_y", Axis::RightY},
};

const std::unordered_map<std::string, Button> kButtonKeys = {
    {"button.square", Button::Square}, {"button.triangle", Button::Triangle},
    {"button.cross", Button::Cross},   {"button.circle", Button::Circle},
    {"button.l1", Button::L1},         {"button.r1", Button::R1},
    {"button.select", Button::Select}, {"button.start", Button::Start},
};

int parse_id(const std::string& path, const std::string& key, const std::string& val) {
  size_t used = 0;
  int id = -1;
  try {
    id = std::stoi(val, &used);
  } catch (const std::logic_error&) {
    used = 0;
  }
  if (used != val.size() || id < 0) {
    throw ConfigError(path + ": invalid id for " + key + ": '" + val + "'");
  }
  return id;
}
}  // namespace

std::optional<Axis> ControllerProfile::axisFor(int device_axis) const {
  auto it = axes.find(device_axis);
  if (it == axes.end()) return std::nullopt;
  return it->second;
}

std::optional<Button> ControllerProfile::buttonFor(int device_button) const {
  auto it = buttons.find(device_button);
  if (it == buttons.end()) return std::nullopt;
  return it->second;
}

ControllerProfile load_profile(const std::string& path) {
  std::ifstream f(path);
  if (!f.is_open()) {
    throw ConfigError("cannot open controller profile: " + path);
  }

  ControllerProfile p{};
  bool seen[kAxisCount] = {};

  std::string line;
  while (std::getline(f, line)) {
    size_t comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line = line.substr(0, comment_pos);
    }
    line.erase(0, line.find_first_not_of(" \t\r\n"));
    if (line.empty()) continue;

    std::stringstream ss(line);
    std::string key, val;
    if (!std::getline(ss, key, '=') || !std::getline(ss, val)) {
      throw ConfigError(path + ": expected 'key = value': " + line);
    }
    key.erase(key.find_last_not_of(" \t") + 1);
    val.erase(0, val.find_first_not_of(" \t"));
    val.erase(val.find_last_not_of(" \t\r\n") + 1);

    if (key == "name") {
      p.name = val;
    } else if (key == "device_index") {
      p.device_index = parse_id(path, key, val);
    } else if (auto a = kAxisKeys.find(key); a != kAxisKeys.end()) {
      const int id = parse_id(path, key, val);
      if (!p.axes.emplace(id, a->second).second) {
        throw ConfigError(path + ": device axis " + val + " already mapped to " +
                          to_string(p.axes.at(id)));
      }
      seen[static_cast<int>(a->second)] = true;
    } else if (auto b = kButtonKeys.find(key); b != kButtonKeys.end()) {
      const int id = parse_id(path, key, val);
      if (!p.buttons.emplace(id, b->second).second) {
        throw ConfigError(path + ": device button " + val + " already mapped to " +
                          to_string(p.buttons.at(id)));
      }
    } else {
      std::cerr << "[Config] " << path << ": unknown key " << key << "\n";
    }
  }

  for (int i = 0; i < kAxisCount; ++i) {
    if (!seen[i]) {
      throw ConfigError(path + ": missing axis." + to_string(static_cast<Axis>(i)));
    }
  }
  if (p.name.empty()) p.name = path;

  std::cout << "[Config] Controller profile '" << p.name << "' (" << p.axes.size() << " axes, "
            << p.buttons.size() << " buttons)\n";
  return p;
}
