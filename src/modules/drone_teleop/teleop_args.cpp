#include "teleop_args.h"

#include <stdexcept>

#include "errors.h"

const char* usage_text() {
  return "How to run:\n\tdrone_teleop [vehicle ID] [controller profile] [camera id] "
         "[model file] [labels file]\n";
}

int parse_camera_id(const std::string& s) {
  size_t used = 0;
  int id = -1;
  try {
    id = std::stoi(s, &used);
  } catch (const std::logic_error&) {
    used = 0;
  }
  if (used != s.size() || id < 0) throw ConfigError("invalid camera id: '" + s + "'");
  return id;
}

std::optional<TeleopArgs> parse_args(int argc, const char* const argv[]) {
  if (argc < 6) return std::nullopt;
  TeleopArgs a;
  a.vehicle_id = argv[1];
  a.profile_path = argv[2];
  a.camera_id = parse_camera_id(argv[3]);
  a.model_path = argv[4];
  a.labels_path = argv[5];
  return a;
}
