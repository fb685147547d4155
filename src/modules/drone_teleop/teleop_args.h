#pragma once
#include <optional>
#include <string>

// Positional process arguments, in order.
struct TeleopArgs {
  std::string vehicle_id;
  std::string profile_path;
  int camera_id = 0;
  std::string model_path;
  std::string labels_path;
};

const char* usage_text();

// nullopt when fewer than five arguments were given. Throws ConfigError for
// a camera id that is not a non-negative integer.
std::optional<TeleopArgs> parse_args(int argc, const char* const argv[]);

int parse_camera_id(const std::string& s);
