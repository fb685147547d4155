#pragma once
#include <stdexcept>
#include <string>

// Bad startup input (arguments, profile, label list, model). Raised before
// any device is opened.
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Controller, camera or vehicle link unavailable or lost.
class DeviceError : public std::runtime_error {
 public:
  explicit DeviceError(const std::string& what) : std::runtime_error(what) {}
};
