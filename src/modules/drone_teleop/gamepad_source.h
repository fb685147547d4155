// gamepad_source.h
#pragma once

#include <memory>

#include "controller_profile.h"
#include "event_source.h"

// SDL2 joystick event stream. SDL is initialised, pumped and shut down on
// the source's own delivery thread; start() blocks until the joystick is
// open (or throws DeviceError).
class GamepadSource : public ControllerSource {
 public:
  explicit GamepadSource(ControllerProfile profile);
  ~GamepadSource() override;

  GamepadSource(GamepadSource&&) noexcept;
  GamepadSource& operator=(GamepadSource&&) noexcept;

  void start(EventHandler on_event, FaultHandler on_fault) override;
  void stop() override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};
