#pragma once
#include <SDL2/SDL.h>

#include "controller_profile.h"
#include "types.h"

// What one SDL event means for the joystick `instance`.
enum class SdlEventKind { Ignored, Controller, Removed };

struct MappedSdlEvent {
  SdlEventKind kind = SdlEventKind::Ignored;
  ControllerEvent event{};  // valid only for Controller
};

// Events from other joysticks and ids the profile does not list are Ignored.
MappedSdlEvent map_sdl_event(const SDL_Event& ev, SDL_JoystickID instance,
                             const ControllerProfile& profile);
