#include "sdl_event_map.h"

MappedSdlEvent map_sdl_event(const SDL_Event& ev, SDL_JoystickID instance,
                             const ControllerProfile& profile) {
  MappedSdlEvent m{};
  switch (ev.type) {
    case SDL_JOYAXISMOTION:
      if (ev.jaxis.which != instance) break;
      if (auto a = profile.axisFor(ev.jaxis.axis)) {
        m.kind = SdlEventKind::Controller;
        m.event = AxisChanged{*a, static_cast<double>(ev.jaxis.value)};
      }
      break;
    case SDL_JOYBUTTONDOWN:
      if (ev.jbutton.which != instance) break;
      if (auto b = profile.buttonFor(ev.jbutton.button)) {
        m.kind = SdlEventKind::Controller;
        m.event = ButtonPressed{*b};
      }
      break;
    case SDL_JOYDEVICEREMOVED:
      if (ev.jdevice.which == instance) m.kind = SdlEventKind::Removed;
      break;
    default:
      break;
  }
  return m;
}
