// gamepad_source.cpp  (all SDL calls live here)
#include "gamepad_source.h"

#include <SDL2/SDL.h>

#include <atomic>
#include <exception>
#include <future>
#include <iostream>
#include <thread>
#include <utility>

#include "config.h"
#include "errors.h"
#include "sdl_event_map.h"

struct GamepadSource::Impl {
  ControllerProfile profile;
  EventHandler on_event;
  FaultHandler on_fault;

  std::thread worker{};
  std::atomic<bool> alive{false};
  SDL_Joystick* joystick{nullptr};
  SDL_JoystickID instance{-1};

  explicit Impl(ControllerProfile p) : profile(std::move(p)) {}

  void open() {
    // Our own SIGINT/SIGTERM handlers stay in charge.
    SDL_SetHint(SDL_HINT_NO_SIGNAL_HANDLERS, "1");
    SDL_SetHint(SDL_HINT_JOYSTICK_ALLOW_BACKGROUND_EVENTS, "1");
    if (SDL_Init(SDL_INIT_JOYSTICK) < 0) {
      throw DeviceError(std::string("SDL_Init failed: ") + SDL_GetError());
    }
    if (SDL_NumJoysticks() <= profile.device_index) {
      SDL_Quit();
      throw DeviceError("No joystick found at index " + std::to_string(profile.device_index));
    }
    joystick = SDL_JoystickOpen(profile.device_index);
    if (!joystick) {
      const std::string err = SDL_GetError();
      SDL_Quit();
      throw DeviceError("Failed to open joystick " + std::to_string(profile.device_index) + ": " +
                        err);
    }
    instance = SDL_JoystickInstanceID(joystick);
    const char* name = SDL_JoystickName(joystick);
    std::cout << "[Gamepad] Opened " << (name ? name : "joystick") << " (axes="
              << SDL_JoystickNumAxes(joystick) << " buttons=" << SDL_JoystickNumButtons(joystick)
              << ") with profile '" << profile.name << "'\n";
  }

  void close() {
    if (joystick) {
      SDL_JoystickClose(joystick);
      joystick = nullptr;
    }
    SDL_Quit();
  }

  void fault(const std::string& reason) {
    alive.store(false, std::memory_order_relaxed);
    std::cerr << "[Gamepad] " << reason << "\n";
    if (on_fault) on_fault(reason);
  }

  void dispatch(const SDL_Event& ev) {
    const MappedSdlEvent m = map_sdl_event(ev, instance, profile);
    if (m.kind == SdlEventKind::Controller) {
      on_event(m.event);
    } else if (m.kind == SdlEventKind::Removed) {
      fault("controller disconnected");
    }
  }

  void thread_fn(std::promise<void> ready) {
    try {
      open();
    } catch (const DeviceError&) {
      alive.store(false, std::memory_order_relaxed);
      ready.set_exception(std::current_exception());
      return;
    }
    ready.set_value();

    while (alive.load(std::memory_order_relaxed)) {
      SDL_Event ev;
      if (!SDL_WaitEventTimeout(&ev, Config::gamepad_wait_ms)) continue;
      try {
        dispatch(ev);
      } catch (const std::exception& e) {
        fault(std::string("event handler failed: ") + e.what());
      }
    }
    close();
  }
};

GamepadSource::GamepadSource(ControllerProfile profile)
    : impl_(std::make_unique<Impl>(std::move(profile))) {}

GamepadSource::~GamepadSource() {
  if (impl_) stop();
}

GamepadSource::GamepadSource(GamepadSource&& other) noexcept : impl_(std::move(other.impl_)) {}

GamepadSource& GamepadSource::operator=(GamepadSource&& other) noexcept {
  if (this != &other) {
    impl_ = std::move(other.impl_);
  }
  return *this;
}

void GamepadSource::start(EventHandler on_event, FaultHandler on_fault) {
  if (impl_->alive.load(std::memory_order_relaxed)) return;
  impl_->on_event = std::move(on_event);
  impl_->on_fault = std::move(on_fault);
  impl_->alive.store(true, std::memory_order_relaxed);

  std::promise<void> ready;
  auto opened = ready.get_future();
  impl_->worker = std::thread(&Impl::thread_fn, impl_.get(), std::move(ready));
  try {
    opened.get();
  } catch (const DeviceError&) {
    impl_->worker.join();
    throw;
  }
}

void GamepadSource::stop() {
  impl_->alive.store(false, std::memory_order_relaxed);
  if (impl_->worker.joinable()) impl_->worker.join();
}
