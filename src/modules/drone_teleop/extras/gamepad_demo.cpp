#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

#include "../config.h"
#include "../controller_profile.h"
#include "../errors.h"
#include "../gamepad_source.h"

// Prints controller events for ~10 s, mapped through the given profile.
int main(int argc, char* argv[]) {
  if (argc < 2) {
    std::cout << "usage: gamepad_demo [controller profile]\n";
    return 1;
  }
  std::signal(SIGINT, on_signal);

  try {
    GamepadSource pad(load_profile(argv[1]));
    pad.start(
        [](const ControllerEvent& e) {
          if (auto* a = std::get_if<AxisChanged>(&e)) {
            std::cout << to_string(a->axis) << "=" << a->value << std::endl;
          } else if (auto* b = std::get_if<ButtonPressed>(&e)) {
            std::cout << "button " << to_string(b->button) << std::endl;
          }
        },
        [](const std::string&) { g_stop.store(true); });

    for (int i = 0; i < 100 && !g_stop.load(); ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    pad.stop();
  } catch (const std::runtime_error& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
