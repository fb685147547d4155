#include <chrono>
#include <cstdlib>
#include <csignal>
#include <iostream>
#include <thread>

#include "../camera_source.h"
#include "../config.h"
#include "../errors.h"
#include "../window_display.h"

// Raw camera view, no classifier. Ctrl-C to quit.
int main(int argc, char* argv[]) {
  const int device = (argc > 1) ? std::atoi(argv[1]) : 0;
  std::signal(SIGINT, on_signal);

  WindowDisplay window("camera_demo");
  CameraSource camera(device, Config::max_missed_frames);
  try {
    camera.start([&window](Frame&& f) { window.show(std::move(f), ""); },
                 [](const std::string&) { g_stop.store(true); });
  } catch (const DeviceError& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  while (!g_stop.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  camera.stop();
  window.close();
  return 0;
}
