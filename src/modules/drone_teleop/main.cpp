#include <csignal>
#include <iostream>
#include <memory>
#include <string>

#include "camera_source.h"
#include "config.h"
#include "console_vehicle_link.h"
#include "controller_profile.h"
#include "dnn_classifier.h"
#include "errors.h"
#include "gamepad_source.h"
#include "label_list.h"
#include "teleop_app.h"
#include "teleop_args.h"
#include "teleop_settings.h"
#include "window_display.h"

static int print_usage() {
  std::cout << usage_text();
  return 1;
}

int main(int argc, char* argv[]) {
  TeleopDevices dev;
  TeleopSettings settings;
  try {
    const auto args = parse_args(argc, argv);
    if (!args) return print_usage();

    settings = load_settings("teleop.conf");
    ControllerProfile profile = load_profile(args->profile_path);
    LabelList labels = LabelList::load(args->labels_path);

    dev.classifier = std::make_unique<DnnClassifier>(args->model_path, std::move(labels));
    dev.vehicle = std::make_unique<ConsoleVehicleLink>(args->vehicle_id,
                                                       static_cast<int>(settings.print_every));
    dev.controller = std::make_unique<GamepadSource>(std::move(profile));
    dev.camera = std::make_unique<CameraSource>(args->camera_id,
                                                static_cast<int>(settings.max_missed_frames));
    dev.display = std::make_unique<WindowDisplay>(Config::window_name);
  } catch (const ConfigError& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return print_usage();
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  TeleopApp app(std::move(dev), settings);
  const int rc = app.run(g_stop);
  if (rc != 0) {
    std::cerr << "Error: " << app.stopReason() << std::endl;
  }
  return rc;
}
