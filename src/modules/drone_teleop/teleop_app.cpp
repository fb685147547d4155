#include "teleop_app.h"

#include <chrono>
#include <iostream>
#include <stdexcept>

#include "config.h"
#include "errors.h"

namespace {
TeleopDevices checked(TeleopDevices d) {
  if (!d.vehicle || !d.controller || !d.camera || !d.classifier || !d.display) {
    throw std::invalid_argument("TeleopApp needs a vehicle, controller, camera, classifier and display");
  }
  return d;
}

std::chrono::microseconds emit_period(const TeleopSettings& s) {
  return std::chrono::microseconds(static_cast<std::int64_t>(s.emit_period_ms * 1000.0));
}
}  // namespace

const char* to_string(AppState s) {
  switch (s) {
    case AppState::Idle: return "Idle";
    case AppState::Running: return "Running";
    case AppState::Stopped: return "Stopped";
  }
  return "?";
}

TeleopApp::TeleopApp(TeleopDevices devices, const TeleopSettings& settings)
    : dev_(checked(std::move(devices))),
      settings_(validate_settings(settings)),
      channel_(*dev_.vehicle),
      input_(axes_, channel_),
      vision_(*dev_.classifier, *dev_.display),
      translate_(translation_mapping(settings_), speed_scale(settings_), axes_, channel_,
                 emit_period(settings_)),
      altitude_yaw_(altitude_yaw_mapping(settings_), speed_scale(settings_), axes_, channel_,
                    emit_period(settings_)) {
  channel_.setFaultHandler([this](const std::string& r) { requestStop("vehicle: " + r, true); });
}

TeleopApp::~TeleopApp() {
  shutdown();
}

void TeleopApp::start() {
  if (state() != AppState::Idle) {
    throw std::logic_error(std::string("cannot start teleop from state ") + to_string(state()));
  }

  axes_.reset();
  // Running before any source starts: the first delivered event already
  // sees the app in the state that permits commands.
  state_.store(AppState::Running, std::memory_order_release);
  try {
    dev_.vehicle->connect();
    channel_.open();

    dev_.controller->start([this](const ControllerEvent& e) { input_(e); },
                           [this](const std::string& r) { requestStop("controller: " + r, true); });

    // Camera branch: frames never touch axes_ or channel_.
    dev_.camera->start([this](Frame&& f) { vision_(std::move(f)); },
                       [this](const std::string& r) { requestStop("camera: " + r, true); });
  } catch (const DeviceError& e) {
    std::cerr << "[Teleop] start failed: " << e.what() << "\n";
    {
      std::lock_guard<std::mutex> lk(mu_);
      stop_requested_ = true;
      fault_ = true;
      stop_reason_ = e.what();
    }
    channel_.close();
    state_.store(AppState::Stopped, std::memory_order_release);
    releaseDevices();
    throw;
  }

  translate_.start();
  altitude_yaw_.start();
  std::cout << "[Teleop] Running (emit period " << settings_.emit_period_ms << " ms)\n";
}

int TeleopApp::run(const std::atomic<bool>& stop_flag) {
  try {
    start();
  } catch (const DeviceError&) {
    return 1;
  }

  {
    std::unique_lock<std::mutex> lk(mu_);
    while (!stop_requested_) {
      cv_.wait_for(lk, std::chrono::milliseconds(Config::supervise_poll_ms));
      if (stop_requested_) break;
      if (stop_flag.load(std::memory_order_relaxed)) {
        stop_requested_ = true;
        stop_reason_ = "stop requested";
      } else if (!dev_.vehicle->connected()) {
        stop_requested_ = true;
        fault_ = true;
        stop_reason_ = "vehicle: connection lost";
      }
    }
  }

  shutdown();
  return faulted() ? 1 : 0;
}

void TeleopApp::requestStop(const std::string& reason, bool fault) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (stop_requested_) return;
    stop_requested_ = true;
    fault_ = fault;
    stop_reason_ = reason;
  }
  // Commands stop at the request, not when the workers are joined.
  channel_.close();
  cv_.notify_all();
}

void TeleopApp::shutdown() {
  AppState prev = state_.exchange(AppState::Stopped, std::memory_order_acq_rel);
  if (prev != AppState::Running) return;

  channel_.close();
  translate_.stop();
  altitude_yaw_.stop();
  releaseDevices();

  std::cout << "[Teleop] Stopped (" << stopReason() << "): " << channel_.sent()
            << " commands, " << vision_.frames() << " frames, " << translate_.ticks() << "/"
            << altitude_yaw_.ticks() << " emitter ticks\n";
}

void TeleopApp::releaseDevices() {
  dev_.controller->stop();
  dev_.camera->stop();
  dev_.display->close();
  dev_.vehicle->disconnect();
}

std::string TeleopApp::stopReason() const {
  std::lock_guard<std::mutex> lk(mu_);
  return stop_reason_;
}

bool TeleopApp::faulted() const {
  std::lock_guard<std::mutex> lk(mu_);
  return fault_;
}
