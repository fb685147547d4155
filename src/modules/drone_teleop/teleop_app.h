#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "axis_state.h"
#include "classifier.h"
#include "command_emitter.h"
#include "display_sink.h"
#include "event_source.h"
#include "input_handler.h"
#include "teleop_settings.h"
#include "vehicle_link.h"
#include "vision_pipeline.h"

enum class AppState { Idle, Running, Stopped };
const char* to_string(AppState s);

// Everything the app talks to. Owned by the app for its lifetime.
struct TeleopDevices {
  std::unique_ptr<VehicleLink> vehicle;
  std::unique_ptr<ControllerSource> controller;
  std::unique_ptr<FrameSource> camera;
  std::unique_ptr<Classifier> classifier;
  std::unique_ptr<DisplaySink> display;
};

// ---------------------- Teleoperation orchestrator --------------------------
// Idle -> Running on start(); Running -> Stopped on a device fault or a stop
// request. Stopped is terminal: devices are released and nothing restarts.
class TeleopApp {
 public:
  TeleopApp(TeleopDevices devices, const TeleopSettings& settings);
  ~TeleopApp();

  TeleopApp(const TeleopApp&) = delete;
  TeleopApp& operator=(const TeleopApp&) = delete;

  // Opens every device and starts both emitters. Throws DeviceError (after
  // releasing whatever was opened) or std::logic_error if not Idle.
  void start();

  // start(), then block until `stop_flag`, a device fault or requestStop().
  // Returns the process exit status: 0 for a requested stop, 1 for a fault.
  int run(const std::atomic<bool>& stop_flag);

  // Thread-safe; callable from any source thread. No command is issued
  // after this returns.
  void requestStop(const std::string& reason, bool fault = false);

  // Running -> Stopped. Joins all workers and releases all devices.
  void shutdown();

  AppState state() const { return state_.load(std::memory_order_acquire); }
  std::string stopReason() const;
  bool faulted() const;

  const AxisState& axes() const { return axes_; }
  std::uint64_t commandsSent() const { return channel_.sent(); }
  std::uint64_t framesShown() const { return vision_.frames(); }

 private:
  void releaseDevices();

  TeleopDevices dev_;
  TeleopSettings settings_;

  AxisState axes_;
  CommandChannel channel_;
  InputHandler input_;
  VisionPipeline vision_;
  CommandEmitter translate_;
  CommandEmitter altitude_yaw_;

  std::atomic<AppState> state_{AppState::Idle};

  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool stop_requested_{false};
  bool fault_{false};
  std::string stop_reason_;
};
