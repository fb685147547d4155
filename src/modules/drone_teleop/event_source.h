#pragma once
#include <functional>
#include <string>

#include "types.h"

// Reported from a source's own thread when its device is gone. The source
// stops delivering events after reporting.
using FaultHandler = std::function<void(const std::string& /*reason*/)>;

// Asynchronous controller event stream. Events are delivered one at a time,
// in arrival order, on a thread owned by the source.
class ControllerSource {
 public:
  using EventHandler = std::function<void(const ControllerEvent&)>;

  virtual ~ControllerSource() = default;

  // Opens the device; throws DeviceError if it is not available.
  virtual void start(EventHandler on_event, FaultHandler on_fault) = 0;
  // Joins the delivery thread and releases the device.
  virtual void stop() = 0;
};

// Asynchronous camera frame stream, same threading contract.
class FrameSource {
 public:
  using FrameHandler = std::function<void(Frame&&)>;

  virtual ~FrameSource() = default;

  virtual void start(FrameHandler on_frame, FaultHandler on_fault) = 0;
  virtual void stop() = 0;
};
