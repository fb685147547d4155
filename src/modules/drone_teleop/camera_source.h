// camera_source.h
#pragma once
#include <memory>

#include "event_source.h"

// cv::VideoCapture frame stream on its own thread. A single failed read is
// dropped; `max_missed` consecutive failures count as a disconnect.
class CameraSource : public FrameSource {
 public:
  CameraSource(int device_index, int max_missed);
  ~CameraSource() override;

  CameraSource(CameraSource&&) noexcept;
  CameraSource& operator=(CameraSource&&) noexcept;

  void start(FrameHandler on_frame, FaultHandler on_fault) override;
  void stop() override;

 private:
  struct Impl;
  std::unique_ptr<Impl> p_;
};
