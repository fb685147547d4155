#pragma once
#include <string>

#include "types.h"

// Presents a frame with optional overlay text. Called only from the camera
// delivery thread; close() is called after that thread has been joined.
class DisplaySink {
 public:
  virtual ~DisplaySink() = default;
  virtual void show(Frame&& frame, const std::string& overlay) = 0;
  virtual void close() = 0;
};
