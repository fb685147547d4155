#pragma once
#include <atomic>
#include <cstdint>
#include <string>

#include "classifier.h"
#include "display_sink.h"
#include "types.h"

// Camera branch: classify the frame, overlay the result, hand it to the
// display. Read-only with respect to vehicle control.
class VisionPipeline {
 public:
  VisionPipeline(Classifier& classifier, DisplaySink& display)
      : classifier_(classifier), display_(display) {}

  void operator()(Frame&& frame);

  static std::string overlayText(const ClassificationResult& r);

  std::uint64_t frames() const { return frames_.load(std::memory_order_relaxed); }
  std::uint64_t failures() const { return failures_.load(std::memory_order_relaxed); }

 private:
  Classifier& classifier_;
  DisplaySink& display_;
  std::atomic<std::uint64_t> frames_{0};
  std::atomic<std::uint64_t> failures_{0};
};
