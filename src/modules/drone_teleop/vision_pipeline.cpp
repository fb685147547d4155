#include "vision_pipeline.h"

#include <iostream>
#include <sstream>

std::string VisionPipeline::overlayText(const ClassificationResult& r) {
  std::ostringstream ss;
  ss << "description: " << r.label << ", maxVal: " << r.confidence;
  return ss.str();
}

void VisionPipeline::operator()(Frame&& frame) {
  std::string overlay;
  try {
    overlay = overlayText(classifier_.classify(frame.image));
  } catch (const cv::Exception& e) {
    // Frame still goes out, just without a label.
    failures_.fetch_add(1, std::memory_order_relaxed);
    std::cerr << "[Vision] classification failed: " << e.what() << "\n";
  }
  frames_.fetch_add(1, std::memory_order_relaxed);
  display_.show(std::move(frame), overlay);
}
