#pragma once
#include <opencv2/core.hpp>

#include "types.h"

// frame -> (label, confidence). Implementations hold one model for the
// process lifetime and never touch vehicle control state.
class Classifier {
 public:
  virtual ~Classifier() = default;
  virtual ClassificationResult classify(const cv::Mat& image) = 0;
};
