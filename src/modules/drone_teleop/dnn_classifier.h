#pragma once
#include <opencv2/dnn.hpp>

#include <string>

#include "classifier.h"
#include "label_list.h"

// TensorFlow graph (e.g. Inception) run through OpenCV's dnn module.
class DnnClassifier : public Classifier {
 public:
  // Throws ConfigError if the model cannot be loaded.
  DnnClassifier(const std::string& model_path, LabelList labels);

  ClassificationResult classify(const cv::Mat& image) override;

  const LabelList& labels() const { return labels_; }

 private:
  cv::dnn::Net net_;
  LabelList labels_;
};
