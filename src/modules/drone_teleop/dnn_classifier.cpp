#include "dnn_classifier.h"

#include <iostream>

#include "config.h"
#include "errors.h"

DnnClassifier::DnnClassifier(const std::string& model_path, LabelList labels)
    : labels_(std::move(labels)) {
  try {
    net_ = cv::dnn::readNetFromTensorflow(model_path);
  } catch (const cv::Exception& e) {
    throw ConfigError("cannot load model " + model_path + ": " + e.what());
  }
  if (net_.empty()) {
    throw ConfigError("model is empty: " + model_path);
  }
  std::cout << "[Vision] Loaded model " << model_path << "\n";
}

ClassificationResult DnnClassifier::classify(const cv::Mat& image) {
  // 224x224 blob, no mean subtraction, swap R/B, no crop
  const cv::Mat blob = cv::dnn::blobFromImage(
      image, 1.0, cv::Size(Config::blob_width, Config::blob_height), cv::Scalar(0, 0, 0, 0),
      /*swapRB=*/true, /*crop=*/false);

  net_.setInput(blob, Config::input_layer);
  const cv::Mat prob = net_.forward(Config::output_layer);

  // Flatten to 1xN and take the most probable class
  const cv::Mat prob_row = prob.reshape(1, 1);
  double max_val = 0.0;
  cv::Point max_loc;
  cv::minMaxLoc(prob_row, nullptr, &max_val, nullptr, &max_loc);

  ClassificationResult r{};
  r.index = max_loc.x;
  r.confidence = static_cast<float>(max_val);
  r.label = labels_.at(r.index);
  return r;
}
