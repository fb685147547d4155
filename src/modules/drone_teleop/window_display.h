#pragma once
#include <string>

#include "display_sink.h"

// HighGUI window. Created on the first frame, from the thread that shows.
class WindowDisplay : public DisplaySink {
 public:
  explicit WindowDisplay(std::string title) : title_(std::move(title)) {}
  ~WindowDisplay() override { close(); }

  void show(Frame&& frame, const std::string& overlay) override;
  void close() override;

  // Green text at the top-left corner.
  static void drawOverlay(cv::Mat& image, const std::string& text);

 private:
  std::string title_;
  bool open_{false};
};
