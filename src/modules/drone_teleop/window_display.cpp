#include "window_display.h"

#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>

#include "config.h"

void WindowDisplay::drawOverlay(cv::Mat& image, const std::string& text) {
  cv::putText(image, text, cv::Point(Config::overlay_x, Config::overlay_y),
              cv::FONT_HERSHEY_PLAIN, Config::overlay_font_scale, cv::Scalar(0, 255, 0),
              Config::overlay_thickness);
}

void WindowDisplay::show(Frame&& frame, const std::string& overlay) {
  Frame f = std::move(frame);
  if (f.image.empty()) return;
  if (!open_) {
    cv::namedWindow(title_, cv::WINDOW_AUTOSIZE);
    open_ = true;
  }
  if (!overlay.empty()) drawOverlay(f.image, overlay);
  cv::imshow(title_, f.image);
  cv::waitKey(1);
}

void WindowDisplay::close() {
  if (!open_) return;
  cv::destroyWindow(title_);
  cv::waitKey(1);
  open_ = false;
}
