// camera_source.cpp
#include "camera_source.h"

#include <opencv2/videoio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <future>
#include <iostream>
#include <thread>
#include <utility>

#include "errors.h"

struct CameraSource::Impl {
  int device_index;
  int max_missed;
  FrameHandler on_frame;
  FaultHandler on_fault;

  std::atomic<bool> alive{false};
  std::thread worker{};
  cv::VideoCapture cap{};
  std::uint64_t frames{0};

  Impl(int idx, int missed) : device_index(idx), max_missed(missed > 0 ? missed : 1) {}

  void fault(const std::string& reason) {
    alive.store(false, std::memory_order_relaxed);
    std::cerr << "[Camera] " << reason << "\n";
    if (on_fault) on_fault(reason);
  }

  void thread_fn(std::promise<void> ready) {
    if (!cap.open(device_index)) {
      alive.store(false, std::memory_order_relaxed);
      ready.set_exception(std::make_exception_ptr(
          DeviceError("cannot open camera " + std::to_string(device_index))));
      return;
    }
    std::cout << "[Camera] Opened device " << device_index << " ("
              << cap.get(cv::CAP_PROP_FRAME_WIDTH) << "x" << cap.get(cv::CAP_PROP_FRAME_HEIGHT)
              << ")\n";
    ready.set_value();

    int missed = 0;
    while (alive.load(std::memory_order_relaxed)) {
      Frame f{};
      if (!cap.read(f.image) || f.image.empty()) {
        if (++missed >= max_missed) {
          fault("camera " + std::to_string(device_index) + " stopped delivering frames");
          break;
        }
        std::cerr << "[Camera] dropped frame (" << missed << "/" << max_missed << ")\n";
        continue;
      }
      missed = 0;
      f.t = std::chrono::steady_clock::now();
      ++frames;
      try {
        on_frame(std::move(f));
      } catch (const std::exception& e) {
        fault(std::string("frame handler failed: ") + e.what());
      }
    }
    cap.release();
    std::cout << "[Camera] Released device " << device_index << " after " << frames
              << " frames\n";
  }
};

CameraSource::CameraSource(int device_index, int max_missed)
    : p_(std::make_unique<Impl>(device_index, max_missed)) {}

CameraSource::~CameraSource() {
  if (p_) stop();
}

CameraSource::CameraSource(CameraSource&& other) noexcept : p_(std::move(other.p_)) {}

CameraSource& CameraSource::operator=(CameraSource&& other) noexcept {
  if (this != &other) {
    p_ = std::move(other.p_);
  }
  return *this;
}

void CameraSource::start(FrameHandler on_frame, FaultHandler on_fault) {
  if (p_->alive.load(std::memory_order_relaxed)) return;
  p_->on_frame = std::move(on_frame);
  p_->on_fault = std::move(on_fault);
  p_->alive.store(true, std::memory_order_relaxed);

  std::promise<void> ready;
  auto opened = ready.get_future();
  p_->worker = std::thread(&Impl::thread_fn, p_.get(), std::move(ready));
  try {
    opened.get();
  } catch (const DeviceError&) {
    p_->worker.join();
    throw;
  }
}

void CameraSource::stop() {
  p_->alive.store(false, std::memory_order_relaxed);
  if (p_->worker.joinable()) p_->worker.join();
}
