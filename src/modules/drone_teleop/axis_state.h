#pragma once
#include <array>
#include <atomic>

#include "types.h"

// ---- Stick reading (one x/y pair) ----
struct StickPair {
  double x = 0.0;
  double y = 0.0;
};

// Latest raw reading of each controller axis. Written by the input handler,
// read by the command emitters. Each field is an independent atomic cell;
// a set is a whole-value store, never read-modify-write, so no lock is taken.
class AxisState {
 public:
  AxisState() { reset(); }

  AxisState(const AxisState&) = delete;
  AxisState& operator=(const AxisState&) = delete;

  void set(Axis a, double v) { cell(a).store(v, std::memory_order_release); }
  double get(Axis a) const { return cell(a).load(std::memory_order_acquire); }

  // Two independent loads; x and y may come from different input events.
  StickPair left() const { return StickPair{get(Axis::LeftX), get(Axis::LeftY)}; }
  StickPair right() const { return StickPair{get(Axis::RightX), get(Axis::RightY)}; }

  void reset() {
    for (auto& c : cells_) c.store(0.0, std::memory_order_relaxed);
  }

 private:
  std::atomic<double>& cell(Axis a) { return cells_[static_cast<std::size_t>(a)]; }
  const std::atomic<double>& cell(Axis a) const { return cells_[static_cast<std::size_t>(a)]; }

  static_assert(std::atomic<double>::is_always_lock_free, "axis cells must be lock-free");
  std::array<std::atomic<double>, kAxisCount> cells_{};
};
