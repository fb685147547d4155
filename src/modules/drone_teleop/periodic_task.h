#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

// Runs `tick` on its own thread every `period`. Ticks are sequential: a
// tick that overruns delays the next one instead of overlapping it, and
// missed firings are skipped rather than replayed in a burst.
class PeriodicTask {
 public:
  using Tick = std::function<void()>;

  PeriodicTask(std::string name, std::chrono::microseconds period, Tick tick);
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask&) = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;

  void start();
  // Waits for an in-flight tick to finish. Safe to call more than once.
  void stop();

  bool running() const;
  std::uint64_t ticks() const;
  std::uint64_t overruns() const;
  const std::string& name() const;

 private:
  struct Impl;
  Impl* p_;
};
