// periodic_task.cpp
#include "periodic_task.h"

#include <atomic>
#include <thread>
#include <utility>

struct PeriodicTask::Impl {
  std::string name;
  std::chrono::microseconds period;
  Tick tick;

  std::thread worker{};
  std::atomic<bool> alive{false};
  std::atomic<std::uint64_t> ticks{0};
  std::atomic<std::uint64_t> overruns{0};

  void thread_fn() {
    using namespace std::chrono;
    auto next = steady_clock::now();

    while (alive.load(std::memory_order_relaxed)) {
      next += duration_cast<steady_clock::duration>(period);
      std::this_thread::sleep_until(next);
      if (!alive.load(std::memory_order_relaxed)) break;

      tick();
      ticks.fetch_add(1, std::memory_order_relaxed);

      // Overran the next deadline: restart the schedule from now.
      const auto now = steady_clock::now();
      if (now > next + period) {
        overruns.fetch_add(1, std::memory_order_relaxed);
        next = now;
      }
    }
  }
};

PeriodicTask::PeriodicTask(std::string name, std::chrono::microseconds period, Tick tick)
    : p_(new Impl{std::move(name), period, std::move(tick)}) {}

PeriodicTask::~PeriodicTask() {
  stop();
  delete p_;
}

void PeriodicTask::start() {
  if (p_->alive.exchange(true)) return;
  p_->worker = std::thread(&Impl::thread_fn, p_);
}

void PeriodicTask::stop() {
  p_->alive.store(false, std::memory_order_relaxed);
  if (p_->worker.joinable() && p_->worker.get_id() != std::this_thread::get_id()) {
    p_->worker.join();
  }
}

bool PeriodicTask::running() const {
  return p_->alive.load(std::memory_order_relaxed);
}
std::uint64_t PeriodicTask::ticks() const {
  return p_->ticks.load(std::memory_order_relaxed);
}
std::uint64_t PeriodicTask::overruns() const {
  return p_->overruns.load(std::memory_order_relaxed);
}
const std::string& PeriodicTask::name() const {
  return p_->name;
}
