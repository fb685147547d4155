#include "axis_state.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <array>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

TEST(AxisStateTest, StartsAtZero) {
  AxisState s;
  for (int i = 0; i < kAxisCount; ++i) {
    EXPECT_EQ(s.get(static_cast<Axis>(i)), 0.0);
  }
}

TEST(AxisStateTest, FieldsAreIndependent) {
  AxisState s;
  s.set(Axis::LeftX, -100.0);
  s.set(Axis::RightY, 32767.0);
  EXPECT_EQ(s.get(Axis::LeftX), -100.0);
  EXPECT_EQ(s.get(Axis::LeftY), 0.0);
  EXPECT_EQ(s.get(Axis::RightX), 0.0);
  EXPECT_EQ(s.get(Axis::RightY), 32767.0);

  const StickPair l = s.left();
  const StickPair r = s.right();
  EXPECT_EQ(l.x, -100.0);
  EXPECT_EQ(l.y, 0.0);
  EXPECT_EQ(r.x, 0.0);
  EXPECT_EQ(r.y, 32767.0);
}

TEST(AxisStateTest, LatestWriteWins) {
  AxisState s;
  s.set(Axis::RightX, 1.0);
  s.set(Axis::RightX, 2.0);
  s.set(Axis::RightX, -3.5);
  EXPECT_EQ(s.get(Axis::RightX), -3.5);

  s.reset();
  EXPECT_EQ(s.get(Axis::RightX), 0.0);
}

// Writers alternate between values whose high and low 32-bit halves all
// differ; a torn read would produce a value outside the written set.
TEST(AxisStateTest, ConcurrentReadersNeverSeeTornValues) {
  AxisState s;
  constexpr std::array<double, 3> kValues = {-32767.123456789, 1.0 / 3.0, 29999.000000001};

  std::atomic<bool> go{true};
  std::atomic<long> bad{0};
  std::atomic<long> reads{0};

  std::vector<std::thread> writers;
  for (int w = 0; w < 2; ++w) {
    writers.emplace_back([&, w] {
      std::size_t i = static_cast<std::size_t>(w);
      while (go.load(std::memory_order_relaxed)) {
        s.set(Axis::LeftY, kValues[i % kValues.size()]);
        s.set(Axis::RightY, kValues[(i + 1) % kValues.size()]);
        ++i;
      }
    });
  }

  std::vector<std::thread> readers;
  for (int r = 0; r < 3; ++r) {
    readers.emplace_back([&] {
      while (go.load(std::memory_order_relaxed)) {
        for (Axis a : {Axis::LeftY, Axis::RightY}) {
          const double v = s.get(a);
          const bool ok = v == 0.0 || v == kValues[0] || v == kValues[1] || v == kValues[2];
          if (!ok) bad.fetch_add(1, std::memory_order_relaxed);
          reads.fetch_add(1, std::memory_order_relaxed);
        }
      }
    });
  }

  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  go.store(false);
  for (auto& t : writers) t.join();
  for (auto& t : readers) t.join();

  EXPECT_GT(reads.load(), 0);
  EXPECT_EQ(bad.load(), 0);
}

TEST(AxisStateTest, CellsAreLockFree) {
  EXPECT_TRUE(std::atomic<double>::is_always_lock_free);
}
