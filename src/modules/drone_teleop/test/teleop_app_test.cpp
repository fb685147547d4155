#include "teleop_app.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

#include "teleop_fakes.h"

using namespace std::chrono_literals;

// ===================== Test Fixture =====================
// Devices are handed to the app by unique_ptr; the fixture keeps raw
// pointers so tests can drive and inspect them.
class TeleopAppFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    settings_.emit_period_ms = 5;

    auto vehicle = std::make_unique<FakeVehicleLink>();
    auto controller = std::make_unique<FakeControllerSource>();
    auto camera = std::make_unique<FakeFrameSource>();
    auto classifier = std::make_unique<FixedClassifier>(
        LabelList({"background", "quadcopter"}), 1, 0.875f);
    auto display = std::make_unique<RecordingDisplay>();

    vehicle_ = vehicle.get();
    controller_ = controller.get();
    camera_ = camera.get();
    classifier_ = classifier.get();
    display_ = display.get();

    dev_.vehicle = std::move(vehicle);
    dev_.controller = std::move(controller);
    dev_.camera = std::move(camera);
    dev_.classifier = std::move(classifier);
    dev_.display = std::move(display);
  }

  void TearDown() override {
    stop_.store(true);
    if (runner_.joinable()) runner_.join();
  }

  TeleopApp& makeApp() {
    app_ = std::make_unique<TeleopApp>(std::move(dev_), settings_);
    return *app_;
  }

  // run() on its own thread, as main() would from the main thread.
  void runInBackground(TeleopApp& app) {
    runner_ = std::thread([this, &app] { rc_.store(app.run(stop_)); });
    const auto deadline = std::chrono::steady_clock::now() + 1s;
    while (app.state() == AppState::Idle && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(1ms);
    }
    // Emitters start last, so a first command means every source is up.
    if (app.state() == AppState::Running) vehicle_->waitCountAtLeast(1);
  }

  void joinRunner() {
    if (runner_.joinable()) runner_.join();
  }

  TeleopSettings settings_{};
  TeleopDevices dev_;
  FakeVehicleLink* vehicle_{nullptr};
  FakeControllerSource* controller_{nullptr};
  FakeFrameSource* camera_{nullptr};
  FixedClassifier* classifier_{nullptr};
  RecordingDisplay* display_{nullptr};

  std::atomic<bool> stop_{false};
  std::atomic<int> rc_{-1};
  std::unique_ptr<TeleopApp> app_;
  std::thread runner_;
};

// ===================== Tests =====================

TEST_F(TeleopAppFixture, StartOpensEverythingAndEmitsNeutralCommands) {
  auto& app = makeApp();
  EXPECT_EQ(app.state(), AppState::Idle);

  app.start();
  EXPECT_EQ(app.state(), AppState::Running);
  EXPECT_EQ(vehicle_->connects.load(), 1);
  EXPECT_TRUE(controller_->started.load());
  EXPECT_TRUE(camera_->started.load());

  // Sticks centred: both emitters keep sending their neutral pair.
  ASSERT_TRUE(vehicle_->waitCountAtLeast(8));
  for (const auto& c : vehicle_->commands()) {
    EXPECT_EQ(c.speed, 0) << to_string(c);
  }

  app.shutdown();
  EXPECT_EQ(app.state(), AppState::Stopped);
}

TEST_F(TeleopAppFixture, SourcesSeeRunningFromTheirFirstEvent) {
  auto& app = makeApp();
  AppState seen = AppState::Idle;
  controller_->on_started = [&] {
    seen = app.state();
    controller_->emit(ButtonPressed{Button::Cross});
  };

  app.start();
  EXPECT_EQ(seen, AppState::Running);
  const auto cmds = vehicle_->commands();
  ASSERT_FALSE(cmds.empty());
  EXPECT_EQ(cmds.front(), MotionCommand::oneShot(MotionKind::Land));
  app.shutdown();
}

TEST_F(TeleopAppFixture, SettingsAreValidatedOnConstruction) {
  settings_.emit_period_ms = 0.0004;
  auto& app = makeApp();
  app.start();
  std::this_thread::sleep_for(50ms);
  app.shutdown();
  // Default 10 ms period: two emitters, two commands per tick.
  EXPECT_LE(vehicle_->count(), 40u);
}

TEST_F(TeleopAppFixture, StickInputReachesVehicleThroughEmitters) {
  auto& app = makeApp();
  app.start();

  controller_->emit(AxisChanged{Axis::RightY, -32767.0});
  controller_->emit(AxisChanged{Axis::LeftX, 20000.0});
  EXPECT_EQ(app.axes().get(Axis::RightY), -32767.0);

  const auto deadline = std::chrono::steady_clock::now() + 1s;
  bool saw_forward = false, saw_cw = false;
  while (!(saw_forward && saw_cw) && std::chrono::steady_clock::now() < deadline) {
    for (const auto& c : vehicle_->commands()) {
      saw_forward |= c == MotionCommand::move(MotionKind::Forward, 100);
      saw_cw |= c == MotionCommand::move(MotionKind::Clockwise, 61);
    }
    std::this_thread::sleep_for(5ms);
  }
  EXPECT_TRUE(saw_forward);
  EXPECT_TRUE(saw_cw);
  app.shutdown();
}

TEST_F(TeleopAppFixture, ButtonIsSentImmediatelyAndLeavesAxesAlone) {
  auto& app = makeApp();
  app.start();

  controller_->emit(ButtonPressed{Button::Cross});
  const auto cmds = vehicle_->commands();
  EXPECT_EQ(std::count(cmds.begin(), cmds.end(), MotionCommand::oneShot(MotionKind::Land)), 1);
  for (int i = 0; i < kAxisCount; ++i) {
    EXPECT_EQ(app.axes().get(static_cast<Axis>(i)), 0.0);
  }
  app.shutdown();
}

TEST_F(TeleopAppFixture, CameraFramesAreClassifiedAndShown) {
  auto& app = makeApp();
  app.start();

  const std::size_t before = vehicle_->count();
  camera_->push();
  camera_->push();

  EXPECT_EQ(display_->shown(), 2);
  EXPECT_EQ(display_->lastOverlay(), "description: quadcopter, maxVal: 0.875");
  EXPECT_EQ(classifier_->calls.load(), 2);
  EXPECT_EQ(app.framesShown(), 2u);
  // Vision branch never writes stick state.
  EXPECT_EQ(app.axes().get(Axis::LeftY), 0.0);
  EXPECT_GE(vehicle_->count(), before);
  app.shutdown();
}

TEST_F(TeleopAppFixture, ControllerDisconnectStopsAndReleasesEverything) {
  auto& app = makeApp();
  runInBackground(app);
  ASSERT_EQ(app.state(), AppState::Running);
  ASSERT_TRUE(vehicle_->waitCountAtLeast(4));

  controller_->disconnect();
  const std::size_t at_fault = vehicle_->count();
  joinRunner();

  EXPECT_EQ(rc_.load(), 1);
  EXPECT_EQ(app.state(), AppState::Stopped);
  EXPECT_TRUE(app.faulted());
  EXPECT_THAT(app.stopReason(), ::testing::HasSubstr("controller"));
  EXPECT_EQ(controller_->stops.load(), 1);
  EXPECT_EQ(camera_->stops.load(), 1);
  EXPECT_TRUE(display_->closed.load());
  EXPECT_EQ(vehicle_->disconnects.load(), 1);

  // Nothing reached the vehicle after the fault, including button presses.
  std::this_thread::sleep_for(30ms);
  controller_->emit(ButtonPressed{Button::Square});
  EXPECT_EQ(vehicle_->count(), at_fault);
}

TEST_F(TeleopAppFixture, CameraDisconnectIsFatal) {
  auto& app = makeApp();
  runInBackground(app);
  camera_->disconnect();
  joinRunner();

  EXPECT_EQ(rc_.load(), 1);
  EXPECT_THAT(app.stopReason(), ::testing::HasSubstr("camera"));
  EXPECT_TRUE(display_->closed.load());
}

TEST_F(TeleopAppFixture, VehicleLinkLossIsFatal) {
  auto& app = makeApp();
  runInBackground(app);
  ASSERT_TRUE(vehicle_->waitCountAtLeast(2));

  vehicle_->drop();
  joinRunner();

  EXPECT_EQ(rc_.load(), 1);
  EXPECT_THAT(app.stopReason(), ::testing::HasSubstr("vehicle"));
  EXPECT_EQ(controller_->stops.load(), 1);
}

TEST_F(TeleopAppFixture, VehicleSendFailureIsFatal) {
  auto& app = makeApp();
  runInBackground(app);
  ASSERT_TRUE(vehicle_->waitCountAtLeast(2));

  vehicle_->fail_send.store(true);
  joinRunner();

  EXPECT_EQ(rc_.load(), 1);
  EXPECT_THAT(app.stopReason(), ::testing::HasSubstr("fake link dropped"));
}

TEST_F(TeleopAppFixture, StopFlagEndsRunCleanly) {
  auto& app = makeApp();
  runInBackground(app);
  ASSERT_EQ(app.state(), AppState::Running);

  stop_.store(true);
  joinRunner();

  EXPECT_EQ(rc_.load(), 0);
  EXPECT_FALSE(app.faulted());
  EXPECT_EQ(app.state(), AppState::Stopped);
  EXPECT_EQ(camera_->stops.load(), 1);
  EXPECT_TRUE(display_->closed.load());
}

TEST_F(TeleopAppFixture, FailedStartReleasesWhatWasOpened) {
  camera_->fail_start = true;
  auto& app = makeApp();

  EXPECT_THROW(app.start(), DeviceError);
  EXPECT_EQ(app.state(), AppState::Stopped);
  EXPECT_EQ(controller_->stops.load(), 1);
  EXPECT_EQ(vehicle_->disconnects.load(), 1);
  EXPECT_EQ(vehicle_->count(), 0u);
}

TEST_F(TeleopAppFixture, RunReportsUnavailableVehicle) {
  vehicle_->fail_connect = true;
  auto& app = makeApp();
  EXPECT_EQ(app.run(stop_), 1);
  EXPECT_EQ(app.state(), AppState::Stopped);
  EXPECT_FALSE(controller_->started.load());
}

TEST_F(TeleopAppFixture, StoppedIsTerminal) {
  auto& app = makeApp();
  app.start();
  app.shutdown();
  EXPECT_THROW(app.start(), std::logic_error);
  EXPECT_EQ(app.state(), AppState::Stopped);
}

TEST(TeleopAppTest, RejectsMissingDevices) {
  TeleopDevices dev;
  dev.vehicle = std::make_unique<FakeVehicleLink>();
  EXPECT_THROW(TeleopApp(std::move(dev), TeleopSettings{}), std::invalid_argument);
}
